// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 GR8 Contributors
//
// Display and Renderer Performance Benchmarks

#include <benchmark/benchmark.h>
#include "gr8/renderer.h"
#include "pal/platform.h"
#include <array>
#include <vector>

namespace {

std::array<uint8_t, gr8::layout::kDisplaySize> checkerboard() {
    std::array<uint8_t, gr8::layout::kDisplaySize> display{};
    for (size_t i = 0; i < display.size(); ++i) {
        display[i] = static_cast<uint8_t>(((i / gr8::layout::kDisplayWidth) + i) & 1);
    }
    return display;
}

const gr8::FrameRenderer kRenderer({0xFF, 0xFF, 0xFF}, {0x00, 0x00, 0x00});

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Benchmark Fixtures
// ═══════════════════════════════════════════════════════════════════════════

class PALBenchmark : public benchmark::Fixture {
public:
    void SetUp(const benchmark::State&) override {
        pal::Platform::shutdown();
        // Headless keeps numbers independent of the host compositor
        pal::Platform::initialize(pal::Backend::Headless);
        services_ = pal::Platform::createServices();
        services_.display->open(pal::DisplayConfig{});
    }

    void TearDown(const benchmark::State&) override {
        services_ = pal::Services{};
        pal::Platform::shutdown();
    }

protected:
    pal::Services services_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Services
// ═══════════════════════════════════════════════════════════════════════════

BENCHMARK_F(PALBenchmark, BM_ClockNow)(benchmark::State& state) {
    for (auto _ : state) {
        benchmark::DoNotOptimize(services_.clock->nowUs());
    }
}

BENCHMARK_F(PALBenchmark, BM_DisplayLockUnlock)(benchmark::State& state) {
    pal::Surface surface;
    for (auto _ : state) {
        services_.display->lock(surface);
        benchmark::DoNotOptimize(surface.pixels);
        services_.display->unlock();
    }
}

BENCHMARK_F(PALBenchmark, BM_KeyboardPollEmpty)(benchmark::State& state) {
    std::array<pal::HostEvent, 32> events;
    for (auto _ : state) {
        benchmark::DoNotOptimize(services_.keyboard->poll(events));
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Renderer
// ═══════════════════════════════════════════════════════════════════════════

// Lock, convert the framebuffer, unlock and present: the per-frame cost
BENCHMARK_F(PALBenchmark, BM_RenderAndPresent)(benchmark::State& state) {
    const auto display = checkerboard();
    for (auto _ : state) {
        auto drawn = kRenderer.render(display, *services_.display);
        benchmark::DoNotOptimize(drawn);
        services_.display->present();
    }
    state.SetBytesProcessed(state.iterations() * int64_t(gr8::layout::kDisplaySize) * 4);
}

// Blit into a caller-owned surface at 64x32 times the scale argument
static void BM_BlitScaled(benchmark::State& state) {
    const auto scale = static_cast<uint32_t>(state.range(0));
    const uint32_t width = gr8::layout::kDisplayWidth * scale;
    const uint32_t height = gr8::layout::kDisplayHeight * scale;
    std::vector<uint8_t> buffer(size_t(width) * height * 4);
    const pal::Surface surface{buffer.data(), width * 4, width, height,
                               pal::PixelFormat::XRGB8888};

    const auto display = checkerboard();
    for (auto _ : state) {
        auto result = kRenderer.blit(display, surface);
        benchmark::DoNotOptimize(result);
    }
    state.SetBytesProcessed(state.iterations() * int64_t(buffer.size()));
}
BENCHMARK(BM_BlitScaled)->Arg(1)->Arg(10)->Arg(20);
