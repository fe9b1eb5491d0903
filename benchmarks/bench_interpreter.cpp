// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 GR8 Contributors
//
// Interpreter and Codec Performance Benchmarks

#include <benchmark/benchmark.h>
#include "gr8/interpreter.h"
#include "gr8/opcode.h"
#include <initializer_list>
#include <vector>

namespace {

std::vector<uint8_t> program(std::initializer_list<uint16_t> words) {
    std::vector<uint8_t> bytes;
    for (uint16_t w : words) {
        bytes.push_back(static_cast<uint8_t>(w >> 8));
        bytes.push_back(static_cast<uint8_t>(w & 0xFF));
    }
    return bytes;
}

// ALU-only loop: no memory traffic beyond fetch
const std::vector<uint8_t> kArithLoop =
    program({0x7001, 0x8104, 0x8215, 0x8326, 0x1200});

// Random sprites all over the screen
const std::vector<uint8_t> kSpriteLoop =
    program({0xC0FF, 0xC13F, 0xC21F, 0xF029, 0xD125, 0x1200});

void run_program(benchmark::State& state, const std::vector<uint8_t>& rom) {
    gr8::Interpreter interp(gr8::InterpreterConfig::seeded(1));
    if (!interp.load(rom)) {
        state.SkipWithError("load failed");
        return;
    }

    for (auto _ : state) {
        auto status = interp.update();
        benchmark::DoNotOptimize(status);
    }
    state.SetItemsProcessed(state.iterations());
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Execution
// ═══════════════════════════════════════════════════════════════════════════

static void BM_UpdateArithmetic(benchmark::State& state) {
    run_program(state, kArithLoop);
}
BENCHMARK(BM_UpdateArithmetic);

static void BM_UpdateSprites(benchmark::State& state) {
    run_program(state, kSpriteLoop);
}
BENCHMARK(BM_UpdateSprites);

// One second of emulated time at the default 700 instructions/second
static void BM_EmulatedSecond(benchmark::State& state) {
    gr8::Interpreter interp(gr8::InterpreterConfig::seeded(1));
    if (!interp.load(kSpriteLoop)) {
        state.SkipWithError("load failed");
        return;
    }

    for (auto _ : state) {
        for (int frame = 0; frame < 60; ++frame) {
            interp.advance_clock_us(16666);
            for (int i = 0; i < 11; ++i) {
                benchmark::DoNotOptimize(interp.update());
            }
        }
    }
}
BENCHMARK(BM_EmulatedSecond);

static void BM_StateHash(benchmark::State& state) {
    gr8::Interpreter interp(gr8::InterpreterConfig::seeded(1));
    for (auto _ : state) {
        benchmark::DoNotOptimize(interp.state_hash());
    }
}
BENCHMARK(BM_StateHash);

// ═══════════════════════════════════════════════════════════════════════════
// Codec
// ═══════════════════════════════════════════════════════════════════════════

static void BM_DecodeAllWords(benchmark::State& state) {
    for (auto _ : state) {
        size_t decoded = 0;
        for (uint32_t word = 0; word <= 0xFFFF; ++word) {
            decoded += gr8::decode_word(static_cast<uint16_t>(word)).has_value() ? 1 : 0;
        }
        benchmark::DoNotOptimize(decoded);
    }
    state.SetItemsProcessed(state.iterations() * 65536);
}
BENCHMARK(BM_DecodeAllWords);

static void BM_DecodeProgram(benchmark::State& state) {
    const auto rom = program({0x00E0, 0x6000, 0x7001, 0xA200, 0xD015, 0x2210, 0x00EE, 0x1200});
    for (auto _ : state) {
        auto ops = gr8::decode_program(rom);
        benchmark::DoNotOptimize(ops);
    }
}
BENCHMARK(BM_DecodeProgram);
