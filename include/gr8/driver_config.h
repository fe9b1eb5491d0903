/**
 * @file driver_config.h
 * @brief Runner pacing, presentation and backend selection.
 *
 * Kept out of config.h so the interpreter core has no dependency on the
 * platform layer.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <gr8/config.h>
#include <pal/types.h>

#include <cstdint>
#include <string>
#include <vector>

namespace gr8 {

// ─────────────────────────────────────────────────────────────────────────────
// RunnerConfig
// ─────────────────────────────────────────────────────────────────────────────

struct Rgb {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    bool operator==(const Rgb&) const = default;
};

/**
 * @brief Host-side pacing and presentation.
 */
struct RunnerConfig {
    pal::Backend backend = pal::Backend::Auto;  ///< Auto selects the best available
    uint32_t instructions_per_second = 700;
    uint32_t frame_rate = 60;
    uint32_t window_scale = 10;
    Rgb foreground{0xFF, 0xFF, 0xFF};
    Rgb background{0x00, 0x00, 0x00};
    uint64_t frame_limit = 0;                   ///< 0 runs until quit
    bool fixed_timestep = false;                ///< Advance exactly one frame period per frame
    std::string title = "GR8";

    [[nodiscard]] static RunnerConfig defaults() {
        return RunnerConfig{};
    }

    /**
     * @brief Headless, fixed-timestep run of @p frames frames.
     */
    [[nodiscard]] static RunnerConfig headless(uint64_t frames) {
        RunnerConfig config;
        config.backend = pal::Backend::Headless;
        config.frame_limit = frames;
        config.fixed_timestep = true;
        config.window_scale = 1;
        return config;
    }

    /**
     * @brief Instructions executed per frame, at least one.
     */
    [[nodiscard]] uint32_t instructions_per_frame() const noexcept {
        if (frame_rate == 0) return 1;
        const uint32_t per_frame = instructions_per_second / frame_rate;
        return per_frame == 0 ? 1 : per_frame;
    }

    /**
     * @brief Frame period in microseconds.
     */
    [[nodiscard]] uint64_t frame_period_us() const noexcept {
        return frame_rate == 0 ? 0 : 1'000'000ULL / frame_rate;
    }

    [[nodiscard]] std::vector<std::string> validate() const;
};

/**
 * @brief Everything the CLI hands to the Runner.
 */
struct EmulatorConfig {
    InterpreterConfig interpreter;
    RunnerConfig runner;
};

} // namespace gr8
