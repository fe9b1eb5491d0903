/**
 * @file config.h
 * @brief Interpreter configuration.
 *
 * Plain aggregates with presets. Validation lives next to the data so the
 * builder (builder.h) and constructors that take a config directly share
 * one rule set. Host-side settings live in driver_config.h.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <gr8/layout.h>

#include <cstdint>
#include <string>
#include <vector>

namespace gr8 {

/**
 * @brief What happens to sprite pixels past the right/bottom edge.
 *
 * The start coordinate always wraps (VX mod 64, VY mod 32).
 */
enum class SpriteEdge : uint8_t {
    Clip,  ///< Overflowing pixels are dropped
    Wrap   ///< Overflowing pixels reappear on the opposite edge
};

[[nodiscard]] constexpr const char* to_string(SpriteEdge edge) noexcept {
    switch (edge) {
        case SpriteEdge::Clip: return "Clip";
        case SpriteEdge::Wrap: return "Wrap";
    }
    return "Unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// InterpreterConfig
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Knobs of the virtual machine itself.
 */
struct InterpreterConfig {
    bool deterministic = false;              ///< Seed CXKK from rng_seed
    uint64_t rng_seed = 0;                   ///< Used only when deterministic
    uint32_t timer_hz = layout::kDefaultTimerHz;
    SpriteEdge sprite_edge = SpriteEdge::Clip;

    [[nodiscard]] static InterpreterConfig defaults() noexcept {
        return InterpreterConfig{};
    }

    /**
     * @brief Reproducible configuration for tests and replays.
     */
    [[nodiscard]] static InterpreterConfig seeded(uint64_t seed) noexcept {
        InterpreterConfig config;
        config.deterministic = true;
        config.rng_seed = seed;
        return config;
    }

    /**
     * @brief Human-readable list of problems; empty when valid.
     */
    [[nodiscard]] std::vector<std::string> validate() const;
};

} // namespace gr8
