/**
 * @file builder.h
 * @brief Fluent builder for EmulatorConfig.
 *
 * Chainable setters, validation on build(). Every problem is reported,
 * not just the first one.
 *
 * Example:
 * @code
 *   auto result = ConfigBuilder()
 *       .with_seed(1234)
 *       .with_instructions_per_second(1000)
 *       .with_scale(12)
 *       .with_sprite_edge(SpriteEdge::Wrap)
 *       .build();
 *
 *   if (!result) {
 *       GR8_LOG_ERROR("CFG", "%s", result.error().message().c_str());
 *   }
 * @endcode
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <gr8/driver_config.h>
#include <gr8/error.h>
#include <gr8/exceptions.h>

#include <string>
#include <vector>

namespace gr8 {

class ConfigBuilder {
public:
    ConfigBuilder() = default;

    // ─────────────────────────────────────────────────────────────────────────
    // Interpreter
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Seed the random number generator and make runs reproducible.
     */
    ConfigBuilder& with_seed(uint64_t seed) noexcept {
        config_.interpreter.deterministic = true;
        config_.interpreter.rng_seed = seed;
        return *this;
    }

    ConfigBuilder& with_timer_rate(uint32_t hz) noexcept {
        config_.interpreter.timer_hz = hz;
        return *this;
    }

    ConfigBuilder& with_sprite_edge(SpriteEdge edge) noexcept {
        config_.interpreter.sprite_edge = edge;
        return *this;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Runner
    // ─────────────────────────────────────────────────────────────────────────

    ConfigBuilder& with_backend(pal::Backend backend) noexcept {
        config_.runner.backend = backend;
        return *this;
    }

    ConfigBuilder& with_instructions_per_second(uint32_t ips) noexcept {
        config_.runner.instructions_per_second = ips;
        return *this;
    }

    ConfigBuilder& with_frame_rate(uint32_t fps) noexcept {
        config_.runner.frame_rate = fps;
        return *this;
    }

    ConfigBuilder& with_scale(uint32_t scale) noexcept {
        config_.runner.window_scale = scale;
        return *this;
    }

    ConfigBuilder& with_colors(Rgb foreground, Rgb background) noexcept {
        config_.runner.foreground = foreground;
        config_.runner.background = background;
        return *this;
    }

    /**
     * @brief Stop after @p frames frames (0 runs until quit).
     */
    ConfigBuilder& with_frame_limit(uint64_t frames) noexcept {
        config_.runner.frame_limit = frames;
        return *this;
    }

    ConfigBuilder& with_fixed_timestep(bool enabled = true) noexcept {
        config_.runner.fixed_timestep = enabled;
        return *this;
    }

    ConfigBuilder& with_title(std::string title) {
        config_.runner.title = std::move(title);
        return *this;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Presets
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Headless, seeded, fixed-timestep run for tests.
     */
    ConfigBuilder& headless_test(uint64_t frames, uint64_t seed = 0) {
        config_.runner = RunnerConfig::headless(frames);
        config_.interpreter = InterpreterConfig::seeded(seed);
        return *this;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Build
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Validate and build configuration.
     *
     * @return The configuration, or ConfigValueInvalid listing every problem
     */
    [[nodiscard]] Result<EmulatorConfig> build() {
        errors_ = config_.interpreter.validate();
        for (auto& err : config_.runner.validate()) {
            errors_.push_back(std::move(err));
        }

        if (!errors_.empty()) {
            std::string msg = "Configuration validation failed:";
            for (const auto& err : errors_) {
                msg += "\n  - " + err;
            }
            return Err(Error(ErrorCode::ConfigValueInvalid, msg));
        }

        return Ok(config_);
    }

    /**
     * @throws ConfigException if validation fails
     */
    [[nodiscard]] EmulatorConfig build_or_throw() {
        auto result = build();
        if (!result.has_value()) {
            throw ConfigException(result.error().message());
        }
        return std::move(result).value();
    }

    /**
     * @brief Validation errors from the last build() call.
     */
    [[nodiscard]] const std::vector<std::string>& errors() const noexcept {
        return errors_;
    }

    [[nodiscard]] const EmulatorConfig& current_config() const noexcept {
        return config_;
    }

private:
    EmulatorConfig config_;
    std::vector<std::string> errors_;
};

} // namespace gr8
