/**
 * @file runner.h
 * @brief Host loop: input, pacing, rendering.
 *
 * A Runner owns one Interpreter and the PAL services it draws to. Each
 * frame it:
 *   1. polls host input and maps it onto the keypad; a key pressed and
 *      released within one frame stays down until that frame's
 *      instructions have run, so short taps are never lost,
 *   2. advances the interpreter clock by the host time since the last
 *      frame (or exactly one frame period with fixed_timestep),
 *   3. executes instructions_per_second / frame_rate instructions,
 *   4. renders the framebuffer if it changed and presents,
 *   5. sleeps out the rest of the frame period.
 *
 * Execution errors stop the run and are returned unchanged.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <gr8/driver_config.h>
#include <gr8/error.h>
#include <gr8/interpreter.h>
#include <gr8/keymap.h>
#include <gr8/renderer.h>
#include <pal/platform.h>

#include <cstdint>
#include <memory>
#include <span>

namespace gr8 {

enum class StopReason : uint8_t {
    None,        ///< Still running
    FrameLimit,  ///< RunnerConfig::frame_limit frames completed
    QuitKey,     ///< The keymap's quit key was pressed
    WindowClosed
};

[[nodiscard]] constexpr const char* to_string(StopReason reason) noexcept {
    switch (reason) {
        case StopReason::None:         return "None";
        case StopReason::FrameLimit:   return "FrameLimit";
        case StopReason::QuitKey:      return "QuitKey";
        case StopReason::WindowClosed: return "WindowClosed";
    }
    return "Unknown";
}

struct RunSummary {
    uint64_t frames = 0;
    uint64_t instructions = 0;
    StopReason reason = StopReason::None;
    uint64_t state_hash = 0;
};

class Runner {
public:
    /**
     * @throws ConfigException if either half of @p config fails validation
     */
    explicit Runner(EmulatorConfig config, KeyMap keymap = KeyMap::defaults());
    ~Runner();

    Runner(const Runner&) = delete;
    Runner& operator=(const Runner&) = delete;
    Runner(Runner&&) = delete;
    Runner& operator=(Runner&&) = delete;

    /**
     * @brief Reset the interpreter and load @p rom.
     */
    [[nodiscard]] Result<void> load(std::span<const uint8_t> rom) {
        return interpreter_.load(rom);
    }

    /**
     * @brief Initialize the platform and open a 64x32 display surface
     * magnified by window_scale, plus the clock and keyboard.
     *
     * Backend::Auto picks pal::Platform::preferredBackend(). If the
     * platform is already initialized with the same backend it is reused
     * and left running on close().
     *
     * @return BackendUnavailable if the backend is not compiled in or any
     *         service fails to come up; InvalidState if already open or the
     *         platform runs a different backend
     */
    [[nodiscard]] Result<void> open();

    /// Release services (and the platform, if open() initialized it)
    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return static_cast<bool>(services_); }

    /**
     * @brief Run one frame.
     * @return true to keep going, false once a stop condition was reached
     */
    [[nodiscard]] Result<bool> run_frame();

    /**
     * @brief open() if needed, then run frames until a stop condition.
     */
    [[nodiscard]] Result<RunSummary> run();

    [[nodiscard]] RunSummary summary() const noexcept;

    // ─────────────────────────────────────────────────────────────────────────
    // Access
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] Interpreter& interpreter() noexcept { return interpreter_; }
    [[nodiscard]] const Interpreter& interpreter() const noexcept { return interpreter_; }
    [[nodiscard]] KeyMap& keymap() noexcept { return keymap_; }
    [[nodiscard]] const RunnerConfig& config() const noexcept { return config_; }
    [[nodiscard]] pal::Backend backend() const noexcept { return backend_; }

    /// PAL services; null until open()
    [[nodiscard]] pal::IDisplay* display() noexcept { return services_.display.get(); }
    [[nodiscard]] pal::IClock* clock() noexcept { return services_.clock.get(); }
    [[nodiscard]] pal::IKeyboard* keyboard() noexcept { return services_.keyboard.get(); }

    [[nodiscard]] uint64_t frames() const noexcept { return frames_; }
    [[nodiscard]] uint64_t instructions() const noexcept { return instructions_; }
    [[nodiscard]] StopReason stop_reason() const noexcept { return stop_reason_; }

private:
    void poll_input();
    void release_taps();

    RunnerConfig config_;
    Interpreter interpreter_;
    KeyMap keymap_;
    FrameRenderer renderer_;

    pal::Backend backend_ = pal::Backend::Auto;
    bool owns_platform_ = false;
    pal::Services services_;

    // Keypad bitmasks for the frame being built
    uint16_t pressed_this_frame_ = 0;
    uint16_t release_after_frame_ = 0;

    uint64_t last_tick_us_ = 0;
    uint64_t frames_ = 0;
    uint64_t instructions_ = 0;
    StopReason stop_reason_ = StopReason::None;
    bool force_redraw_ = true;
};

} // namespace gr8
