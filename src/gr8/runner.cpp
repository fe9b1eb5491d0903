/**
 * @file runner.cpp
 * @brief Host loop driving an Interpreter through the PAL.
 *
 * @copyright GPL-2.0-or-later
 */

#include "gr8/runner.h"

#include "gr8/exceptions.h"
#include "gr8/logging.h"

#include <array>

namespace gr8 {

namespace {

constexpr uint32_t kEventBatch = 32;

Error service_error(const char* what, pal::Status status) {
    return GR8_ERROR(ErrorCode::BackendUnavailable, "%s failed: %s",
                     what, pal::toString(status));
}

} // namespace

Runner::Runner(EmulatorConfig config, KeyMap keymap)
    : config_(std::move(config.runner))
    , interpreter_(config.interpreter)
    , keymap_(keymap)
    , renderer_(config_.foreground, config_.background)
{
    const auto problems = config_.validate();
    if (!problems.empty()) {
        throw ConfigException("runner", problems.front());
    }
}

Runner::~Runner() {
    close();
}

// ─────────────────────────────────────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────────────────────────────────────

Result<void> Runner::open() {
    GR8_CHECK(!is_open(), ErrorCode::InvalidState, "runner is already open");

    const pal::Backend wanted = pal::Platform::resolve(config_.backend);
    if (!pal::Platform::isAvailable(wanted)) {
        return Err(GR8_ERROR(ErrorCode::BackendUnavailable,
                             "backend %s is not compiled in", pal::toString(wanted)));
    }

    if (pal::Platform::isInitialized()) {
        if (pal::Platform::activeBackend() != wanted) {
            return Err(GR8_ERROR(ErrorCode::InvalidState,
                                 "platform already running backend %s",
                                 pal::toString(pal::Platform::activeBackend())));
        }
        owns_platform_ = false;
    } else {
        const pal::Status init = pal::Platform::initialize(wanted);
        if (!pal::ok(init)) {
            return Err(service_error("platform initialization", init));
        }
        owns_platform_ = true;
    }
    backend_ = wanted;

    // Services go straight into the member so close() tears down whatever
    // was created before the platform itself.
    services_ = pal::Platform::createServices();
    if (!services_) {
        close();
        return make_error(ErrorCode::BackendUnavailable, "platform returned no services");
    }

    pal::DisplayConfig display_config;
    display_config.width = layout::kDisplayWidth;
    display_config.height = layout::kDisplayHeight;
    display_config.scale = config_.window_scale;
    display_config.format = pal::PixelFormat::XRGB8888;
    display_config.title = config_.title;

    const pal::Status shown = services_.display->open(display_config);
    if (!pal::ok(shown)) {
        close();
        return Err(service_error("display", shown));
    }

    last_tick_us_ = services_.clock->nowUs();
    frames_ = 0;
    instructions_ = 0;
    stop_reason_ = StopReason::None;
    force_redraw_ = true;
    pressed_this_frame_ = 0;
    release_after_frame_ = 0;

    GR8_LOG_INFO("RUN", "opened %ux%u display at x%u on %s backend, %u instructions/frame",
                 static_cast<unsigned>(layout::kDisplayWidth),
                 static_cast<unsigned>(layout::kDisplayHeight),
                 config_.window_scale, pal::toString(backend_),
                 config_.instructions_per_frame());
    return Ok();
}

void Runner::close() noexcept {
    services_.keyboard.reset();
    services_.clock.reset();
    services_.display.reset();

    if (owns_platform_) {
        pal::Platform::shutdown();
        owns_platform_ = false;
    }
    backend_ = pal::Backend::Auto;
}

// ─────────────────────────────────────────────────────────────────────────────
// Frame Loop
// ─────────────────────────────────────────────────────────────────────────────

void Runner::poll_input() {
    std::array<pal::HostEvent, kEventBatch> events;

    for (;;) {
        const size_t count = services_.keyboard->poll(events);
        for (size_t i = 0; i < count; ++i) {
            const pal::HostEvent& event = events[i];
            switch (event.type) {
                case pal::HostEventType::KeyDown:
                    if (keymap_.is_quit(event.scancode)) {
                        stop_reason_ = StopReason::QuitKey;
                    } else if (const auto key = keymap_.lookup(event.scancode)) {
                        const auto bit = static_cast<uint16_t>(1u << *key);
                        interpreter_.set_key(*key, true);
                        pressed_this_frame_ |= bit;
                        release_after_frame_ &= static_cast<uint16_t>(~bit);
                    }
                    break;

                case pal::HostEventType::KeyUp:
                    if (const auto key = keymap_.lookup(event.scancode)) {
                        const auto bit = static_cast<uint16_t>(1u << *key);
                        if (pressed_this_frame_ & bit) {
                            release_after_frame_ |= bit;
                        } else {
                            interpreter_.set_key(*key, false);
                        }
                    }
                    break;

                case pal::HostEventType::Quit:
                    stop_reason_ = StopReason::WindowClosed;
                    break;

                case pal::HostEventType::FocusLost: {
                    // Key-up events are lost while unfocused
                    const Interpreter::Keys released{};
                    interpreter_.set_keys(released);
                    pressed_this_frame_ = 0;
                    release_after_frame_ = 0;
                    break;
                }

                case pal::HostEventType::FocusGained:
                    force_redraw_ = true;
                    break;
            }
        }
        if (count < events.size()) {
            break;
        }
    }
}

void Runner::release_taps() {
    for (size_t k = 0; k < layout::kKeyCount; ++k) {
        if (release_after_frame_ & (1u << k)) {
            interpreter_.set_key(k, false);
        }
    }
    pressed_this_frame_ = 0;
    release_after_frame_ = 0;
}

Result<bool> Runner::run_frame() {
    GR8_CHECK(is_open(), ErrorCode::InvalidState, "runner is not open");

    if (stop_reason_ != StopReason::None) {
        return false;
    }

    const uint64_t frame_start = services_.clock->nowUs();
    poll_input();
    if (stop_reason_ != StopReason::None) {
        GR8_LOG_INFO("RUN", "stopping: %s", to_string(stop_reason_));
        return false;
    }

    const uint64_t period = config_.frame_period_us();
    const uint64_t elapsed = config_.fixed_timestep ? period : frame_start - last_tick_us_;
    last_tick_us_ = frame_start;
    interpreter_.advance_clock_us(elapsed);

    const uint32_t budget = config_.instructions_per_frame();
    for (uint32_t i = 0; i < budget; ++i) {
        auto step = interpreter_.update();
        if (!step) {
            GR8_LOG_ERROR("RUN", "execution stopped after %llu instructions: %s",
                          static_cast<unsigned long long>(instructions_),
                          step.error().format().c_str());
            return Err(std::move(step).error());
        }
        ++instructions_;
    }
    release_taps();

    if (interpreter_.take_redraw() || force_redraw_) {
        auto drawn = renderer_.render(interpreter_.display(), *services_.display);
        if (!drawn) {
            GR8_LOG_ERROR("RUN", "%s", drawn.error().format().c_str());
            return Err(std::move(drawn).error());
        }
        force_redraw_ = false;
    }

    const pal::Status presented = services_.display->present();
    if (!pal::ok(presented)) {
        GR8_LOG_ERROR("RUN", "present failed: %s", pal::toString(presented));
        return Err(GR8_ERROR(ErrorCode::InvalidState, "present failed: %s",
                             pal::toString(presented)));
    }

    ++frames_;
    if (config_.frame_limit != 0 && frames_ >= config_.frame_limit) {
        stop_reason_ = StopReason::FrameLimit;
        return false;
    }

    const uint64_t spent = services_.clock->nowUs() - frame_start;
    if (spent < period) {
        services_.clock->sleepUs(period - spent);
    }
    return true;
}

Result<RunSummary> Runner::run() {
    if (!is_open()) {
        auto opened = open();
        if (!opened) {
            GR8_LOG_ERROR("RUN", "%s", opened.error().format().c_str());
            return Err(std::move(opened).error());
        }
    }

    for (;;) {
        auto more = run_frame();
        if (!more) {
            return Err(std::move(more).error());
        }
        if (!*more) {
            break;
        }
    }

    const RunSummary result = summary();
    GR8_LOG_INFO("RUN", "%llu frames, %llu instructions, stop reason %s",
                 static_cast<unsigned long long>(result.frames),
                 static_cast<unsigned long long>(result.instructions),
                 to_string(result.reason));
    return result;
}

RunSummary Runner::summary() const noexcept {
    RunSummary result;
    result.frames = frames_;
    result.instructions = instructions_;
    result.reason = stop_reason_;
    result.state_hash = interpreter_.state_hash();
    return result;
}

} // namespace gr8
