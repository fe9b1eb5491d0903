// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 GR8 Contributors
//
// Platform Abstraction Layer - Headless Backend
//
// Concrete headless services, exposed so tests and batch drivers can
// reach their hooks (captured pixels, virtual time, injected keys)
// through a downcast of the factory-created interfaces.

#pragma once

#include "pal/clock.h"
#include "pal/display.h"
#include "pal/keyboard.h"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <span>
#include <string>
#include <vector>

namespace pal {
namespace headless {

/// Display backed by a plain buffer
class Display : public IDisplay {
public:
    Display() = default;
    ~Display() override { close(); }

    Status open(const DisplayConfig& config) override;
    void close() override;
    bool isOpen() const override { return open_; }

    Status setTitle(std::string_view title) override;

    Status lock(Surface& surface) override;
    void unlock() override { locked_ = false; }
    bool isLocked() const override { return locked_; }

    Status present() override;

    // ═══════════════════════════════════════════════════════════════════════
    // Inspection
    // ═══════════════════════════════════════════════════════════════════════

    uint64_t presentCount() const { return present_count_; }
    const std::string& title() const { return config_.title; }
    uint32_t width() const { return config_.width; }
    uint32_t height() const { return config_.height; }
    uint32_t scale() const { return config_.scale; }
    PixelFormat format() const { return config_.format; }
    uint32_t pitch() const { return pitch_; }

    /// Window size the surface would be shown at
    uint32_t windowWidth() const { return config_.width * config_.scale; }
    uint32_t windowHeight() const { return config_.height * config_.scale; }

    std::span<const uint8_t> pixels() const { return buffer_; }

    /// Native pixel value at (x, y); RGB888 reads as 0x00RRGGBB
    uint32_t pixelAt(uint32_t x, uint32_t y) const;

private:
    DisplayConfig config_;
    bool open_ = false;
    bool locked_ = false;
    uint32_t pitch_ = 0;
    std::vector<uint8_t> buffer_;
    uint64_t present_count_ = 0;
};

/// Virtual clock
///
/// Time stands still unless moved with setUs()/advanceUs(), or unless
/// auto-advance lets sleepUs() move it.
class Clock : public IClock {
public:
    uint64_t nowUs() const override { return now_us_; }
    void sleepUs(uint64_t us) override;

    void setUs(uint64_t us) { now_us_ = us; }
    void advanceUs(uint64_t us) { now_us_ += us; }
    void advanceMs(uint64_t ms) { now_us_ += ms * 1000; }

    void setAutoAdvance(bool enable) { auto_advance_ = enable; }
    bool autoAdvance() const { return auto_advance_; }

private:
    uint64_t now_us_ = 0;
    bool auto_advance_ = false;
};

/// Injected key and window events
///
/// Injection may happen from any thread; poll() runs on the frame loop.
class Keyboard : public IKeyboard {
public:
    size_t poll(std::span<HostEvent> out) override;

    void push(const HostEvent& event);
    void press(uint16_t scancode) { push({HostEventType::KeyDown, scancode}); }
    void release(uint16_t scancode) { push({HostEventType::KeyUp, scancode}); }

    /// press() then release(), delivered in the same poll
    void tap(uint16_t scancode);

    void requestQuit() { push({HostEventType::Quit, 0}); }
    void loseFocus() { push({HostEventType::FocusLost, 0}); }
    void gainFocus() { push({HostEventType::FocusGained, 0}); }

    size_t pending() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::deque<HostEvent> queue_;
};

} // namespace headless
} // namespace pal
