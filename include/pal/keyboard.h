// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 GR8 Contributors
//
// Platform Abstraction Layer - Keyboard Interface

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace pal {

enum class HostEventType : uint8_t {
    KeyDown,
    KeyUp,
    Quit,         // Window closed or the host asked the app to exit
    FocusLost,    // Key-up events stop arriving until FocusGained
    FocusGained
};

/// Host input relevant to a keypad machine
///
/// scancode is the USB HID usage (SDL_Scancode numbering) for key events
/// and 0 otherwise. Auto-repeat is filtered out by the backend, so every
/// KeyDown is a physical press.
struct HostEvent {
    HostEventType type = HostEventType::KeyDown;
    uint16_t scancode = 0;

    bool operator==(const HostEvent&) const = default;
};

class IKeyboard {
public:
    virtual ~IKeyboard() = default;

    /// Move pending events into @p out in arrival order
    /// @return Number written; fewer than out.size() means the queue is empty
    virtual size_t poll(std::span<HostEvent> out) = 0;
};

constexpr const char* toString(HostEventType type) noexcept {
    switch (type) {
        case HostEventType::KeyDown:     return "KeyDown";
        case HostEventType::KeyUp:       return "KeyUp";
        case HostEventType::Quit:        return "Quit";
        case HostEventType::FocusLost:   return "FocusLost";
        case HostEventType::FocusGained: return "FocusGained";
    }
    return "Unknown";
}

} // namespace pal
