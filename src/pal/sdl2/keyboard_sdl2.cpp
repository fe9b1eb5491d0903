// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 GR8 Contributors
//
// Platform Abstraction Layer - SDL2 Keyboard

#include "pal/keyboard.h"
#include <SDL.h>
#include <memory>

namespace pal {
namespace sdl2 {

namespace {

/// false for events the frame loop has no use for
bool translate(const SDL_Event& sdl, HostEvent& event) {
    switch (sdl.type) {
        case SDL_KEYDOWN:
            if (sdl.key.repeat != 0) {
                return false;
            }
            event = {HostEventType::KeyDown, static_cast<uint16_t>(sdl.key.keysym.scancode)};
            return true;

        case SDL_KEYUP:
            event = {HostEventType::KeyUp, static_cast<uint16_t>(sdl.key.keysym.scancode)};
            return true;

        case SDL_QUIT:
            event = {HostEventType::Quit, 0};
            return true;

        case SDL_WINDOWEVENT:
            switch (sdl.window.event) {
                case SDL_WINDOWEVENT_CLOSE:
                    event = {HostEventType::Quit, 0};
                    return true;
                case SDL_WINDOWEVENT_FOCUS_LOST:
                    event = {HostEventType::FocusLost, 0};
                    return true;
                case SDL_WINDOWEVENT_FOCUS_GAINED:
                    event = {HostEventType::FocusGained, 0};
                    return true;
                default:
                    return false;
            }

        default:
            return false;
    }
}

} // anonymous namespace

class Keyboard : public IKeyboard {
public:
    size_t poll(std::span<HostEvent> out) override {
        size_t count = 0;
        SDL_Event sdl;
        while (count < out.size() && SDL_PollEvent(&sdl)) {
            if (translate(sdl, out[count])) {
                ++count;
            }
        }
        return count;
    }
};

std::unique_ptr<IKeyboard> createKeyboard() {
    return std::make_unique<Keyboard>();
}

} // namespace sdl2
} // namespace pal
