// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 GR8 Contributors
//
// Platform Abstraction Layer - SDL2 Clock

#include "pal/clock.h"
#include <SDL.h>
#include <memory>

namespace pal {
namespace sdl2 {

/// Performance-counter clock, zeroed at construction
class Clock : public IClock {
public:
    Clock()
        : start_(SDL_GetPerformanceCounter())
        , frequency_(SDL_GetPerformanceFrequency())
    {
        if (frequency_ == 0) {
            frequency_ = 1000000;
        }
    }

    uint64_t nowUs() const override {
        const uint64_t elapsed = SDL_GetPerformanceCounter() - start_;
        // Split so elapsed * 1e6 cannot overflow on long sessions
        const uint64_t seconds = elapsed / frequency_;
        const uint64_t rest = elapsed % frequency_;
        return seconds * 1000000ULL + rest * 1000000ULL / frequency_;
    }

    void sleepUs(uint64_t us) override {
        // SDL_Delay has millisecond resolution; round up
        if (us > 0) {
            SDL_Delay(static_cast<Uint32>((us + 999) / 1000));
        }
    }

private:
    uint64_t start_;
    uint64_t frequency_;
};

std::unique_ptr<IClock> createClock() {
    return std::make_unique<Clock>();
}

} // namespace sdl2
} // namespace pal
