// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 GR8 Contributors
//
// Platform Abstraction Layer - SDL2 Startup and Service Factory

#include "pal/platform.h"
#include <SDL.h>

namespace pal {
namespace sdl2 {

std::unique_ptr<IDisplay> createDisplay();
std::unique_ptr<IClock> createClock();
std::unique_ptr<IKeyboard> createKeyboard();

Status startup() {
    // Nearest-neighbour magnification keeps CHIP-8 pixels square
    SDL_SetHint(SDL_HINT_RENDER_SCALE_QUALITY, "0");

    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS | SDL_INIT_TIMER) != 0) {
        return Status::Unavailable;
    }
    return Status::Ok;
}

void teardown() {
    SDL_Quit();
}

Services createServices() {
    Services services;
    services.display = createDisplay();
    services.clock = createClock();
    services.keyboard = createKeyboard();
    return services;
}

} // namespace sdl2
} // namespace pal
