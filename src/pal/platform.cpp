// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 GR8 Contributors
//
// Platform Abstraction Layer - Backend Selection

#include "pal/platform.h"

#include <atomic>

namespace pal {

namespace headless {
Services createServices();
}

#if defined(PAL_HAS_SDL2)
namespace sdl2 {
Status startup();
void teardown();
Services createServices();
}
#endif

namespace {

std::atomic<bool> g_initialized{false};
std::atomic<Backend> g_backend{Backend::Auto};

} // anonymous namespace

bool Platform::isAvailable(Backend backend) {
    switch (backend) {
        case Backend::Auto:
        case Backend::Headless:
            return true;
        case Backend::SDL2:
#if defined(PAL_HAS_SDL2)
            return true;
#else
            return false;
#endif
    }
    return false;
}

Backend Platform::preferredBackend() {
    return isAvailable(Backend::SDL2) ? Backend::SDL2 : Backend::Headless;
}

Backend Platform::resolve(Backend backend) {
    return backend == Backend::Auto ? preferredBackend() : backend;
}

Status Platform::initialize(Backend backend) {
    if (g_initialized.load()) {
        return Status::AlreadyInitialized;
    }

    const Backend chosen = resolve(backend);
    if (!isAvailable(chosen)) {
        return Status::Unavailable;
    }

#if defined(PAL_HAS_SDL2)
    if (chosen == Backend::SDL2) {
        const Status started = sdl2::startup();
        if (!ok(started)) {
            return started;
        }
    }
#endif

    g_backend.store(chosen);
    g_initialized.store(true);
    return Status::Ok;
}

void Platform::shutdown() {
    if (!g_initialized.exchange(false)) {
        return;
    }
#if defined(PAL_HAS_SDL2)
    if (g_backend.load() == Backend::SDL2) {
        sdl2::teardown();
    }
#endif
    g_backend.store(Backend::Auto);
}

bool Platform::isInitialized() {
    return g_initialized.load();
}

Backend Platform::activeBackend() {
    return g_backend.load();
}

Services Platform::createServices() {
    if (!g_initialized.load()) {
        return {};
    }
    switch (g_backend.load()) {
        case Backend::Headless:
            return headless::createServices();
#if defined(PAL_HAS_SDL2)
        case Backend::SDL2:
            return sdl2::createServices();
#endif
        default:
            return {};
    }
}

} // namespace pal
