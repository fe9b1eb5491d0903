// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 GR8 Contributors
//
// Platform Abstraction Layer - Backend Selection and Service Factory

#pragma once

#include "pal/clock.h"
#include "pal/display.h"
#include "pal/keyboard.h"
#include "pal/types.h"

#include <memory>

namespace pal {

/// The three services a frame loop needs, from one backend
struct Services {
    std::unique_ptr<IDisplay> display;
    std::unique_ptr<IClock> clock;
    std::unique_ptr<IKeyboard> keyboard;

    explicit operator bool() const noexcept {
        return display && clock && keyboard;
    }
};

/// Process-wide backend state
///
/// One backend is active at a time. Services must be destroyed before
/// shutdown().
class Platform {
public:
    /// @return Ok, AlreadyInitialized, Unavailable (not compiled in, or the
    ///         host library failed to start)
    static Status initialize(Backend backend);

    static void shutdown();

    static bool isInitialized();

    /// Auto while not initialized
    static Backend activeBackend();

    /// Whether @p backend was compiled in; Auto always is
    static bool isAvailable(Backend backend);

    /// Best compiled-in backend: SDL2, then Headless
    static Backend preferredBackend();

    /// Auto becomes preferredBackend(); anything else is returned as is
    static Backend resolve(Backend backend);

    /// Unopened services from the active backend; empty if not initialized
    static Services createServices();
};

} // namespace pal
