// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 GR8 Contributors
//
// Platform Abstraction Layer - Headless Service Factory

#include "pal/headless.h"
#include "pal/platform.h"

namespace pal {
namespace headless {

Services createServices() {
    Services services;
    services.display = std::make_unique<Display>();
    services.clock = std::make_unique<Clock>();
    services.keyboard = std::make_unique<Keyboard>();
    return services;
}

} // namespace headless
} // namespace pal
