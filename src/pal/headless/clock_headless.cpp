// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 GR8 Contributors
//
// Platform Abstraction Layer - Headless Clock

#include "pal/headless.h"

namespace pal {
namespace headless {

void Clock::sleepUs(uint64_t us) {
    if (auto_advance_) {
        now_us_ += us;
    }
}

} // namespace headless
} // namespace pal
