// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 GR8 Contributors
//
// Platform Abstraction Layer - Host Clock Interface

#pragma once

#include <cstdint>

namespace pal {

/// Monotonic host time for frame pacing
///
/// The interpreter never reads this clock. The runner measures elapsed
/// time with it and forwards that to Interpreter::advance_clock_us().
class IClock {
public:
    virtual ~IClock() = default;

    /// Microseconds since the clock was created
    virtual uint64_t nowUs() const = 0;

    /// Block for at least us microseconds (headless: virtual)
    virtual void sleepUs(uint64_t us) = 0;
};

} // namespace pal
