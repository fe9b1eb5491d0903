// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 GR8 Contributors
//
// Platform Abstraction Layer - Display Interface

#pragma once

#include "pal/types.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace pal {

/// Surface geometry and window presentation
///
/// The surface is width x height pixels; the host window shows it
/// magnified by scale in both directions.
struct DisplayConfig {
    uint32_t width = 64;
    uint32_t height = 32;
    uint32_t scale = 10;
    PixelFormat format = PixelFormat::XRGB8888;
    std::string title = "GR8";
};

/// A window presenting one fixed-size software surface
///
/// Per frame: lock(), write rows, unlock(), present(). present() may be
/// called without a new lock to show the previous contents again.
class IDisplay {
public:
    virtual ~IDisplay() = default;

    /// @return Ok, AlreadyInitialized, InvalidParameter (zero size or
    ///         scale, Unknown format), DeviceError
    virtual Status open(const DisplayConfig& config) = 0;

    /// Safe to call when not open
    virtual void close() = 0;

    virtual bool isOpen() const = 0;

    /// @return Ok, NotInitialized
    virtual Status setTitle(std::string_view title) = 0;

    /// @return Ok, NotInitialized, AlreadyLocked, DeviceError
    virtual Status lock(Surface& surface) = 0;

    virtual void unlock() = 0;

    virtual bool isLocked() const = 0;

    /// @return Ok, NotInitialized, AlreadyLocked (surface still held),
    ///         DeviceError
    virtual Status present() = 0;
};

} // namespace pal
