// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 GR8 Contributors
//
// Platform Abstraction Layer - Common Types

#pragma once

#include <cstdint>

namespace pal {

/// Outcome of a PAL call
enum class Status : uint8_t {
    Ok = 0,
    NotInitialized,      // Platform or service not opened yet
    AlreadyInitialized,
    InvalidParameter,
    Unavailable,         // Backend not compiled in, or the host refused it
    AlreadyLocked,
    DeviceError          // The backend library reported a failure
};

/// Pixel layouts a display surface can have
///
/// Multi-byte formats are packed native-endian words (SDL convention);
/// RGB888 is three bytes in R, G, B memory order.
enum class PixelFormat : uint8_t {
    Unknown = 0,
    RGB565,
    RGB888,
    XRGB8888,
    RGBA8888,
    BGRA8888
};

/// Host backends
enum class Backend : uint8_t {
    Auto = 0,   // Resolved by Platform::resolve()
    SDL2,
    Headless    // No host window; virtual time and injected keys
};

/// Locked view of a display surface
///
/// Valid between IDisplay::lock() and IDisplay::unlock(). The surface is
/// framebuffer-sized; scaling to the window happens at present().
struct Surface {
    void* pixels = nullptr;
    uint32_t pitch = 0;    // Bytes per row, at least width * bytesPerPixel
    uint32_t width = 0;
    uint32_t height = 0;
    PixelFormat format = PixelFormat::Unknown;
};

constexpr const char* toString(Status s) noexcept {
    switch (s) {
        case Status::Ok:                 return "Ok";
        case Status::NotInitialized:     return "NotInitialized";
        case Status::AlreadyInitialized: return "AlreadyInitialized";
        case Status::InvalidParameter:   return "InvalidParameter";
        case Status::Unavailable:        return "Unavailable";
        case Status::AlreadyLocked:      return "AlreadyLocked";
        case Status::DeviceError:        return "DeviceError";
    }
    return "Unknown";
}

constexpr const char* toString(PixelFormat fmt) noexcept {
    switch (fmt) {
        case PixelFormat::Unknown:  return "Unknown";
        case PixelFormat::RGB565:   return "RGB565";
        case PixelFormat::RGB888:   return "RGB888";
        case PixelFormat::XRGB8888: return "XRGB8888";
        case PixelFormat::RGBA8888: return "RGBA8888";
        case PixelFormat::BGRA8888: return "BGRA8888";
    }
    return "Unknown";
}

constexpr const char* toString(Backend backend) noexcept {
    switch (backend) {
        case Backend::Auto:     return "Auto";
        case Backend::SDL2:     return "SDL2";
        case Backend::Headless: return "Headless";
    }
    return "Unknown";
}

/// 0 for Unknown
constexpr uint32_t bytesPerPixel(PixelFormat fmt) noexcept {
    switch (fmt) {
        case PixelFormat::RGB565:   return 2;
        case PixelFormat::RGB888:   return 3;
        case PixelFormat::XRGB8888:
        case PixelFormat::RGBA8888:
        case PixelFormat::BGRA8888: return 4;
        case PixelFormat::Unknown:  break;
    }
    return 0;
}

constexpr bool ok(Status s) noexcept {
    return s == Status::Ok;
}

} // namespace pal
