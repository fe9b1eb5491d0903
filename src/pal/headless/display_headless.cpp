// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 GR8 Contributors
//
// Platform Abstraction Layer - Headless Display

#include "pal/headless.h"

#include <cstring>

namespace pal {
namespace headless {

Status Display::open(const DisplayConfig& config) {
    if (open_) {
        return Status::AlreadyInitialized;
    }
    const uint32_t bpp = bytesPerPixel(config.format);
    if (config.width == 0 || config.height == 0 || config.scale == 0 || bpp == 0) {
        return Status::InvalidParameter;
    }

    // Rows padded to 4 bytes, like an SDL surface
    pitch_ = (config.width * bpp + 3) & ~3u;
    buffer_.assign(static_cast<size_t>(pitch_) * config.height, 0);
    config_ = config;
    present_count_ = 0;
    open_ = true;
    return Status::Ok;
}

void Display::close() {
    buffer_.clear();
    config_ = DisplayConfig{};
    pitch_ = 0;
    locked_ = false;
    open_ = false;
}

Status Display::setTitle(std::string_view title) {
    if (!open_) {
        return Status::NotInitialized;
    }
    config_.title.assign(title);
    return Status::Ok;
}

Status Display::lock(Surface& surface) {
    if (!open_) {
        return Status::NotInitialized;
    }
    if (locked_) {
        return Status::AlreadyLocked;
    }
    surface.pixels = buffer_.data();
    surface.pitch = pitch_;
    surface.width = config_.width;
    surface.height = config_.height;
    surface.format = config_.format;
    locked_ = true;
    return Status::Ok;
}

Status Display::present() {
    if (!open_) {
        return Status::NotInitialized;
    }
    if (locked_) {
        return Status::AlreadyLocked;
    }
    ++present_count_;
    return Status::Ok;
}

uint32_t Display::pixelAt(uint32_t x, uint32_t y) const {
    if (!open_ || x >= config_.width || y >= config_.height) {
        return 0;
    }
    const uint32_t bpp = bytesPerPixel(config_.format);
    const uint8_t* p = buffer_.data() + static_cast<size_t>(y) * pitch_ + x * bpp;

    switch (bpp) {
        case 2: {
            uint16_t v16 = 0;
            std::memcpy(&v16, p, sizeof(v16));
            return v16;
        }
        case 3:
            return (uint32_t{p[0]} << 16) | (uint32_t{p[1]} << 8) | p[2];
        case 4: {
            uint32_t v32 = 0;
            std::memcpy(&v32, p, sizeof(v32));
            return v32;
        }
        default:
            return 0;
    }
}

} // namespace headless
} // namespace pal
