/**
 * @file renderer.cpp
 * @brief Framebuffer to software surface blitter.
 *
 * @copyright GPL-2.0-or-later
 */

#include "gr8/renderer.h"

#include <cstring>

namespace gr8 {

namespace {

void store_pixel(uint8_t* dst, uint32_t value, uint32_t bpp) noexcept {
    switch (bpp) {
        case 2: {
            const auto v16 = static_cast<uint16_t>(value);
            std::memcpy(dst, &v16, sizeof(v16));
            break;
        }
        case 3:
            dst[0] = static_cast<uint8_t>(value >> 16);
            dst[1] = static_cast<uint8_t>(value >> 8);
            dst[2] = static_cast<uint8_t>(value);
            break;
        case 4:
            std::memcpy(dst, &value, sizeof(value));
            break;
        default:
            break;
    }
}

} // anonymous namespace

uint32_t FrameRenderer::pack(Rgb color, pal::PixelFormat format) noexcept {
    const uint32_t r = color.r;
    const uint32_t g = color.g;
    const uint32_t b = color.b;

    switch (format) {
        case pal::PixelFormat::RGB565:
            return ((r >> 3) << 11) | ((g >> 2) << 5) | (b >> 3);
        case pal::PixelFormat::RGB888:
            return (r << 16) | (g << 8) | b;
        case pal::PixelFormat::XRGB8888:
            return 0xFF000000u | (r << 16) | (g << 8) | b;
        case pal::PixelFormat::RGBA8888:
            return (r << 24) | (g << 16) | (b << 8) | 0xFFu;
        case pal::PixelFormat::BGRA8888:
            return (b << 24) | (g << 16) | (r << 8) | 0xFFu;
        case pal::PixelFormat::Unknown:
            break;
    }
    return 0;
}

Result<void> FrameRenderer::blit(std::span<const uint8_t, layout::kDisplaySize> display,
                                 const pal::Surface& surface) const {
    const uint32_t bpp = pal::bytesPerPixel(surface.format);
    GR8_CHECK(bpp != 0, ErrorCode::InvalidArgument, "unsupported surface pixel format");
    GR8_CHECK(surface.pixels != nullptr, ErrorCode::InvalidArgument, "surface has no pixels");
    GR8_CHECK(surface.width > 0 && surface.height > 0, ErrorCode::InvalidArgument,
              "surface has zero size");
    GR8_CHECK(surface.pitch >= surface.width * bpp, ErrorCode::InvalidArgument,
              "surface pitch smaller than a row");

    const uint32_t on = pack(foreground_, surface.format);
    const uint32_t off = pack(background_, surface.format);
    auto* base = static_cast<uint8_t*>(surface.pixels);

    for (uint32_t dy = 0; dy < surface.height; ++dy) {
        const size_t sy = static_cast<size_t>(dy) * layout::kDisplayHeight / surface.height;
        const uint8_t* src_row = display.data() + sy * layout::kDisplayWidth;
        uint8_t* dst = base + static_cast<size_t>(dy) * surface.pitch;

        for (uint32_t dx = 0; dx < surface.width; ++dx) {
            const size_t sx = static_cast<size_t>(dx) * layout::kDisplayWidth / surface.width;
            store_pixel(dst, src_row[sx] ? on : off, bpp);
            dst += bpp;
        }
    }
    return Ok();
}

Result<void> FrameRenderer::render(std::span<const uint8_t, layout::kDisplaySize> display,
                                   pal::IDisplay& target) const {
    pal::Surface surface;
    const pal::Status locked = target.lock(surface);
    if (!pal::ok(locked)) {
        return Err(GR8_ERROR(ErrorCode::InvalidState, "cannot lock surface: %s",
                             pal::toString(locked)));
    }

    auto result = blit(display, surface);
    target.unlock();
    return result;
}

} // namespace gr8
