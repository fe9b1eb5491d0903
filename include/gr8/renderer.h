/**
 * @file renderer.h
 * @brief Converts the 64x32 framebuffer into display surface pixels.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <gr8/driver_config.h>
#include <gr8/error.h>
#include <gr8/layout.h>
#include <pal/display.h>

#include <cstdint>
#include <span>

namespace gr8 {

/**
 * @brief Nearest-neighbour blitter with configurable on/off colours.
 *
 * Works on surfaces of any size: each destination pixel samples the
 * framebuffer pixel under it, so integer multiples of 64x32 give square
 * pixels and anything else still fills the surface.
 */
class FrameRenderer {
public:
    FrameRenderer(Rgb foreground, Rgb background) noexcept
        : foreground_(foreground), background_(background) {}

    /**
     * @brief Lock @p target, draw @p display and unlock.
     * @return InvalidState if the surface cannot be locked,
     *         InvalidArgument for an unsupported pixel format
     */
    [[nodiscard]] Result<void> render(std::span<const uint8_t, layout::kDisplaySize> display,
                                      pal::IDisplay& target) const;

    /**
     * @brief Draw into an already locked surface.
     */
    [[nodiscard]] Result<void> blit(std::span<const uint8_t, layout::kDisplaySize> display,
                                    const pal::Surface& surface) const;

    /**
     * @brief Pack a colour as the native pixel value of @p format.
     *
     * Alpha and padding bits are set to 0xFF. RGB888 returns the three
     * bytes as 0x00RRGGBB; the blitter writes them in R, G, B order.
     */
    [[nodiscard]] static uint32_t pack(Rgb color, pal::PixelFormat format) noexcept;

    [[nodiscard]] Rgb foreground() const noexcept { return foreground_; }
    [[nodiscard]] Rgb background() const noexcept { return background_; }

    void set_colors(Rgb foreground, Rgb background) noexcept {
        foreground_ = foreground;
        background_ = background;
    }

private:
    Rgb foreground_;
    Rgb background_;
};

} // namespace gr8
