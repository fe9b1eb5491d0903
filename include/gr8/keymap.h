/**
 * @file keymap.h
 * @brief Host scancode to CHIP-8 keypad mapping.
 *
 * Scancodes are the USB-HID usage IDs that the SDL backend reports in
 * pal::HostEvent::scancode. The default layout puts the 4x4 COSMAC
 * keypad on the left-hand block of a QWERTY keyboard:
 *
 * @verbatim
 *   1 2 3 4        1 2 3 C
 *   Q W E R   ->   4 5 6 D
 *   A S D F        7 8 9 E
 *   Z X C V        A 0 B F
 * @endverbatim
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <gr8/error.h>
#include <gr8/layout.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace gr8 {

namespace scancode {

inline constexpr uint16_t kA = 4;
inline constexpr uint16_t kZ = 29;
inline constexpr uint16_t k1 = 30;
inline constexpr uint16_t k0 = 39;
inline constexpr uint16_t kEscape = 41;

/**
 * @brief Scancode for a letter or digit name ("q", "4"), if it has one.
 */
[[nodiscard]] std::optional<uint16_t> from_name(std::string_view name) noexcept;

} // namespace scancode

class KeyMap {
public:
    /// Number of host scancodes the table covers (USB-HID keyboard page)
    static constexpr size_t kScancodeCount = 512;

    /// Empty map; only the quit key is bound
    KeyMap() noexcept;

    /// The 1234/QWER/ASDF/ZXCV layout
    [[nodiscard]] static KeyMap defaults() noexcept;

    /**
     * @brief Map @p host_scancode to keypad key @p key, replacing any
     * previous binding of that scancode.
     * @pre key < 16
     */
    void bind(uint16_t host_scancode, uint8_t key);

    /**
     * @brief Bind by key name, e.g. bind_named("q", 0x4).
     * @return InvalidArgument for unknown names or keys above 0xF
     */
    [[nodiscard]] Result<void> bind_named(std::string_view name, uint8_t key);

    void unbind(uint16_t host_scancode) noexcept;

    /// Remove every binding of keypad key @p key
    void unbind_key(uint8_t key) noexcept;

    [[nodiscard]] std::optional<uint8_t> lookup(uint16_t host_scancode) const noexcept;

    [[nodiscard]] size_t binding_count() const noexcept;

    void set_quit_scancode(uint16_t host_scancode) noexcept { quit_scancode_ = host_scancode; }
    [[nodiscard]] uint16_t quit_scancode() const noexcept { return quit_scancode_; }
    [[nodiscard]] bool is_quit(uint16_t host_scancode) const noexcept {
        return host_scancode == quit_scancode_;
    }

private:
    static constexpr uint8_t kUnbound = 0xFF;

    std::array<uint8_t, kScancodeCount> table_;
    uint16_t quit_scancode_ = scancode::kEscape;
};

} // namespace gr8
