/**
 * @file keymap.cpp
 * @brief Host scancode to CHIP-8 keypad mapping.
 *
 * @copyright GPL-2.0-or-later
 */

#include "gr8/keymap.h"

#include "gr8/gsl.hpp"

namespace gr8 {

// ─────────────────────────────────────────────────────────────────────────────
// Scancode Names
// ─────────────────────────────────────────────────────────────────────────────

namespace {

// USB-HID usage IDs for letters a-z
constexpr uint16_t letter_scancodes[26] = {
     4,  5,  6,  7,  8,  9, 10, 11, 12,
    13, 14, 15, 16, 17, 18, 19, 20, 21,
    22, 23, 24, 25, 26, 27, 28, 29
};

// USB-HID usage IDs for digits 0-9 (top row)
constexpr uint16_t digit_scancodes[10] = {
    39, 30, 31, 32, 33, 34, 35, 36, 37, 38
};

struct DefaultBinding {
    char name;
    uint8_t key;
};

constexpr DefaultBinding default_layout[layout::kKeyCount] = {
    {'1', 0x1}, {'2', 0x2}, {'3', 0x3}, {'4', 0xC},
    {'q', 0x4}, {'w', 0x5}, {'e', 0x6}, {'r', 0xD},
    {'a', 0x7}, {'s', 0x8}, {'d', 0x9}, {'f', 0xE},
    {'z', 0xA}, {'x', 0x0}, {'c', 0xB}, {'v', 0xF},
};

} // anonymous namespace

namespace scancode {

std::optional<uint16_t> from_name(std::string_view name) noexcept {
    if (name == "escape" || name == "esc") {
        return kEscape;
    }
    if (name.size() != 1) {
        return std::nullopt;
    }

    const char c = name[0];
    if (c >= 'a' && c <= 'z') {
        return letter_scancodes[c - 'a'];
    }
    if (c >= 'A' && c <= 'Z') {
        return letter_scancodes[c - 'A'];
    }
    if (c >= '0' && c <= '9') {
        return digit_scancodes[c - '0'];
    }
    return std::nullopt;
}

} // namespace scancode

// ─────────────────────────────────────────────────────────────────────────────
// KeyMap
// ─────────────────────────────────────────────────────────────────────────────

KeyMap::KeyMap() noexcept {
    table_.fill(kUnbound);
}

KeyMap KeyMap::defaults() noexcept {
    KeyMap map;
    for (const auto& binding : default_layout) {
        const char name[1] = {binding.name};
        const auto code = scancode::from_name(std::string_view(name, 1));
        if (code) {
            map.table_[*code] = binding.key;
        }
    }
    return map;
}

void KeyMap::bind(uint16_t host_scancode, uint8_t key) {
    gsl_Expects(key < layout::kKeyCount);
    gsl_Expects(host_scancode < kScancodeCount);
    table_[host_scancode] = key;
}

Result<void> KeyMap::bind_named(std::string_view name, uint8_t key) {
    if (key >= layout::kKeyCount) {
        return Err(GR8_ERROR(ErrorCode::InvalidArgument,
                             "keypad key 0x%X out of range", static_cast<unsigned>(key)));
    }
    const auto code = scancode::from_name(name);
    if (!code) {
        const std::string owned(name);
        return Err(GR8_ERROR(ErrorCode::InvalidArgument,
                             "unknown key name '%s'", owned.c_str()));
    }
    table_[*code] = key;
    return Ok();
}

void KeyMap::unbind(uint16_t host_scancode) noexcept {
    if (host_scancode < kScancodeCount) {
        table_[host_scancode] = kUnbound;
    }
}

void KeyMap::unbind_key(uint8_t key) noexcept {
    for (auto& entry : table_) {
        if (entry == key) {
            entry = kUnbound;
        }
    }
}

std::optional<uint8_t> KeyMap::lookup(uint16_t host_scancode) const noexcept {
    if (host_scancode >= kScancodeCount || table_[host_scancode] == kUnbound) {
        return std::nullopt;
    }
    return table_[host_scancode];
}

size_t KeyMap::binding_count() const noexcept {
    size_t count = 0;
    for (const auto entry : table_) {
        if (entry != kUnbound) {
            ++count;
        }
    }
    return count;
}

} // namespace gr8
