/**
 * @file layout.h
 * @brief Fixed machine geometry: address map, register file, display.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace gr8::layout {

// Address space
inline constexpr size_t   kMemorySize    = 4096;
inline constexpr uint16_t kProgramStart  = 0x200;
inline constexpr size_t   kMaxRomSize    = kMemorySize - kProgramStart;  // 3584

// Font glyphs: 16 characters x 5 rows, inside the reserved area.
inline constexpr uint16_t kFontBase      = 0x050;
inline constexpr size_t   kGlyphBytes    = 5;
inline constexpr size_t   kGlyphCount    = 16;

// Register file
inline constexpr size_t   kRegisterCount = 16;
inline constexpr size_t   kFlagRegister  = 0xF;
inline constexpr size_t   kStackDepth    = 16;

// Keypad
inline constexpr size_t   kKeyCount      = 16;

// Display
inline constexpr size_t   kDisplayWidth  = 64;
inline constexpr size_t   kDisplayHeight = 32;
inline constexpr size_t   kDisplaySize   = kDisplayWidth * kDisplayHeight;

// Timers tick at 60 Hz of elapsed host time unless configured otherwise.
inline constexpr uint32_t kDefaultTimerHz = 60;

/**
 * @brief Hexadecimal digit sprites 0-F, one glyph per 5 bytes.
 */
inline constexpr std::array<uint8_t, kGlyphCount * kGlyphBytes> kFontGlyphs = {
    0xF0, 0x90, 0x90, 0x90, 0xF0,  // 0
    0x20, 0x60, 0x20, 0x20, 0x70,  // 1
    0xF0, 0x10, 0xF0, 0x80, 0xF0,  // 2
    0xF0, 0x10, 0xF0, 0x10, 0xF0,  // 3
    0x90, 0x90, 0xF0, 0x10, 0x10,  // 4
    0xF0, 0x80, 0xF0, 0x10, 0xF0,  // 5
    0xF0, 0x80, 0xF0, 0x90, 0xF0,  // 6
    0xF0, 0x10, 0x20, 0x40, 0x40,  // 7
    0xF0, 0x90, 0xF0, 0x90, 0xF0,  // 8
    0xF0, 0x90, 0xF0, 0x10, 0xF0,  // 9
    0xF0, 0x90, 0xF0, 0x90, 0x90,  // A
    0xE0, 0x90, 0xE0, 0x90, 0xE0,  // B
    0xF0, 0x80, 0x80, 0x80, 0xF0,  // C
    0xE0, 0x90, 0x90, 0x90, 0xE0,  // D
    0xF0, 0x80, 0xF0, 0x80, 0xF0,  // E
    0xF0, 0x80, 0xF0, 0x80, 0x80,  // F
};

static_assert(kFontBase + kFontGlyphs.size() <= kProgramStart,
              "font must live in the reserved area");

} // namespace gr8::layout
