/**
 * @file rom.h
 * @brief Reading ROM images from disk.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <gr8/error.h>

#include <cstdint>
#include <filesystem>
#include <vector>

namespace gr8 {

/**
 * @brief Read a flat CHIP-8 ROM image.
 *
 * @return The bytes, or FileNotFound / FileReadError / RomTooLarge.
 *         An odd-length image is accepted with a warning.
 */
[[nodiscard]] Result<std::vector<uint8_t>> load_rom_file(const std::filesystem::path& path);

} // namespace gr8
