/**
 * @file rom.cpp
 * @brief ROM file loader.
 *
 * @copyright GPL-2.0-or-later
 */

#include "gr8/rom.h"

#include "gr8/layout.h"
#include "gr8/logging.h"

#include <fstream>
#include <system_error>

namespace gr8 {

Result<std::vector<uint8_t>> load_rom_file(const std::filesystem::path& path) {
    const std::string name = path.string();

    std::error_code ec;
    if (!std::filesystem::exists(path, ec) || ec) {
        return Err(GR8_ERROR(ErrorCode::FileNotFound, "ROM '%s' does not exist", name.c_str()));
    }
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return Err(GR8_ERROR(ErrorCode::FileReadError, "ROM '%s' is not a regular file",
                             name.c_str()));
    }

    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return Err(GR8_ERROR(ErrorCode::FileReadError, "cannot stat ROM '%s': %s",
                             name.c_str(), ec.message().c_str()));
    }
    if (size > layout::kMaxRomSize) {
        return Err(GR8_ERROR(ErrorCode::RomTooLarge,
                             "ROM '%s' is %ju bytes; at most %zu fit at 0x200",
                             name.c_str(), static_cast<uintmax_t>(size),
                             layout::kMaxRomSize));
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Err(GR8_ERROR(ErrorCode::FileReadError, "cannot open ROM '%s'", name.c_str()));
    }

    std::vector<uint8_t> bytes(static_cast<size_t>(size));
    if (!bytes.empty()) {
        in.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (in.gcount() != static_cast<std::streamsize>(bytes.size())) {
            return Err(GR8_ERROR(ErrorCode::FileReadError,
                                 "short read on ROM '%s' (%lld of %zu bytes)",
                                 name.c_str(), static_cast<long long>(in.gcount()),
                                 bytes.size()));
        }
    }

    if (bytes.size() % 2 != 0) {
        GR8_LOG_WARN("ROM", "'%s' has odd length %zu; the trailing byte is loaded as data",
                     name.c_str(), bytes.size());
    }
    GR8_LOG_INFO("ROM", "Read %zu bytes from '%s'", bytes.size(), name.c_str());
    return bytes;
}

} // namespace gr8
