/**
 * @file main.cpp
 * @brief gr8 command-line front end.
 *
 * @code
 *   gr8 [options] <rom>
 * @endcode
 *
 * Exit status: 0 on a clean stop, 1 on a load or execution error,
 * 2 on bad usage.
 *
 * @copyright GPL-2.0-or-later
 */

#include "gr8/builder.h"
#include "gr8/exceptions.h"
#include "gr8/logging.h"
#include "gr8/opcode.h"
#include "gr8/rom.h"
#include "gr8/runner.h"

#include <charconv>
#include <cstdio>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;

struct Options {
    gr8::ConfigBuilder builder;
    const char* rom_path = nullptr;
    bool disassemble = false;
    bool help = false;
};

void print_usage(const char* argv0) {
    std::fprintf(stderr,
        "Usage: %s [options] <rom>\n"
        "\n"
        "Options:\n"
        "  --backend <auto|sdl2|headless>       Platform backend (default: auto)\n"
        "  --ips <n>                            Instructions per second (default: 700)\n"
        "  --fps <n>                            Frames per second (default: 60)\n"
        "  --scale <n>                          Window scale factor (default: 10)\n"
        "  --seed <n>                           Deterministic RNG seed\n"
        "  --wrap-sprites                       Wrap sprite pixels past the edges\n"
        "  --frames <n>                         Stop after n frames\n"
        "  --log-level <error|warn|info|debug|trace>\n"
        "  --disassemble                        Print the program and exit\n"
        "  --help                               Show this text\n",
        argv0);
}

template <typename T>
std::optional<T> parse_number(std::string_view text) {
    T value{};
    const char* first = text.data();
    const char* last = first + text.size();
    int base = 10;
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        first += 2;
        base = 16;
    }
    const auto [ptr, ec] = std::from_chars(first, last, value, base);
    if (ec != std::errc() || ptr != last || first == last) {
        return std::nullopt;
    }
    return value;
}

std::optional<pal::Backend> parse_backend(std::string_view name) {
    if (name == "auto")     return pal::Backend::Auto;
    if (name == "sdl2")     return pal::Backend::SDL2;
    if (name == "headless") return pal::Backend::Headless;
    return std::nullopt;
}

/// @return false after printing a diagnostic
bool parse_args(int argc, char* argv[], Options& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        auto next_value = [&](std::string_view& out) {
            if (i + 1 >= argc) {
                std::fprintf(stderr, "gr8: %s needs a value\n", argv[i]);
                return false;
            }
            out = argv[++i];
            return true;
        };

        auto next_u32 = [&](uint32_t& out) {
            std::string_view text;
            if (!next_value(text)) return false;
            const auto value = parse_number<uint32_t>(text);
            if (!value) {
                std::fprintf(stderr, "gr8: %s expects a number, got '%s'\n", argv[i - 1], argv[i]);
                return false;
            }
            out = *value;
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            options.help = true;
        } else if (arg == "--backend") {
            std::string_view text;
            if (!next_value(text)) return false;
            const auto backend = parse_backend(text);
            if (!backend) {
                std::fprintf(stderr, "gr8: unknown backend '%s'\n", argv[i]);
                return false;
            }
            options.builder.with_backend(*backend);
        } else if (arg == "--ips") {
            uint32_t ips = 0;
            if (!next_u32(ips)) return false;
            options.builder.with_instructions_per_second(ips);
        } else if (arg == "--fps") {
            uint32_t fps = 0;
            if (!next_u32(fps)) return false;
            options.builder.with_frame_rate(fps);
        } else if (arg == "--scale") {
            uint32_t scale = 0;
            if (!next_u32(scale)) return false;
            options.builder.with_scale(scale);
        } else if (arg == "--seed") {
            std::string_view text;
            if (!next_value(text)) return false;
            const auto seed = parse_number<uint64_t>(text);
            if (!seed) {
                std::fprintf(stderr, "gr8: --seed expects a number, got '%s'\n", argv[i]);
                return false;
            }
            options.builder.with_seed(*seed);
        } else if (arg == "--wrap-sprites") {
            options.builder.with_sprite_edge(gr8::SpriteEdge::Wrap);
        } else if (arg == "--frames") {
            std::string_view text;
            if (!next_value(text)) return false;
            const auto frames = parse_number<uint64_t>(text);
            if (!frames) {
                std::fprintf(stderr, "gr8: --frames expects a number, got '%s'\n", argv[i]);
                return false;
            }
            options.builder.with_frame_limit(*frames);
        } else if (arg == "--log-level") {
            std::string_view text;
            if (!next_value(text)) return false;
            gr8::LogLevel level;
            if (!gr8::parse_log_level(text, level)) {
                std::fprintf(stderr, "gr8: unknown log level '%s'\n", argv[i]);
                return false;
            }
            gr8_set_log_level(static_cast<gr8_log_level>(level));
        } else if (arg == "--disassemble") {
            options.disassemble = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::fprintf(stderr, "gr8: unknown option '%s'\n", argv[i]);
            return false;
        } else if (options.rom_path == nullptr) {
            options.rom_path = argv[i];
        } else {
            std::fprintf(stderr, "gr8: more than one ROM given\n");
            return false;
        }
    }
    return true;
}

/// One line per word; undecodable words are shown as data
void disassemble(const std::vector<uint8_t>& rom) {
    size_t offset = 0;
    for (; offset + 1 < rom.size(); offset += 2) {
        const uint16_t address = static_cast<uint16_t>(gr8::layout::kProgramStart + offset);
        const uint16_t word = static_cast<uint16_t>((rom[offset] << 8) | rom[offset + 1]);
        const auto op = gr8::decode_word(word);
        if (op) {
            std::printf("%03X  %04X  %s\n", address, word, gr8::mnemonic(*op).c_str());
        } else {
            std::printf("%03X  %04X  DW 0x%04X\n", address, word, word);
        }
    }
    if (offset < rom.size()) {
        std::printf("%03X  %02X    DB 0x%02X\n",
                    static_cast<unsigned>(gr8::layout::kProgramStart + offset),
                    rom[offset], rom[offset]);
    }
}

int run(int argc, char* argv[]) {
    Options options;
    if (!parse_args(argc, argv, options)) {
        print_usage(argv[0]);
        return kExitUsage;
    }
    if (options.help) {
        print_usage(argv[0]);
        return kExitOk;
    }
    if (options.rom_path == nullptr) {
        std::fprintf(stderr, "gr8: no ROM given\n");
        print_usage(argv[0]);
        return kExitUsage;
    }

    auto rom = gr8::load_rom_file(options.rom_path);
    if (!rom) {
        GR8_LOG_ERROR("ROM", "%s", rom.error().format().c_str());
        return kExitError;
    }

    if (options.disassemble) {
        disassemble(*rom);
        return kExitOk;
    }

    auto config = options.builder.with_title(std::string("GR8 - ") + options.rom_path).build();
    if (!config) {
        std::fprintf(stderr, "gr8: %s\n", config.error().message().c_str());
        return kExitUsage;
    }

    gr8::Runner runner(std::move(*config));
    auto loaded = runner.load(*rom);
    if (!loaded) {
        GR8_LOG_ERROR("ROM", "%s", loaded.error().format().c_str());
        return kExitError;
    }

    // The runner logs whatever stopped it
    auto summary = runner.run();
    if (!summary) {
        return kExitError;
    }
    return kExitOk;
}

} // namespace

int main(int argc, char* argv[]) {
    // The core is built in library mode; the CLI opts into stderr output.
    gr8_set_log_callback(gr8::detail::default_log_handler, nullptr);

    try {
        return run(argc, argv);
    } catch (const gr8::EmulatorException& e) {
        GR8_LOG_ERROR("RUN", "%s", e.what());
        return kExitError;
    }
}
