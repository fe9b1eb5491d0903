/**
 * @file error.h
 * @brief Error handling infrastructure using C++23 std::expected.
 *
 * Provides:
 * - Error class with code, message, source location and optional
 *   instruction word / byte offset for decode and execution failures
 * - Result<T> type alias for std::expected<T, Error>
 * - Ok(), Err(), make_error() helper functions
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <utility>

namespace gr8 {

// ─────────────────────────────────────────────────────────────────────────────
// Error Codes
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Categorized error codes for Result<T> failures.
 *
 * Zero indicates success and is never stored in an Error.
 */
enum class ErrorCode : int {
    Ok = 0,

    // General errors (1-99)
    Unknown = 1,
    InvalidArgument = 3,
    InvalidState = 4,

    // Decode errors (100-199)
    UnsupportedInstruction = 100,
    MalformedProgram = 101,

    // Load errors (200-299)
    RomTooLarge = 200,
    FileNotFound = 201,
    FileReadError = 202,

    // Execution errors (300-399)
    StackOverflow = 300,
    StackUnderflow = 301,
    MemoryOutOfBounds = 302,
    UnsupportedOpcode = 303,

    // Configuration errors (400-499)
    ConfigValueInvalid = 400,
    BackendUnavailable = 401,
};

/**
 * @brief Convert ErrorCode to string representation.
 */
[[nodiscard]] inline constexpr const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::UnsupportedInstruction: return "UnsupportedInstruction";
        case ErrorCode::MalformedProgram: return "MalformedProgram";
        case ErrorCode::RomTooLarge: return "RomTooLarge";
        case ErrorCode::FileNotFound: return "FileNotFound";
        case ErrorCode::FileReadError: return "FileReadError";
        case ErrorCode::StackOverflow: return "StackOverflow";
        case ErrorCode::StackUnderflow: return "StackUnderflow";
        case ErrorCode::MemoryOutOfBounds: return "MemoryOutOfBounds";
        case ErrorCode::UnsupportedOpcode: return "UnsupportedOpcode";
        case ErrorCode::ConfigValueInvalid: return "ConfigValueInvalid";
        case ErrorCode::BackendUnavailable: return "BackendUnavailable";
        default: return "Unknown";
    }
}

/**
 * @brief Lets the compiler check printf-style arguments against the format.
 */
#if defined(__GNUC__) || defined(__clang__)
#define GR8_PRINTF_FORMAT(fmt_index, first_arg) \
    __attribute__((format(printf, fmt_index, first_arg)))
#else
#define GR8_PRINTF_FORMAT(fmt_index, first_arg)
#endif

namespace detail {

[[nodiscard]] inline std::string vformat_printf(const char* fmt, std::va_list args) {
    std::va_list measure;
    va_copy(measure, args);
    const int n = std::vsnprintf(nullptr, 0, fmt, measure);
    va_end(measure);
    if (n <= 0) {
        return {};
    }
    std::string out(static_cast<size_t>(n), '\0');
    std::vsnprintf(out.data(), out.size() + 1, fmt, args);
    return out;
}

/**
 * @brief printf-style formatting into a std::string.
 */
[[nodiscard]] inline std::string format_printf(const char* fmt, ...) GR8_PRINTF_FORMAT(1, 2);

inline std::string format_printf(const char* fmt, ...) {
    std::va_list args;
    va_start(args, fmt);
    std::string out = vformat_printf(fmt, args);
    va_end(args);
    return out;
}

} // namespace detail

// ─────────────────────────────────────────────────────────────────────────────
// Error Class
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Structured error with code, message, and source location.
 *
 * Decode and execution errors additionally carry the raw 16-bit
 * instruction word that caused them; program decoding attaches the byte
 * offset of the failing instruction.
 *
 * Example:
 * @code
 *   Error err(ErrorCode::FileNotFound, "ROM file missing");
 *   std::fprintf(stderr, "%s\n", err.format().c_str());
 *   // Output: FileNotFound at rom.cpp:42 (load_rom_file): ROM file missing
 * @endcode
 */
class Error {
public:
    Error(ErrorCode code,
          std::string message,
          std::source_location location = std::source_location::current())
        : code_(code)
        , message_(std::move(message))
        , location_(location)
    {}

    /**
     * @brief Create error with printf-style formatted message.
     *
     * Prefer GR8_ERROR, which fills in @p location at the call site.
     */
    [[nodiscard]] static Error formatted(std::source_location location, ErrorCode code,
                                         const char* fmt, ...) GR8_PRINTF_FORMAT(3, 4);

    // Accessors
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] const std::source_location& location() const noexcept { return location_; }
    [[nodiscard]] const char* file() const noexcept { return location_.file_name(); }
    [[nodiscard]] uint_least32_t line() const noexcept { return location_.line(); }
    [[nodiscard]] const char* function() const noexcept { return location_.function_name(); }

    /**
     * @brief Raw instruction word (big-endian nibbles n0..n3), if attached.
     */
    [[nodiscard]] std::optional<uint16_t> instruction() const noexcept { return instruction_; }

    /**
     * @brief Byte offset into the decoded program, if attached.
     */
    [[nodiscard]] std::optional<size_t> offset() const noexcept { return offset_; }

    Error& with_instruction(uint16_t word) & noexcept {
        instruction_ = word;
        return *this;
    }
    Error&& with_instruction(uint16_t word) && noexcept {
        instruction_ = word;
        return std::move(*this);
    }

    Error& at_offset(size_t offset) & noexcept {
        offset_ = offset;
        return *this;
    }
    Error&& at_offset(size_t offset) && noexcept {
        offset_ = offset;
        return std::move(*this);
    }

    /**
     * @brief Format error for display/logging.
     * @return "CODE at file:line (func): message [instruction 0xNNNN] [offset N]"
     */
    [[nodiscard]] std::string format() const {
        std::string out = detail::format_printf(
            "%s at %s:%u (%s): %s",
            error_code_name(code_),
            location_.file_name(),
            static_cast<unsigned>(location_.line()),
            location_.function_name(),
            message_.c_str());
        if (instruction_) {
            out += detail::format_printf(" [instruction 0x%04X]",
                                         static_cast<unsigned>(*instruction_));
        }
        if (offset_) {
            out += detail::format_printf(" [offset %zu]", *offset_);
        }
        return out;
    }

    [[nodiscard]] bool is(ErrorCode code) const noexcept {
        return code_ == code;
    }

private:
    ErrorCode code_;
    std::string message_;
    std::source_location location_;
    std::optional<uint16_t> instruction_;
    std::optional<size_t> offset_;
};

inline Error Error::formatted(std::source_location location, ErrorCode code,
                              const char* fmt, ...) {
    std::va_list args;
    va_start(args, fmt);
    std::string message = detail::vformat_printf(fmt, args);
    va_end(args);
    return Error{code, std::move(message), location};
}

// ─────────────────────────────────────────────────────────────────────────────
// Result Type (std::expected alias)
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Result type for fallible operations.
 *
 * Either a success value of type T, or an Error.
 */
template<typename T>
using Result = std::expected<T, Error>;

// ─────────────────────────────────────────────────────────────────────────────
// Helper Functions
// ─────────────────────────────────────────────────────────────────────────────

template<typename T>
[[nodiscard]] constexpr Result<T> Ok(T value) {
    return Result<T>{std::in_place, std::move(value)};
}

[[nodiscard]] inline constexpr Result<void> Ok() {
    return Result<void>{};
}

[[nodiscard]] inline std::unexpected<Error> Err(Error error) {
    return std::unexpected(std::move(error));
}

/**
 * @brief Create error with code and message.
 */
[[nodiscard]] inline std::unexpected<Error> make_error(
    ErrorCode code,
    std::string msg,
    std::source_location loc = std::source_location::current()
) {
    return std::unexpected(Error{code, std::move(msg), loc});
}

// ─────────────────────────────────────────────────────────────────────────────
// Convenience Macros
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Return error if condition is false.
 *
 * Usage:
 *   GR8_CHECK(size <= limit, ErrorCode::RomTooLarge, "ROM too large");
 */
#define GR8_CHECK(cond, code, msg) \
    do { \
        if (!(cond)) { \
            return ::gr8::make_error(code, msg); \
        } \
    } while (0)

/**
 * @brief Return early if result is an error, otherwise yield its value.
 *
 * Note: Uses GCC statement expression extension.
 */
#define GR8_TRY(expr) \
    ({ \
        auto&& _gr8_result = (expr); \
        if (!_gr8_result.has_value()) { \
            return ::gr8::Err(std::move(_gr8_result).error()); \
        } \
        std::move(_gr8_result).value(); \
    })

/**
 * @brief Build an Error with a printf-style message, located at the caller.
 *
 * Usage:
 *   return Err(GR8_ERROR(ErrorCode::RomTooLarge, "%zu bytes", size));
 */
#define GR8_ERROR(code, fmt, ...) \
    ::gr8::Error::formatted(std::source_location::current(), code, \
                            fmt __VA_OPT__(,) __VA_ARGS__)

} // namespace gr8
