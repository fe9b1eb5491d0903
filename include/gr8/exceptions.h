/**
 * @file exceptions.h
 * @brief Exception hierarchy for unexpected failures.
 *
 * These exceptions represent programming errors or system failures
 * that cannot be handled through normal control flow. Expected
 * failures (bad ROMs, guest faults) travel as Result<T> instead.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <gr8/error.h>

#include <cstdarg>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace gr8 {

/**
 * @brief Base class for all GR8 emulator exceptions.
 */
class EmulatorException : public std::runtime_error {
public:
    explicit EmulatorException(const std::string& msg)
        : std::runtime_error(msg)
    {}

    static std::string format_message(const char* fmt, ...) GR8_PRINTF_FORMAT(1, 2);
};

inline std::string EmulatorException::format_message(const char* fmt, ...) {
    std::va_list args;
    va_start(args, fmt);
    std::string out = detail::vformat_printf(fmt, args);
    va_end(args);
    return out;
}

/**
 * @brief Exception for guest memory access violations.
 *
 * Thrown by GuestMemory on any access outside the 4 KiB address space.
 * The interpreter validates addresses before touching memory, so seeing
 * this exception escape means a bug in the caller.
 */
class MemoryAccessException : public EmulatorException {
public:
    explicit MemoryAccessException(uint32_t addr)
        : EmulatorException(format_message(
            "Memory access violation at 0x%04X", static_cast<unsigned>(addr)))
        , address_(addr)
        , size_(1)
    {}

    MemoryAccessException(uint32_t addr, size_t size)
        : EmulatorException(format_message(
            "Memory access violation: %zu bytes at 0x%04X", size,
            static_cast<unsigned>(addr)))
        , address_(addr)
        , size_(size)
    {}

    [[nodiscard]] uint32_t address() const noexcept { return address_; }
    [[nodiscard]] size_t size() const noexcept { return size_; }

private:
    uint32_t address_;
    size_t size_;
};

/**
 * @brief Exception replacing abort() in library mode.
 *
 * @note Should only be caught at the top level (CLI main, test harness).
 */
class FatalException : public EmulatorException {
public:
    explicit FatalException(const std::string& msg)
        : EmulatorException("Fatal error: " + msg)
        , file_("")
        , line_(0)
    {}

    FatalException(const std::string& msg, const char* file, int line)
        : EmulatorException(format_message(
            "Fatal error at %s:%d: %s", file, line, msg.c_str()))
        , file_(file)
        , line_(line)
    {}

    [[nodiscard]] const char* file() const noexcept { return file_; }
    [[nodiscard]] int line() const noexcept { return line_; }

private:
    const char* file_;
    int line_;
};

/**
 * @brief Exception for configuration errors.
 *
 * Thrown by constructors that receive a configuration which never went
 * through the validating builder (constructors cannot return Result<T>).
 */
class ConfigException : public EmulatorException {
public:
    explicit ConfigException(const std::string& msg)
        : EmulatorException("Configuration error: " + msg)
    {}

    ConfigException(const std::string& section, const std::string& msg)
        : EmulatorException(format_message(
            "Configuration error in [%s]: %s", section.c_str(), msg.c_str()))
        , section_(section)
    {}

    [[nodiscard]] const std::string& section() const noexcept { return section_; }

private:
    std::string section_;
};

} // namespace gr8

// ─────────────────────────────────────────────────────────────────────────────
// abort() Replacement Macro
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Replace abort() with exception in library mode.
 *
 * In standalone mode, calls real abort().
 * In library mode, throws FatalException.
 */
#ifdef GR8_LIBRARY_MODE
    #define GR8_ABORT(msg) \
        throw ::gr8::FatalException(msg, __FILE__, __LINE__)
#else
    #include <cstdlib>
    #include <iostream>
    #define GR8_ABORT(msg) \
        do { \
            std::cerr << "Fatal: " << (msg) << " at " << __FILE__ << ":" << __LINE__ << "\n"; \
            std::abort(); \
        } while(0)
#endif

/**
 * @brief Assert that throws in library mode instead of aborting.
 */
#ifdef GR8_LIBRARY_MODE
    #define GR8_ASSERT(cond, msg) \
        do { \
            if (!(cond)) { \
                throw ::gr8::FatalException( \
                    std::string("Assertion failed: ") + (msg), __FILE__, __LINE__); \
            } \
        } while(0)
#else
    #include <cassert>
    #define GR8_ASSERT(cond, msg) assert((cond) && (msg))
#endif
