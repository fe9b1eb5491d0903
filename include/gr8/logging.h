/**
 * @file logging.h
 * @brief Process-wide, callback-based logging.
 *
 * - All output goes through a host callback when one is set
 * - Without a callback, standalone builds write to stderr; library
 *   builds (GR8_LIBRARY_MODE) stay silent
 * - Fast path (log_raw) for pre-formatted messages
 *
 * Usage:
 *   gr8_set_log_callback(my_logger, userdata);
 *   GR8_LOG_INFO("ROM", "Loaded %zu bytes from %s", size, path);
 *
 * @copyright GPL-2.0-or-later
 */

#ifndef GR8_LOGGING_H
#define GR8_LOGGING_H

#include <cstddef>
#include <cstdint>

#ifdef __cplusplus
#include <string_view>
#endif

// ═══════════════════════════════════════════════════════════════════════════════
// C ABI Types
// ═══════════════════════════════════════════════════════════════════════════════

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Log severity levels, most to least severe.
 */
typedef enum gr8_log_level {
    GR8_LOG_ERROR = 0,
    GR8_LOG_WARN  = 1,
    GR8_LOG_INFO  = 2,
    GR8_LOG_DEBUG = 3,
    GR8_LOG_TRACE = 4
} gr8_log_level;

/**
 * @brief Log callback function type.
 *
 * @param level     Severity level of the message
 * @param subsystem Subsystem tag ("CPU", "ROM", "PAL", "RUN")
 * @param message   The log message (null-terminated)
 * @param userdata  User-provided context from registration
 */
typedef void (*gr8_log_callback)(
    gr8_log_level level,
    const char* subsystem,
    const char* message,
    void* userdata
);

/**
 * @brief Install the log callback (NULL restores the default handler).
 */
void gr8_set_log_callback(gr8_log_callback callback, void* userdata);

/**
 * @brief Set minimum log level (default: GR8_LOG_INFO).
 */
void gr8_set_log_level(gr8_log_level level);

gr8_log_level gr8_get_log_level(void);

const char* gr8_log_level_name(gr8_log_level level);

#ifdef __cplusplus
} /* extern "C" */
#endif

// ═══════════════════════════════════════════════════════════════════════════════
// C++ API
// ═══════════════════════════════════════════════════════════════════════════════

#ifdef __cplusplus

namespace gr8 {

enum class LogLevel : int {
    Error = GR8_LOG_ERROR,
    Warn  = GR8_LOG_WARN,
    Info  = GR8_LOG_INFO,
    Debug = GR8_LOG_DEBUG,
    Trace = GR8_LOG_TRACE
};

[[nodiscard]] inline const char* log_level_name(LogLevel level) noexcept {
    return gr8_log_level_name(static_cast<gr8_log_level>(level));
}

/**
 * @brief Parse "error", "warn", "info", "debug" or "trace".
 * @return false if @p name is not a level name
 */
[[nodiscard]] bool parse_log_level(std::string_view name, LogLevel& out) noexcept;

using LogCallback = gr8_log_callback;

/**
 * @brief Log a pre-formatted message (fast path).
 *
 * No formatting is performed; message is passed directly to callback.
 */
void log_raw(LogLevel level, const char* subsystem, std::string_view message) noexcept;

/**
 * @brief Log with printf-style formatting.
 */
void log_printf(LogLevel level, const char* subsystem, const char* fmt, ...) noexcept
#if defined(__GNUC__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

/**
 * @brief Check if a log level is enabled.
 *
 * Use this to guard expensive log argument computation.
 */
[[nodiscard]] inline bool log_level_enabled(LogLevel level) noexcept {
    return static_cast<int>(level) <= static_cast<int>(gr8_get_log_level());
}

namespace detail {

/**
 * @brief Default handler: "[LEVEL] subsystem: message" on stderr.
 */
void default_log_handler(
    gr8_log_level level,
    const char* subsystem,
    const char* message,
    void* userdata
) noexcept;

} // namespace detail

} // namespace gr8

// ═══════════════════════════════════════════════════════════════════════════════
// Logging Macros
// ═══════════════════════════════════════════════════════════════════════════════

#define GR8_LOG_ENABLED(level) \
    ::gr8::log_level_enabled(::gr8::LogLevel::level)

#define GR8_LOG_ERROR(subsys, ...) \
    ::gr8::log_printf(::gr8::LogLevel::Error, subsys, __VA_ARGS__)

#define GR8_LOG_WARN(subsys, ...) \
    ::gr8::log_printf(::gr8::LogLevel::Warn, subsys, __VA_ARGS__)

#define GR8_LOG_INFO(subsys, ...) \
    ::gr8::log_printf(::gr8::LogLevel::Info, subsys, __VA_ARGS__)

#define GR8_LOG_DEBUG(subsys, ...) \
    ::gr8::log_printf(::gr8::LogLevel::Debug, subsys, __VA_ARGS__)

// Trace sits on the per-instruction path; arguments are evaluated only
// when the level is enabled.
#define GR8_LOG_TRACE(subsys, ...) \
    do { \
        if (GR8_LOG_ENABLED(Trace)) { \
            ::gr8::log_printf(::gr8::LogLevel::Trace, subsys, __VA_ARGS__); \
        } \
    } while (0)

#define GR8_LOG_RAW(level, subsys, msg) \
    ::gr8::log_raw(::gr8::LogLevel::level, subsys, msg)

#endif /* __cplusplus */

#endif /* GR8_LOGGING_H */
