/**
 * @file logging.cpp
 * @brief Process-wide logging state and default handler.
 *
 * Thread-safety: callback registration is mutex-protected; the level is
 * an atomic so filtered calls never lock.
 *
 * @copyright GPL-2.0-or-later
 */

#include "gr8/logging.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <mutex>

namespace {

std::mutex g_log_mutex;

gr8_log_callback g_log_callback = nullptr;
void* g_log_userdata = nullptr;

std::atomic<gr8_log_level> g_min_log_level{GR8_LOG_INFO};

constexpr size_t LOG_BUFFER_SIZE = 1024;

} // anonymous namespace

// ═══════════════════════════════════════════════════════════════════════════════
// C API Implementation
// ═══════════════════════════════════════════════════════════════════════════════

extern "C" {

void gr8_set_log_callback(gr8_log_callback callback, void* userdata) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_callback = callback;
    g_log_userdata = userdata;
}

void gr8_set_log_level(gr8_log_level level) {
    g_min_log_level.store(level, std::memory_order_relaxed);
}

gr8_log_level gr8_get_log_level(void) {
    return g_min_log_level.load(std::memory_order_relaxed);
}

const char* gr8_log_level_name(gr8_log_level level) {
    switch (level) {
        case GR8_LOG_ERROR: return "ERROR";
        case GR8_LOG_WARN:  return "WARN";
        case GR8_LOG_INFO:  return "INFO";
        case GR8_LOG_DEBUG: return "DEBUG";
        case GR8_LOG_TRACE: return "TRACE";
        default:            return "UNKNOWN";
    }
}

} // extern "C"

// ═══════════════════════════════════════════════════════════════════════════════
// C++ Implementation
// ═══════════════════════════════════════════════════════════════════════════════

namespace gr8 {

namespace detail {

void default_log_handler(
    gr8_log_level level,
    const char* subsystem,
    const char* message,
    void* /*userdata*/
) noexcept {
    std::fprintf(stderr, "[%s] %s: %s\n", gr8_log_level_name(level), subsystem, message);
}

} // namespace detail

bool parse_log_level(std::string_view name, LogLevel& out) noexcept {
    if (name == "error") { out = LogLevel::Error; return true; }
    if (name == "warn")  { out = LogLevel::Warn;  return true; }
    if (name == "info")  { out = LogLevel::Info;  return true; }
    if (name == "debug") { out = LogLevel::Debug; return true; }
    if (name == "trace") { out = LogLevel::Trace; return true; }
    return false;
}

void log_raw(LogLevel level, const char* subsystem, std::string_view message) noexcept {
    if (!log_level_enabled(level)) {
        return;
    }

    gr8_log_callback callback = nullptr;
    void* userdata = nullptr;
    {
        std::lock_guard<std::mutex> lock(g_log_mutex);
        callback = g_log_callback;
        userdata = g_log_userdata;
    }

    // Null-terminate into a local buffer, truncating overlong messages.
    char buffer[LOG_BUFFER_SIZE];
    const size_t len = message.size() < LOG_BUFFER_SIZE ? message.size() : LOG_BUFFER_SIZE - 1;
    std::memcpy(buffer, message.data(), len);
    buffer[len] = '\0';

    const auto c_level = static_cast<gr8_log_level>(level);
    if (callback) {
        callback(c_level, subsystem, buffer, userdata);
    }
#ifndef GR8_LIBRARY_MODE
    else {
        detail::default_log_handler(c_level, subsystem, buffer, nullptr);
    }
#endif
}

void log_printf(LogLevel level, const char* subsystem, const char* fmt, ...) noexcept {
    if (!log_level_enabled(level)) {
        return;
    }

    char buffer[LOG_BUFFER_SIZE];
    va_list args;
    va_start(args, fmt);
    int written = std::vsnprintf(buffer, LOG_BUFFER_SIZE, fmt, args);
    va_end(args);

    if (written < 0) {
        buffer[0] = '\0';
    } else if (static_cast<size_t>(written) >= LOG_BUFFER_SIZE) {
        // Truncated - mark with ellipsis
        buffer[LOG_BUFFER_SIZE - 4] = '.';
        buffer[LOG_BUFFER_SIZE - 3] = '.';
        buffer[LOG_BUFFER_SIZE - 2] = '.';
        buffer[LOG_BUFFER_SIZE - 1] = '\0';
    }

    log_raw(level, subsystem, buffer);
}

} // namespace gr8
