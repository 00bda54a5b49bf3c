#ifndef MONTECARLO_DEBUG_LOG_HPP
#define MONTECARLO_DEBUG_LOG_HPP

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <sstream>
#include <thread>

namespace montecarlo {
namespace debug {

enum class LogLevel {
    Debug,
    Warning
};

// Callback function type for log routing
// The callback receives the level and a formatted string (no newline at end)
using LogCallback = void (*)(LogLevel level, const char* message);

// When null, messages go to stdout (debug) or stderr (warnings)
inline std::atomic<LogCallback> g_log_callback{nullptr};

inline void set_log_callback(LogCallback cb) {
    g_log_callback.store(cb, std::memory_order_release);
}

inline void clear_log_callback() {
    g_log_callback.store(nullptr, std::memory_order_release);
}

inline const char* level_tag(LogLevel level) {
    return level == LogLevel::Warning ? "WARN" : "DEBUG";
}

// Internal: format and emit one message
inline void vlog_output(LogLevel level, const char* fmt, va_list args) {
    char buffer[1024];
    vsnprintf(buffer, sizeof(buffer), fmt, args);

    std::ostringstream oss;
    oss << std::this_thread::get_id();

    char full_message[1100];
    snprintf(full_message, sizeof(full_message), "[%s][T%s] %s", level_tag(level), oss.str().c_str(), buffer);

    LogCallback cb = g_log_callback.load(std::memory_order_acquire);
    if (cb) {
        cb(level, full_message);
    } else if (level == LogLevel::Warning) {
        fprintf(stderr, "%s\n", full_message);
        fflush(stderr);
    } else {
        printf("%s\n", full_message);
        fflush(stdout);
    }
}

inline void log_output(LogLevel level, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog_output(level, fmt, args);
    va_end(args);
}

} // namespace debug
} // namespace montecarlo

// Verbose tracing, compiled out unless MONTECARLO_ENABLE_DEBUG_OUTPUT is defined
#ifdef MONTECARLO_ENABLE_DEBUG_OUTPUT
    #define MONTECARLO_DEBUG_LOG(fmt, ...) \
        ::montecarlo::debug::log_output(::montecarlo::debug::LogLevel::Debug, fmt, ##__VA_ARGS__)
#else
    #define MONTECARLO_DEBUG_LOG(fmt, ...) ((void)0)
#endif

// Diagnostics (clipped weights, retries, fallbacks) are always emitted
#define MONTECARLO_WARN_LOG(fmt, ...) \
    ::montecarlo::debug::log_output(::montecarlo::debug::LogLevel::Warning, fmt, ##__VA_ARGS__)

#endif // MONTECARLO_DEBUG_LOG_HPP
