#ifndef TALLY_DEBUG_LOG_HPP
#define TALLY_DEBUG_LOG_HPP

#include <cstdio>
#include <thread>
#include <sstream>
#include <cstdarg>
#include <atomic>

namespace tally {
namespace debug {

enum class LogLevel : int {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3,
    Off = 4
};

// Callback function type for log output routing
// The callback receives the level and a formatted string (no newline at end)
using LogCallback = void (*)(LogLevel level, const char* message);

// Global log callback - when null, output goes to stdout (stderr for errors)
inline std::atomic<LogCallback> g_log_callback{nullptr};

// Messages below this level are dropped
inline std::atomic<int> g_log_threshold{static_cast<int>(LogLevel::Warning)};

inline void set_log_callback(LogCallback cb) {
    g_log_callback.store(cb, std::memory_order_release);
}

inline void clear_log_callback() {
    g_log_callback.store(nullptr, std::memory_order_release);
}

inline void set_log_level(LogLevel level) {
    g_log_threshold.store(static_cast<int>(level), std::memory_order_release);
}

inline LogLevel get_log_level() {
    return static_cast<LogLevel>(g_log_threshold.load(std::memory_order_acquire));
}

inline bool log_enabled(LogLevel level) {
    return static_cast<int>(level) >= g_log_threshold.load(std::memory_order_acquire);
}

inline const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off: return "OFF";
    }
    return "?";
}

// Internal: format and output a log message
inline void log_output(LogLevel level, const char* fmt, ...) {
    if (!log_enabled(level)) {
        return;
    }

    char buffer[1024];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);

    // Add thread ID prefix
    std::ostringstream oss;
    oss << std::this_thread::get_id();

    char full_message[1100];
    snprintf(full_message, sizeof(full_message), "[%s][T%s] %s",
             level_name(level), oss.str().c_str(), buffer);

    LogCallback cb = g_log_callback.load(std::memory_order_acquire);
    if (cb) {
        cb(level, full_message);
    } else if (level == LogLevel::Error) {
        fprintf(stderr, "%s\n", full_message);
        fflush(stderr);
    } else {
        printf("%s\n", full_message);
        fflush(stdout);
    }
}

} // namespace debug
} // namespace tally

#define TALLY_LOG(level, fmt, ...) ::tally::debug::log_output(::tally::debug::LogLevel::level, fmt, ##__VA_ARGS__)

// Hot-path tracing - compiled out unless TALLY_ENABLE_DEBUG_OUTPUT is defined
#ifdef TALLY_ENABLE_DEBUG_OUTPUT
    #define TALLY_DEBUG_LOG(fmt, ...) ::tally::debug::log_output(::tally::debug::LogLevel::Debug, fmt, ##__VA_ARGS__)
#else
    #define TALLY_DEBUG_LOG(fmt, ...) ((void)0)
#endif

#endif // TALLY_DEBUG_LOG_HPP
