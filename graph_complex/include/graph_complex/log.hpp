#ifndef GRAPH_COMPLEX_LOG_HPP
#define GRAPH_COMPLEX_LOG_HPP

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <sstream>
#include <string>
#include <thread>

namespace graph_complex {
namespace log {

enum class Level : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

inline const char* level_name(Level level) {
    switch (level) {
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warn: return "WARN";
        case Level::Error: return "ERROR";
        case Level::Off: return "OFF";
    }
    return "UNKNOWN";
}

// Callback receives the level and the fully formatted line (no trailing newline).
// When unset, every level goes to stderr; stdout is left to the tools' results.
using LogCallback = void (*)(Level level, const char* message);

inline std::atomic<LogCallback> g_log_callback{nullptr};
inline std::atomic<int> g_log_level{static_cast<int>(Level::Info)};

inline void set_log_callback(LogCallback cb) {
    g_log_callback.store(cb, std::memory_order_release);
}

inline void clear_log_callback() {
    g_log_callback.store(nullptr, std::memory_order_release);
}

inline void set_log_level(Level level) {
    g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

inline Level log_level() {
    return static_cast<Level>(g_log_level.load(std::memory_order_relaxed));
}

inline bool enabled(Level level) {
    return static_cast<int>(level) >= g_log_level.load(std::memory_order_relaxed);
}

inline void vwrite(Level level, const char* fmt, va_list args) {
    char buffer[1024];
    vsnprintf(buffer, sizeof(buffer), fmt, args);

    std::ostringstream oss;
    oss << std::this_thread::get_id();

    char full_message[1100];
    snprintf(full_message, sizeof(full_message), "[%s][T%s] %s",
             level_name(level), oss.str().c_str(), buffer);

    LogCallback cb = g_log_callback.load(std::memory_order_acquire);
    if (cb) {
        cb(level, full_message);
    } else {
        fprintf(stderr, "%s\n", full_message);
        fflush(stderr);
    }
}

inline void write(Level level, const char* fmt, ...) {
    if (!enabled(level)) return;
    va_list args;
    va_start(args, fmt);
    vwrite(level, fmt, args);
    va_end(args);
}

// Debug output bypasses the runtime threshold; it is compiled in only with ENABLE_DEBUG_OUTPUT.
inline void debug_output(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vwrite(Level::Debug, fmt, args);
    va_end(args);
}

} // namespace log
} // namespace graph_complex

#ifdef ENABLE_DEBUG_OUTPUT
    #define GC_DEBUG_LOG(fmt, ...) ::graph_complex::log::debug_output(fmt, ##__VA_ARGS__)
#else
    #define GC_DEBUG_LOG(fmt, ...) ((void)0)
#endif

#define GC_LOG_INFO(fmt, ...) ::graph_complex::log::write(::graph_complex::log::Level::Info, fmt, ##__VA_ARGS__)
#define GC_LOG_WARN(fmt, ...) ::graph_complex::log::write(::graph_complex::log::Level::Warn, fmt, ##__VA_ARGS__)
#define GC_LOG_ERROR(fmt, ...) ::graph_complex::log::write(::graph_complex::log::Level::Error, fmt, ##__VA_ARGS__)

#endif // GRAPH_COMPLEX_LOG_HPP
