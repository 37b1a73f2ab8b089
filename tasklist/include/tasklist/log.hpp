#pragma once
// Logging: leveled printf-style lines on stderr
//
// stdout belongs to the protocol, so every diagnostic goes to stderr.
// Format: [HH:MM:SS.mmm][LEVEL][component] message

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <string>

namespace tasklist {

enum class LogLevel : int {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3
};

namespace detail {

inline std::atomic<int>& log_threshold() {
    static std::atomic<int> level{static_cast<int>(LogLevel::Info)};
    return level;
}

inline std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

inline const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Info: return "INFO";
        case LogLevel::Debug: return "DEBUG";
    }
    return "?";
}

inline void vlog(LogLevel level, const char* component, const char* fmt, va_list args) {
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&now_time_t, &tm);
    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm);

    char msg_buf[1024];
    vsnprintf(msg_buf, sizeof(msg_buf), fmt, args);

    // One fprintf per line so concurrent workers don't interleave
    std::lock_guard<std::mutex> lock(log_mutex());
    std::fprintf(stderr, "[%s.%03d][%s][%s] %s\n",
                 time_buf, static_cast<int>(now_ms.count()),
                 level_name(level), component, msg_buf);
    std::fflush(stderr);
}

} // namespace detail

inline void set_log_level(LogLevel level) {
    detail::log_threshold().store(static_cast<int>(level));
}

inline bool log_enabled(LogLevel level) {
    return static_cast<int>(level) <= detail::log_threshold().load();
}

// Parse "error", "warn", "info", "debug" (also "warning", "trace").
// Returns false and leaves `out` untouched for anything else.
inline bool parse_log_level(const std::string& s, LogLevel& out) {
    if (s == "error") { out = LogLevel::Error; return true; }
    if (s == "warn" || s == "warning") { out = LogLevel::Warn; return true; }
    if (s == "info") { out = LogLevel::Info; return true; }
    if (s == "debug" || s == "trace") { out = LogLevel::Debug; return true; }
    return false;
}

inline void log_error(const char* component, const char* fmt, ...) {
    if (!log_enabled(LogLevel::Error)) return;
    va_list args;
    va_start(args, fmt);
    detail::vlog(LogLevel::Error, component, fmt, args);
    va_end(args);
}

inline void log_warn(const char* component, const char* fmt, ...) {
    if (!log_enabled(LogLevel::Warn)) return;
    va_list args;
    va_start(args, fmt);
    detail::vlog(LogLevel::Warn, component, fmt, args);
    va_end(args);
}

inline void log_info(const char* component, const char* fmt, ...) {
    if (!log_enabled(LogLevel::Info)) return;
    va_list args;
    va_start(args, fmt);
    detail::vlog(LogLevel::Info, component, fmt, args);
    va_end(args);
}

inline void log_debug(const char* component, const char* fmt, ...) {
    if (!log_enabled(LogLevel::Debug)) return;
    va_list args;
    va_start(args, fmt);
    detail::vlog(LogLevel::Debug, component, fmt, args);
    va_end(args);
}

} // namespace tasklist
