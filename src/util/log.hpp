#pragma once

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>

namespace util {

enum class LogLevel { Trace, Debug, Info, Warn, Error, Fatal };

inline const char* level_name(LogLevel lvl) noexcept {
    switch (lvl) {
    case LogLevel::Trace: return "trace";
    case LogLevel::Debug: return "debug";
    case LogLevel::Info: return "info";
    case LogLevel::Warn: return "warn";
    case LogLevel::Error: return "error";
    case LogLevel::Fatal: return "fatal";
    }
    return "unknown";
}

// Formats tp as 2024-04-04T23:07:07.123Z into buf. Returns buf.
inline const char* format_iso8601(std::chrono::system_clock::time_point tp, char* buf, std::size_t len) noexcept {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::snprintf(buf, len, "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms));
    return buf;
}

namespace detail {
inline std::mutex& slow_log_mutex() {
    static std::mutex mtx;
    return mtx;
}

inline std::atomic<LogLevel>& min_level() {
    static std::atomic<LogLevel> lvl{LogLevel::Info};
    return lvl;
}

inline void slow_log_impl(LogLevel lvl, const char* fmt, va_list args) {
    if (lvl < min_level().load(std::memory_order_relaxed)) {
        return;
    }
    char ts[32];
    format_iso8601(std::chrono::system_clock::now(), ts, sizeof(ts));
    std::lock_guard<std::mutex> lock(slow_log_mutex());
    std::fprintf(stderr, "%s [dmxrec] %s: ", ts, level_name(lvl));
    std::vfprintf(stderr, fmt, args);
    std::fprintf(stderr, "\n");
}
} // namespace detail

inline void set_log_level(LogLevel lvl) noexcept { detail::min_level().store(lvl, std::memory_order_relaxed); }
inline LogLevel log_level() noexcept { return detail::min_level().load(std::memory_order_relaxed); }

class SyncLogger {
public:
    static void log(LogLevel lvl, const char* fmt, ...) {
        va_list args;
        va_start(args, fmt);
        detail::slow_log_impl(lvl, fmt, args);
        va_end(args);
    }
};

inline void log(LogLevel lvl, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    detail::slow_log_impl(lvl, fmt, args);
    va_end(args);
}

} // namespace util

#define LOG_SLOW_TRACE(FMT, ...) ::util::SyncLogger::log(::util::LogLevel::Trace, (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_SLOW_DEBUG(FMT, ...) ::util::SyncLogger::log(::util::LogLevel::Debug, (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_SLOW_INFO(FMT, ...)  ::util::SyncLogger::log(::util::LogLevel::Info,  (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_SLOW_WARN(FMT, ...)  ::util::SyncLogger::log(::util::LogLevel::Warn,  (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_SLOW_ERROR(FMT, ...) ::util::SyncLogger::log(::util::LogLevel::Error, (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_SLOW_FATAL(FMT, ...) ::util::SyncLogger::log(::util::LogLevel::Fatal, (FMT) __VA_OPT__(, __VA_ARGS__))
