#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>
#include <thread>

#include "util/log.hpp"

namespace util {

struct LogRecord {
    std::uint64_t wall_ns{0};
    LogLevel level{LogLevel::Info};
    char category[12]{};
    std::uint16_t message_len{0};
    char message[200]{};
};

// Bounded multi-producer log queue drained by one consumer thread. Producers
// never block: a full queue drops the record and bumps dropped().
class AsyncLogger {
public:
    struct Config {
        std::size_t capacity_pow2{1u << 12};
        bool flush_on_warn{true};
        std::size_t flush_every{64};
        std::string file_path{}; // stderr when empty
        std::chrono::microseconds idle_sleep{200};
    };

    AsyncLogger() = default;
    ~AsyncLogger();

    AsyncLogger(const AsyncLogger&) = delete;
    AsyncLogger& operator=(const AsyncLogger&) = delete;

    bool start(const Config& cfg) noexcept;
    void stop() noexcept;
    bool running() const noexcept { return !stop_.load(std::memory_order_acquire); }

    bool try_log(LogLevel lvl, const char* category, const char* msg, std::size_t len) noexcept;
    bool try_logf(LogLevel lvl, const char* category, const char* fmt, ...) noexcept;

    std::uint64_t dropped() const noexcept { return dropped_.load(std::memory_order_relaxed); }
    std::uint64_t written() const noexcept { return written_.load(std::memory_order_relaxed); }

private:
    struct Slot {
        std::atomic<std::uint64_t> sequence{0};
        LogRecord record{};
    };

    bool try_pop(LogRecord& out) noexcept;
    void consumer_loop() noexcept;
    void write_record(const LogRecord& rec) noexcept;

    std::atomic<std::uint64_t> head_{0};
    std::uint64_t tail_{0};
    std::size_t mask_{0};
    std::unique_ptr<Slot[]> slots_{};

    std::atomic<bool> stop_{true};
    std::thread consumer_{};
    Config config_{};

    FILE* sink_{stderr};
    bool owns_file_{false};

    std::atomic<std::uint64_t> dropped_{0};
    std::atomic<std::uint64_t> written_{0};
};

// Process-wide logger for the inbound packet path. When it has not been
// started, records fall back to the synchronous logger.
AsyncLogger& hot_logger() noexcept;
bool init_hot_logger(const AsyncLogger::Config& cfg) noexcept;
void shutdown_hot_logger() noexcept;

} // namespace util

// Formatting is done on the caller thread; only the write is deferred.
#define LOG_WARM_FMT(LVL, CAT, FMT, ...) ::util::hot_logger().try_logf((LVL), (CAT), (FMT) __VA_OPT__(, __VA_ARGS__))

#define LOG_HOT_DEBUG(CAT, FMT, ...) LOG_WARM_FMT(::util::LogLevel::Debug, (CAT), (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_HOT_INFO(CAT, FMT, ...)  LOG_WARM_FMT(::util::LogLevel::Info,  (CAT), (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_HOT_WARN(CAT, FMT, ...)  LOG_WARM_FMT(::util::LogLevel::Warn,  (CAT), (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_HOT_ERROR(CAT, FMT, ...) LOG_WARM_FMT(::util::LogLevel::Error, (CAT), (FMT) __VA_OPT__(, __VA_ARGS__))
