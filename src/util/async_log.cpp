#include "util/async_log.hpp"

#include <algorithm>
#include <chrono>
#include <cstdarg>
#include <cstring>
#include <new>
#include <system_error>

#include "util/time.hpp"

namespace util {
namespace {
AsyncLogger* global_hot_logger() {
    static AsyncLogger logger;
    return &logger;
}

bool is_power_of_two(std::size_t v) noexcept { return v != 0 && (v & (v - 1)) == 0; }
} // namespace

AsyncLogger::~AsyncLogger() { stop(); }

bool AsyncLogger::start(const Config& cfg) noexcept {
    if (!is_power_of_two(cfg.capacity_pow2) || cfg.capacity_pow2 < 2) {
        return false;
    }
    if (running()) {
        return true;
    }

    config_ = cfg;
    head_.store(0, std::memory_order_relaxed);
    tail_ = 0;
    mask_ = cfg.capacity_pow2 - 1;

    std::unique_ptr<Slot[]> new_slots;
    try {
        new_slots.reset(new Slot[cfg.capacity_pow2]);
    } catch (const std::bad_alloc&) {
        return false;
    }
    for (std::size_t i = 0; i < cfg.capacity_pow2; ++i) {
        new_slots[i].sequence.store(i, std::memory_order_relaxed);
    }
    slots_ = std::move(new_slots);

    if (!cfg.file_path.empty()) {
        sink_ = std::fopen(cfg.file_path.c_str(), "a");
        if (!sink_) {
            sink_ = stderr;
            return false;
        }
        owns_file_ = true;
    } else {
        sink_ = stderr;
        owns_file_ = false;
    }

    stop_.store(false, std::memory_order_release);
    try {
        consumer_ = std::thread([this] { consumer_loop(); });
    } catch (const std::system_error&) {
        stop_.store(true, std::memory_order_release);
        if (owns_file_) {
            std::fclose(sink_);
        }
        owns_file_ = false;
        sink_ = stderr;
        return false;
    }
    return true;
}

void AsyncLogger::stop() noexcept {
    if (stop_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    if (consumer_.joinable()) {
        consumer_.join();
    }
    if (owns_file_ && sink_) {
        std::fclose(sink_);
    }
    sink_ = stderr;
    owns_file_ = false;
}

bool AsyncLogger::try_log(LogLevel lvl, const char* category, const char* msg, std::size_t len) noexcept {
    if (!running() || !slots_) {
        return false;
    }

    std::uint64_t pos = head_.load(std::memory_order_relaxed);
    for (;;) {
        Slot& slot = slots_[pos & mask_];
        const std::uint64_t seq = slot.sequence.load(std::memory_order_acquire);
        const std::int64_t dif = static_cast<std::int64_t>(seq) - static_cast<std::int64_t>(pos);
        if (dif == 0) {
            if (head_.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed, std::memory_order_relaxed)) {
                break;
            }
        } else if (dif < 0) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            return false;
        } else {
            pos = head_.load(std::memory_order_relaxed);
        }
    }

    LogRecord& rec = slots_[pos & mask_].record;
    rec.wall_ns = to_epoch_ns(std::chrono::system_clock::now());
    rec.level = lvl;
    std::memset(rec.category, 0, sizeof(rec.category));
    if (category) {
        std::strncpy(rec.category, category, sizeof(rec.category) - 1);
    }
    rec.message_len = static_cast<std::uint16_t>(std::min<std::size_t>(sizeof(rec.message), len));
    if (rec.message_len > 0) {
        std::memcpy(rec.message, msg, rec.message_len);
    }

    slots_[pos & mask_].sequence.store(pos + 1, std::memory_order_release);
    return true;
}

bool AsyncLogger::try_logf(LogLevel lvl, const char* category, const char* fmt, ...) noexcept {
    if (lvl < log_level()) {
        return true;
    }
    char buffer[sizeof(LogRecord::message)];
    va_list args;
    va_start(args, fmt);
    const int n = std::vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);
    const std::size_t len = n < 0 ? 0u : std::min<std::size_t>(static_cast<std::size_t>(n), sizeof(buffer) - 1);
    if (!running()) {
        util::log(lvl, "[%s] %.*s", category ? category : "", static_cast<int>(len), buffer);
        return true;
    }
    return try_log(lvl, category, buffer, len);
}

bool AsyncLogger::try_pop(LogRecord& out) noexcept {
    Slot& slot = slots_[tail_ & mask_];
    const std::uint64_t seq = slot.sequence.load(std::memory_order_acquire);
    if (static_cast<std::int64_t>(seq) - static_cast<std::int64_t>(tail_ + 1) != 0) {
        return false;
    }
    out = slot.record;
    slot.sequence.store(tail_ + mask_ + 1, std::memory_order_release);
    ++tail_;
    return true;
}

void AsyncLogger::write_record(const LogRecord& rec) noexcept {
    char ts[32];
    format_iso8601(from_epoch_ns(rec.wall_ns), ts, sizeof(ts));
    std::fprintf(sink_, "%s [dmxrec] %s: [%s] ", ts, level_name(rec.level), rec.category);
    if (rec.message_len > 0) {
        std::fwrite(rec.message, 1, rec.message_len, sink_);
    }
    std::fputc('\n', sink_);
}

void AsyncLogger::consumer_loop() noexcept {
    std::size_t since_flush = 0;
    while (running() || tail_ != head_.load(std::memory_order_acquire)) {
        LogRecord rec{};
        if (try_pop(rec)) {
            write_record(rec);
            written_.fetch_add(1, std::memory_order_relaxed);
            ++since_flush;
            if ((config_.flush_on_warn && rec.level >= LogLevel::Warn) ||
                (config_.flush_every > 0 && since_flush >= config_.flush_every)) {
                std::fflush(sink_);
                since_flush = 0;
            }
            continue;
        }
        if (since_flush > 0) {
            std::fflush(sink_);
            since_flush = 0;
        }
        std::this_thread::sleep_for(config_.idle_sleep);
    }
    std::fflush(sink_);
}

AsyncLogger& hot_logger() noexcept { return *global_hot_logger(); }

bool init_hot_logger(const AsyncLogger::Config& cfg) noexcept { return hot_logger().start(cfg); }

void shutdown_hot_logger() noexcept { hot_logger().stop(); }

} // namespace util
