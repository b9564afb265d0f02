#include "ingest/recorder.hpp"

#include "util/async_log.hpp"
#include "util/log.hpp"
#include "util/time.hpp"

namespace ingest {
namespace {

constexpr bool is_power_of_two(std::uint64_t n) noexcept { return n != 0 && (n & (n - 1)) == 0; }

} // namespace

Recorder::Recorder() : Recorder(RecorderConfig{}) {}

Recorder::Recorder(RecorderConfig cfg)
    : cfg_(std::move(cfg))
    , ring_(std::make_unique<Ring>())
    , steady_clock_(cfg_.steady_clock ? std::move(cfg_.steady_clock) : std::make_unique<util::SteadyClock>())
    , writer_(cfg_.writer) {
    scratch_.data.reserve(core::max_channels);
    if (cfg_.batch_records == 0) {
        cfg_.batch_records = 1;
    }
}

Recorder::~Recorder() {
    if (active_.load(std::memory_order_acquire)) {
        std::string error;
        if (stop(error) != core::ErrorCode::Ok) {
            util::log(util::LogLevel::Error, "Recorder stop on destruction failed: %s", error.c_str());
        }
    }
}

core::ErrorCode Recorder::start(const std::filesystem::path& path,
                                const core::RecordingMetadata& metadata,
                                std::string& error) {
    if (active_.load(std::memory_order_acquire) || writer_thread_.joinable()) {
        error = "already recording to " + path_.string();
        return core::ErrorCode::InvalidState;
    }
    discard_pending();
    auto rc = writer_.open(path, error);
    if (rc != core::ErrorCode::Ok) {
        return rc;
    }
    rc = writer_.append_metadata(metadata, error);
    if (rc != core::ErrorCode::Ok) {
        std::string close_error;
        if (writer_.close(close_error) != core::ErrorCode::Ok) {
            util::log(util::LogLevel::Warn, "closing %s after metadata failure: %s",
                      path.string().c_str(), close_error.c_str());
        }
        return rc;
    }
    path_ = path;
    last_error_.clear();
    write_failed_.store(false, std::memory_order_relaxed);
    stop_writer_.store(false, std::memory_order_relaxed);
    session_.fetch_add(1, std::memory_order_release);
    writer_thread_ = std::thread(&Recorder::writer_loop, this);
    active_.store(true, std::memory_order_release);
    util::log(util::LogLevel::Info, "recording started: %s (%zu universes)",
              path.string().c_str(), metadata.universes.size());
    return core::ErrorCode::Ok;
}

core::ErrorCode Recorder::stop(std::string& error) {
    if (!active_.exchange(false, std::memory_order_acq_rel)) {
        error = "not recording";
        return core::ErrorCode::InvalidState;
    }
    const auto deadline = steady_clock_->now() + cfg_.shutdown_grace;
    while (ring_->size_approx() > 0 && steady_clock_->now() < deadline &&
           !write_failed_.load(std::memory_order_acquire)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    stop_writer_.store(true, std::memory_order_release);
    if (writer_thread_.joinable()) {
        writer_thread_.join();
    }
    discard_pending();

    std::string close_error;
    const auto close_rc = writer_.close(close_error);
    const auto s = stats();
    if (write_failed_.load(std::memory_order_acquire)) {
        error = last_error_;
        return core::ErrorCode::IoError;
    }
    if (close_rc != core::ErrorCode::Ok) {
        error = close_error;
        return close_rc;
    }
    util::log(util::LogLevel::Info, "recording saved: %s (%llu packets written, %llu dropped)",
              path_.string().c_str(), static_cast<unsigned long long>(s.written),
              static_cast<unsigned long long>(s.dropped()));
    return core::ErrorCode::Ok;
}

bool Recorder::on_packet(const transport::InboundPacket& packet) noexcept {
    return submit(packet.arrival, packet.address, packet.data);
}

bool Recorder::submit(core::WallTime timestamp,
                      const core::Address& address,
                      std::span<const std::uint8_t> data) noexcept {
    if (!active_.load(std::memory_order_acquire)) {
        return false;
    }
    if (data.empty() || data.size() > core::max_channels) {
        const auto n = metrics_.drops_malformed.fetch_add(1, std::memory_order_relaxed) + 1;
        if (is_power_of_two(n)) {
            LOG_HOT_WARN("recorder", "dropping malformed packet len=%zu (%llu so far)",
                         data.size(), static_cast<unsigned long long>(n));
        }
        return false;
    }
    const auto tag = session_.load(std::memory_order_acquire);
    if (!ring_->try_push(tag, util::to_epoch_ns(timestamp), address, data)) {
        const auto n = metrics_.drops_queue_full.fetch_add(1, std::memory_order_relaxed) + 1;
        if (is_power_of_two(n)) {
            LOG_HOT_WARN("recorder", "capture queue full, %llu packets dropped", static_cast<unsigned long long>(n));
        }
        return false;
    }
    metrics_.submitted.fetch_add(1, std::memory_order_relaxed);
    return true;
}

RecorderStats Recorder::stats() const noexcept {
    RecorderStats s;
    s.submitted = metrics_.submitted.load(std::memory_order_relaxed);
    s.written = metrics_.written.load(std::memory_order_relaxed);
    s.drops_queue_full = metrics_.drops_queue_full.load(std::memory_order_relaxed);
    s.drops_malformed = metrics_.drops_malformed.load(std::memory_order_relaxed);
    s.drops_stale = metrics_.drops_stale.load(std::memory_order_relaxed);
    s.drops_write_failed = metrics_.drops_write_failed.load(std::memory_order_relaxed);
    s.write_errors = metrics_.write_errors.load(std::memory_order_relaxed);
    return s;
}

void Recorder::writer_loop() {
    while (true) {
        const std::size_t written = write_batch();
        if (written > 0) {
            continue;
        }
        if (stop_writer_.load(std::memory_order_acquire) && ring_->size_approx() == 0) {
            break;
        }
        std::this_thread::sleep_for(cfg_.idle_sleep);
    }
}

std::size_t Recorder::write_batch() {
    const auto session = session_.load(std::memory_order_acquire);
    std::size_t popped = 0;
    std::size_t appended = 0;
    std::string error;
    while (popped < cfg_.batch_records) {
        const persist::CapturedPacket* slot = ring_->front();
        if (!slot) {
            break;
        }
        ++popped;
        if (slot->tag != session) {
            metrics_.drops_stale.fetch_add(1, std::memory_order_relaxed);
            ring_->release();
            continue;
        }
        if (write_failed_.load(std::memory_order_relaxed)) {
            metrics_.drops_write_failed.fetch_add(1, std::memory_order_relaxed);
            ring_->release();
            continue;
        }
        scratch_.timestamp = util::from_epoch_ns(slot->timestamp_ns);
        scratch_.address = slot->address;
        const auto payload = slot->payload();
        scratch_.data.assign(payload.begin(), payload.end());
        ring_->release();

        if (writer_.append_packet(scratch_, error) != core::ErrorCode::Ok) {
            metrics_.write_errors.fetch_add(1, std::memory_order_relaxed);
            metrics_.drops_write_failed.fetch_add(1, std::memory_order_relaxed);
            last_error_ = error;
            write_failed_.store(true, std::memory_order_release);
            if (rate_limited_log(last_log_error_)) {
                util::log(util::LogLevel::Error, "recording write failed: %s", error.c_str());
            }
            continue;
        }
        ++appended;
    }
    if (appended > 0) {
        if (writer_.flush(error) != core::ErrorCode::Ok) {
            metrics_.write_errors.fetch_add(1, std::memory_order_relaxed);
            last_error_ = error;
            write_failed_.store(true, std::memory_order_release);
            if (rate_limited_log(last_log_error_)) {
                util::log(util::LogLevel::Error, "recording flush failed: %s", error.c_str());
            }
        } else {
            metrics_.written.fetch_add(appended, std::memory_order_relaxed);
        }
    }
    return popped;
}

void Recorder::discard_pending() noexcept {
    while (ring_->front()) {
        ring_->release();
        metrics_.drops_stale.fetch_add(1, std::memory_order_relaxed);
    }
}

bool Recorder::rate_limited_log(std::chrono::steady_clock::time_point& last) {
    const auto now_ts = steady_clock_->now();
    if (last == std::chrono::steady_clock::time_point{} || now_ts - last >= cfg_.log_rate_limit) {
        last = now_ts;
        return true;
    }
    return false;
}

} // namespace ingest
