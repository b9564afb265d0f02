#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <thread>

#include "core/error.hpp"
#include "core/packet.hpp"
#include "persist/capture_ring.hpp"
#include "persist/recording_writer.hpp"
#include "transport/transport.hpp"
#include "util/clock.hpp"

namespace ingest {

struct RecorderConfig {
    std::size_t batch_records{64};
    std::chrono::milliseconds idle_sleep{std::chrono::milliseconds{1}};
    std::chrono::milliseconds shutdown_grace{std::chrono::milliseconds{5000}};
    std::chrono::milliseconds log_rate_limit{std::chrono::milliseconds{10000}};
    persist::RecordingWriterOptions writer{};
    std::unique_ptr<util::SteadyClock> steady_clock{};
};

struct RecorderMetrics {
    std::atomic<std::uint64_t> submitted{0};
    std::atomic<std::uint64_t> written{0};
    std::atomic<std::uint64_t> drops_queue_full{0};
    std::atomic<std::uint64_t> drops_malformed{0};
    std::atomic<std::uint64_t> drops_stale{0}; // captured for an earlier session
    std::atomic<std::uint64_t> drops_write_failed{0};
    std::atomic<std::uint64_t> write_errors{0};
};

struct RecorderStats {
    std::uint64_t submitted{0};
    std::uint64_t written{0};
    std::uint64_t drops_queue_full{0};
    std::uint64_t drops_malformed{0};
    std::uint64_t drops_stale{0};
    std::uint64_t drops_write_failed{0};
    std::uint64_t write_errors{0};

    std::uint64_t dropped() const noexcept {
        return drops_queue_full + drops_malformed + drops_stale + drops_write_failed;
    }
};

// Streams inbound packets into a RecordingWriter without blocking the caller.
// on_packet() copies the packet into a ring; a writer thread encodes,
// compresses and sync-flushes each batch, so a crash loses at most the
// batch in flight.
class Recorder {
public:
    Recorder();
    explicit Recorder(RecorderConfig cfg);
    ~Recorder();

    Recorder(const Recorder&) = delete;
    Recorder& operator=(const Recorder&) = delete;

    // Opens `path`, writes the metadata record and starts the writer thread.
    core::ErrorCode start(const std::filesystem::path& path,
                          const core::RecordingMetadata& metadata,
                          std::string& error);

    // Drains what was captured, finalizes the file and joins the writer thread.
    core::ErrorCode stop(std::string& error);

    // Inbound path. Never blocks; returns false if the packet was dropped.
    bool on_packet(const transport::InboundPacket& packet) noexcept;
    bool submit(core::WallTime timestamp, const core::Address& address, std::span<const std::uint8_t> data) noexcept;

    bool recording() const noexcept { return active_.load(std::memory_order_acquire); }
    const std::filesystem::path& path() const noexcept { return path_; }
    RecorderStats stats() const noexcept;

private:
    using Ring = persist::CaptureRing<4096>;

    void writer_loop();
    std::size_t write_batch();
    void discard_pending() noexcept;
    bool rate_limited_log(std::chrono::steady_clock::time_point& last);

    RecorderConfig cfg_;
    RecorderMetrics metrics_;
    std::unique_ptr<Ring> ring_;
    std::unique_ptr<util::SteadyClock> steady_clock_;
    persist::RecordingWriter writer_;
    core::Packet scratch_;

    std::thread writer_thread_;
    std::atomic<bool> active_{false};
    std::atomic<bool> stop_writer_{false};
    std::atomic<bool> write_failed_{false};
    std::atomic<std::uint32_t> session_{0};
    std::filesystem::path path_;
    std::string last_error_;
    std::chrono::steady_clock::time_point last_log_error_{};
};

} // namespace ingest
