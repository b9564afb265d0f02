#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "core/error.hpp"
#include "core/packet.hpp"
#include "transport/output_set.hpp"
#include "util/clock.hpp"

namespace api {

struct SchedulerConfig {
    // Longest single sleep; bounds how long stop() waits during a long gap.
    std::chrono::milliseconds max_sleep_slice{std::chrono::milliseconds{20}};
    // Stop after this many passes over the frames. 0 loops forever.
    std::uint64_t max_loops{0};
};

struct SchedulerStats {
    std::uint64_t sessions{0};
    std::uint64_t frames_sent{0};
    std::uint64_t loops{0};
    std::uint64_t late_frames{0};
    std::uint64_t transmit_failures{0};
};

// Real-time playback loop.
//
//   Idle --start--> Playing --stop--> Idle
//   Playing --start--> (stop, blackout) --> Playing
//
// Each iteration transmits one frame to every matching output, then sleeps
// until frame start + the recorded gap to the next frame. Sleep targets come
// from the recorded delays, never from a running clock, so drift does not
// accumulate. Wrapping from the last frame to the first waits one frame
// interval at the current rate.
class PlaybackScheduler {
public:
    explicit PlaybackScheduler(transport::OutputSet& outputs,
                               SchedulerConfig cfg = {},
                               std::unique_ptr<util::SteadyClock> clock = std::make_unique<util::SteadyClock>());
    ~PlaybackScheduler();

    PlaybackScheduler(const PlaybackScheduler&) = delete;
    PlaybackScheduler& operator=(const PlaybackScheduler&) = delete;

    // Starts playing `frames` on the playback thread. An empty set or bad
    // rate is rejected without touching the running session.
    core::ErrorCode start(core::FrameSet frames, std::uint32_t fps, std::string& error);

    // Plays on the calling thread until stop() or max_loops.
    core::ErrorCode run(core::FrameSet frames, std::uint32_t fps, std::string& error);

    // Returns once the playback thread has exited; no frame is sent after.
    void stop();

    core::ErrorCode set_fps(std::uint32_t fps, std::string& error);
    std::uint32_t fps() const noexcept { return fps_.load(std::memory_order_relaxed); }

    bool playing() const noexcept { return playing_.load(std::memory_order_acquire); }
    const std::atomic<bool>& playing_flag() const noexcept { return playing_; }
    std::size_t frame_count() const noexcept { return frame_count_.load(std::memory_order_relaxed); }

    SchedulerStats stats() const noexcept;

private:
    core::ErrorCode check(const core::FrameSet& frames, std::uint32_t fps, std::string& error) const;
    void play_loop(const core::FrameSet& frames);
    void sleep_until(util::SteadyClock::time_point deadline);

    transport::OutputSet& outputs_;
    SchedulerConfig cfg_;
    std::unique_ptr<util::SteadyClock> clock_;

    std::mutex control_mutex_;
    std::thread thread_;
    std::unique_ptr<core::FrameSet> session_;
    std::atomic<bool> stop_flag_{false};
    std::atomic<bool> playing_{false};
    std::atomic<std::uint32_t> fps_{35};
    std::atomic<std::size_t> frame_count_{0};

    std::atomic<std::uint64_t> sessions_{0};
    std::atomic<std::uint64_t> frames_sent_{0};
    std::atomic<std::uint64_t> loops_{0};
    std::atomic<std::uint64_t> late_frames_{0};
    std::atomic<std::uint64_t> transmit_failures_{0};
};

} // namespace api
