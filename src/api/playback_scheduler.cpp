#include "api/playback_scheduler.hpp"

#include <algorithm>

#include "core/frame_builder.hpp"
#include "core/player_config.hpp"
#include "util/log.hpp"

namespace api {

PlaybackScheduler::PlaybackScheduler(transport::OutputSet& outputs,
                                     SchedulerConfig cfg,
                                     std::unique_ptr<util::SteadyClock> clock)
    : outputs_(outputs), cfg_(cfg), clock_(std::move(clock)) {
    if (cfg_.max_sleep_slice.count() <= 0) {
        cfg_.max_sleep_slice = std::chrono::milliseconds{20};
    }
}

PlaybackScheduler::~PlaybackScheduler() { stop(); }

core::ErrorCode PlaybackScheduler::check(const core::FrameSet& frames, std::uint32_t fps, std::string& error) const {
    if (frames.empty()) {
        error = "recording has no frames";
        return core::ErrorCode::EmptyRecording;
    }
    if (frames.delays.size() != frames.frames.size()) {
        error = "delay count " + std::to_string(frames.delays.size()) + " does not match frame count " +
                std::to_string(frames.frames.size());
        return core::ErrorCode::InvalidArgument;
    }
    if (fps < core::min_fps || fps > core::max_fps) {
        error = "fps must be between " + std::to_string(core::min_fps) + " and " + std::to_string(core::max_fps);
        return core::ErrorCode::InvalidArgument;
    }
    return core::ErrorCode::Ok;
}

core::ErrorCode PlaybackScheduler::start(core::FrameSet frames, std::uint32_t fps, std::string& error) {
    const auto rc = check(frames, fps, error);
    if (rc != core::ErrorCode::Ok) {
        return rc;
    }
    std::lock_guard<std::mutex> lock(control_mutex_);
    if (thread_.joinable()) {
        const bool was_playing = playing_.load(std::memory_order_acquire);
        stop_flag_.store(true, std::memory_order_release);
        thread_.join();
        playing_.store(false, std::memory_order_release);
        if (was_playing) {
            util::log(util::LogLevel::Info, "replacing running playback");
        }
        const auto res = outputs_.blackout();
        if (!res.ok()) {
            util::log(util::LogLevel::Warn, "blackout before replacement: %zu of %zu outputs failed",
                      res.failed, res.matched);
        }
    }
    session_ = std::make_unique<core::FrameSet>(std::move(frames));
    fps_.store(fps, std::memory_order_relaxed);
    frame_count_.store(session_->size(), std::memory_order_relaxed);
    stop_flag_.store(false, std::memory_order_release);
    playing_.store(true, std::memory_order_release);
    sessions_.fetch_add(1, std::memory_order_relaxed);
    thread_ = std::thread([this, session = session_.get()] {
        play_loop(*session);
        playing_.store(false, std::memory_order_release);
    });
    return core::ErrorCode::Ok;
}

core::ErrorCode PlaybackScheduler::run(core::FrameSet frames, std::uint32_t fps, std::string& error) {
    const auto rc = check(frames, fps, error);
    if (rc != core::ErrorCode::Ok) {
        return rc;
    }
    if (playing_.exchange(true, std::memory_order_acq_rel)) {
        error = "playback already running";
        return core::ErrorCode::InvalidState;
    }
    fps_.store(fps, std::memory_order_relaxed);
    frame_count_.store(frames.size(), std::memory_order_relaxed);
    stop_flag_.store(false, std::memory_order_release);
    sessions_.fetch_add(1, std::memory_order_relaxed);
    play_loop(frames);
    playing_.store(false, std::memory_order_release);
    return core::ErrorCode::Ok;
}

void PlaybackScheduler::stop() {
    std::lock_guard<std::mutex> lock(control_mutex_);
    stop_flag_.store(true, std::memory_order_release);
    if (thread_.joinable()) {
        thread_.join();
        playing_.store(false, std::memory_order_release);
        session_.reset();
        frame_count_.store(0, std::memory_order_relaxed);
    }
}

core::ErrorCode PlaybackScheduler::set_fps(std::uint32_t fps, std::string& error) {
    if (fps < core::min_fps || fps > core::max_fps) {
        error = "fps must be between " + std::to_string(core::min_fps) + " and " + std::to_string(core::max_fps);
        return core::ErrorCode::InvalidArgument;
    }
    fps_.store(fps, std::memory_order_relaxed);
    return core::ErrorCode::Ok;
}

SchedulerStats PlaybackScheduler::stats() const noexcept {
    SchedulerStats s;
    s.sessions = sessions_.load(std::memory_order_relaxed);
    s.frames_sent = frames_sent_.load(std::memory_order_relaxed);
    s.loops = loops_.load(std::memory_order_relaxed);
    s.late_frames = late_frames_.load(std::memory_order_relaxed);
    s.transmit_failures = transmit_failures_.load(std::memory_order_relaxed);
    return s;
}

void PlaybackScheduler::play_loop(const core::FrameSet& frames) {
    const std::size_t n = frames.size();
    std::uint64_t session_loops = 0;
    std::size_t i = 0;
    util::log(util::LogLevel::Info, "playing %zu frames at %u fps", n, fps_.load(std::memory_order_relaxed));
    while (!stop_flag_.load(std::memory_order_acquire)) {
        const auto frame_start = clock_->now();
        for (const auto& packet : frames.frames[i].packets) {
            const auto res = outputs_.transmit(packet);
            if (res.failed > 0) {
                transmit_failures_.fetch_add(res.failed, std::memory_order_relaxed);
            }
        }
        frames_sent_.fetch_add(1, std::memory_order_relaxed);

        std::size_t next = i + 1;
        std::chrono::nanoseconds gap{0};
        if (next == n) {
            next = 0;
            ++session_loops;
            loops_.fetch_add(1, std::memory_order_relaxed);
            if (cfg_.max_loops != 0 && session_loops >= cfg_.max_loops) {
                break;
            }
            gap = core::frame_interval(fps_.load(std::memory_order_relaxed));
        } else {
            gap = frames.delays[next];
        }

        const auto deadline = frame_start + std::chrono::duration_cast<util::SteadyClock::duration>(gap);
        if (clock_->now() > deadline) {
            late_frames_.fetch_add(1, std::memory_order_relaxed);
        } else {
            sleep_until(deadline);
        }
        i = next;
    }
    util::log(util::LogLevel::Info, "playback stopped after %llu loops",
              static_cast<unsigned long long>(session_loops));
}

void PlaybackScheduler::sleep_until(util::SteadyClock::time_point deadline) {
    const auto slice = std::chrono::duration_cast<util::SteadyClock::duration>(cfg_.max_sleep_slice);
    while (!stop_flag_.load(std::memory_order_acquire)) {
        const auto now = clock_->now();
        if (now >= deadline) {
            return;
        }
        clock_->sleep_until(std::min(deadline, now + slice));
    }
}

} // namespace api
