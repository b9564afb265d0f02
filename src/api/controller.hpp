#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "api/playback_scheduler.hpp"
#include "core/error.hpp"
#include "core/idle_watchdog.hpp"
#include "core/player_config.hpp"
#include "ingest/passthrough_router.hpp"
#include "ingest/recorder.hpp"
#include "transport/output_set.hpp"
#include "transport/transport.hpp"
#include "util/clock.hpp"

namespace api {

struct ControllerOptions {
    SchedulerConfig scheduler{};
    ingest::RecorderConfig recorder{};
    std::chrono::milliseconds highlight_step{std::chrono::milliseconds{500}};
    int highlight_blinks{3};
    std::unique_ptr<util::SystemClock> system_clock{};
    // Idle watchdog and highlight blinking.
    std::unique_ptr<util::SteadyClock> steady_clock{};
    // Playback pacing.
    std::unique_ptr<util::SteadyClock> playback_clock{};
};

struct ControllerStatus {
    bool recording{false};
    bool playing{false};
    bool passthrough{false};
    std::uint32_t fps{0};
    std::filesystem::path recording_path;
    std::filesystem::path playing_path;
    std::size_t playing_frames{0};
    std::size_t outputs{0};
    ingest::RecorderStats recorder{};
    SchedulerStats scheduler{};
    ingest::PassthroughStats passthrough_stats{};
    transport::OutputSetStats output_stats{};
};

// Owns one player instance: outputs, recorder, passthrough, playback and the
// idle blackout. Operator actions may be called from any thread; on_inbound()
// and tick() are called from the transport poll thread.
class Controller {
public:
    Controller(core::PlayerConfig cfg, transport::ITransport& transport, ControllerOptions opts = {});
    ~Controller();

    Controller(const Controller&) = delete;
    Controller& operator=(const Controller&) = delete;

    // Validates the configuration, creates the senders and starts listening.
    core::ErrorCode init(std::string& error);

    void on_inbound(const transport::InboundPacket& packet);

    // Fires the idle blackout when due. Returns true if it fired.
    bool tick();

    core::ErrorCode start_recording(std::string& error);
    core::ErrorCode stop_recording(std::string& error);

    // Loads, frames and loop-fades `name` and plays it, replacing any running
    // playback. On failure the running playback is left alone and
    // `available` receives the recordings that could be played instead.
    core::ErrorCode play(const std::string& name,
                         std::string& error,
                         std::vector<std::filesystem::path>* available = nullptr);
    core::ErrorCode stop_playback(std::string& error);

    bool toggle_passthrough();
    core::ErrorCode set_fps(std::uint32_t fps, std::string& error);
    transport::TransmitResult blackout();
    std::vector<std::filesystem::path> list_recordings() const;

    // Blinks every output bound to `universes` full on/off on a worker thread.
    core::ErrorCode highlight(const std::vector<std::uint32_t>& universes, std::string& error);
    bool highlighting() const noexcept { return highlighting_.load(std::memory_order_acquire); }
    void wait_highlight();

    std::string describe_config() const;
    ControllerStatus status() const;

    // Stops playback, recording and the highlight worker.
    void shutdown();

    const core::PlayerConfig& config() const noexcept { return cfg_; }
    transport::OutputSet& outputs() noexcept { return outputs_; }

private:
    std::filesystem::path resolve(const std::string& name) const;
    std::filesystem::path next_recording_path() const;
    void touch();
    void highlight_loop(std::vector<std::uint32_t> universes);

    core::PlayerConfig cfg_;
    transport::ITransport& transport_;
    ControllerOptions opts_;
    std::unique_ptr<util::SystemClock> system_clock_;
    std::unique_ptr<util::SteadyClock> steady_clock_;

    transport::OutputSet outputs_;
    ingest::Recorder recorder_;
    PlaybackScheduler scheduler_;
    ingest::PassthroughRouter passthrough_;

    mutable std::mutex mutex_;
    core::IdleWatchdog watchdog_;
    std::filesystem::path playing_path_;

    std::thread highlight_thread_;
    std::atomic<bool> highlighting_{false};
    std::atomic<bool> shutting_down_{false};
};

} // namespace api
