#include "api/controller.hpp"

#include <algorithm>
#include <cstdio>
#include <ctime>
#include <sstream>

#include "core/frame_builder.hpp"
#include "core/loop_fader.hpp"
#include "persist/config_loader.hpp"
#include "persist/recording_format.hpp"
#include "persist/recording_reader.hpp"
#include "persist/recording_scan.hpp"
#include "util/log.hpp"

namespace api {
namespace {

std::string join_universes(const std::vector<std::uint32_t>& universes) {
    std::string out;
    for (std::size_t i = 0; i < universes.size(); ++i) {
        if (i != 0) {
            out += ", ";
        }
        out += std::to_string(universes[i]);
    }
    return out.empty() ? "none" : out;
}

std::string recording_stem(std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d-%02d-%02d-%02d",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec);
    return buf;
}

} // namespace

Controller::Controller(core::PlayerConfig cfg, transport::ITransport& transport, ControllerOptions opts)
    : cfg_(std::move(cfg))
    , transport_(transport)
    , opts_(std::move(opts))
    , system_clock_(opts_.system_clock ? std::move(opts_.system_clock) : std::make_unique<util::SystemClock>())
    , steady_clock_(opts_.steady_clock ? std::move(opts_.steady_clock) : std::make_unique<util::SteadyClock>())
    , recorder_(std::move(opts_.recorder))
    , scheduler_(outputs_,
                 opts_.scheduler,
                 opts_.playback_clock ? std::move(opts_.playback_clock) : std::make_unique<util::SteadyClock>())
    , passthrough_(outputs_, scheduler_.playing_flag(), cfg_.passthrough)
    , watchdog_(cfg_.idle_timeout) {}

Controller::~Controller() { shutdown(); }

core::ErrorCode Controller::init(std::string& error) {
    auto rc = persist::validate_player_config(cfg_, error);
    if (rc != core::ErrorCode::Ok) {
        return rc;
    }
    rc = outputs_.configure(transport_, cfg_.outputs, error);
    if (rc != core::ErrorCode::Ok) {
        return rc;
    }
    std::vector<core::Address> inbound;
    inbound.reserve(cfg_.universes.size());
    for (const auto u : cfg_.universes) {
        inbound.push_back(core::map_universe(u));
    }
    rc = transport_.listen(inbound, error);
    if (rc != core::ErrorCode::Ok) {
        return rc;
    }
    util::log(util::LogLevel::Info, "senders initialized: %zu", outputs_.size());
    util::log(util::LogLevel::Info, "listeners initialized: %s", join_universes(cfg_.universes).c_str());
    touch();
    return core::ErrorCode::Ok;
}

void Controller::touch() {
    std::lock_guard<std::mutex> lock(mutex_);
    watchdog_.touch(steady_clock_->now());
}

void Controller::on_inbound(const transport::InboundPacket& packet) {
    touch();
    if (scheduler_.playing()) {
        return;
    }
    passthrough_.on_packet(packet);
    if (recorder_.recording()) {
        recorder_.on_packet(packet);
    }
}

bool Controller::tick() {
    bool fire = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const bool playing = scheduler_.playing();
        const bool busy = recorder_.recording() || playing;
        const auto now = steady_clock_->now();
        if (!playing && !playing_path_.empty()) {
            // Playback ran out on its own (max_loops); idle time starts now.
            playing_path_.clear();
            watchdog_.touch(now);
        }
        fire = watchdog_.poll(now, busy);
    }
    if (!fire) {
        return false;
    }
    util::log(util::LogLevel::Info, "timeout detected, blacking out %zu outputs", outputs_.size());
    const auto res = outputs_.blackout();
    if (!res.ok()) {
        util::log(util::LogLevel::Warn, "idle blackout: %zu of %zu outputs failed", res.failed, res.matched);
    }
    return true;
}

std::filesystem::path Controller::next_recording_path() const {
    const std::filesystem::path dir(cfg_.recordings_dir);
    const auto stem = recording_stem(system_clock_->now());
    const std::string ext(persist::recording_extension);
    auto candidate = dir / (stem + ext);
    std::error_code ec;
    for (int n = 1; std::filesystem::exists(candidate, ec); ++n) {
        candidate = dir / (stem + "-" + std::to_string(n) + ext);
    }
    return candidate;
}

core::ErrorCode Controller::start_recording(std::string& error) {
    if (recorder_.recording()) {
        error = "already recording to " + recorder_.path().string();
        return core::ErrorCode::InvalidState;
    }
    std::error_code ec;
    std::filesystem::create_directories(cfg_.recordings_dir, ec);
    if (ec) {
        error = "cannot create " + cfg_.recordings_dir + ": " + ec.message();
        return core::ErrorCode::IoError;
    }
    const auto path = next_recording_path();
    core::RecordingMetadata meta;
    meta.name = path.filename().string();
    meta.created_at = system_clock_->now();
    meta.universes = cfg_.universes;
    return recorder_.start(path, meta, error);
}

core::ErrorCode Controller::stop_recording(std::string& error) {
    const auto rc = recorder_.stop(error);
    touch();
    return rc;
}

std::filesystem::path Controller::resolve(const std::string& name) const {
    std::filesystem::path p(name);
    if (p.is_absolute()) {
        return p;
    }
    return std::filesystem::path(cfg_.recordings_dir) / p;
}

core::ErrorCode Controller::play(const std::string& name,
                                 std::string& error,
                                 std::vector<std::filesystem::path>* available) {
    auto fail = [&](core::ErrorCode rc) {
        util::log(util::LogLevel::Error, "play failed (%s): %s", core::to_string(rc), error.c_str());
        if (available) {
            *available = list_recordings();
        }
        return rc;
    };
    if (name.empty()) {
        error = "no file name provided";
        return fail(core::ErrorCode::InvalidArgument);
    }
    const auto path = resolve(name);

    core::Recording recording;
    persist::RecordingReader reader;
    auto rc = reader.load(path, recording, error);
    if (rc != core::ErrorCode::Ok) {
        return fail(rc);
    }
    const auto& rs = reader.stats();
    if (rs.truncated_tail != 0 || rs.checksum_failures != 0 || rs.malformed_packets != 0) {
        util::log(util::LogLevel::Warn,
                  "%s: truncated=%llu checksum_failures=%llu malformed=%llu",
                  path.filename().string().c_str(),
                  static_cast<unsigned long long>(rs.truncated_tail),
                  static_cast<unsigned long long>(rs.checksum_failures),
                  static_cast<unsigned long long>(rs.malformed_packets));
    }
    util::log(util::LogLevel::Info, "finished loading %s: %zu packets",
              path.filename().string().c_str(), recording.packets.size());

    std::uint32_t fps = 0;
    core::TimingMode timing{};
    std::size_t window = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        fps = cfg_.fps;
        timing = cfg_.timing;
        window = cfg_.fade_window_frames != 0 ? cfg_.fade_window_frames : core::default_fade_window(fps);
    }

    core::FrameBuilder builder;
    auto frames = builder.build(recording.packets);
    if (builder.stats().frames_with_repeated_address != 0) {
        util::log(util::LogLevel::Warn, "%zu frames repeat an address; capture was not round-robin",
                  builder.stats().frames_with_repeated_address);
    }
    if (timing == core::TimingMode::Fixed) {
        core::apply_fixed_rate(frames, fps);
    }
    const auto fade = core::LoopFader(window).splice(frames);
    util::log(util::LogLevel::Debug, "loop fade over %zu frames, %zu unmatched packets",
              fade.half_window * 2, fade.unmatched_packets);

    const std::size_t frame_count = frames.size();
    rc = scheduler_.start(std::move(frames), fps, error);
    if (rc != core::ErrorCode::Ok) {
        return fail(rc);
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        playing_path_ = path;
    }
    util::log(util::LogLevel::Info, "playing %s (%zu frames, %zu addresses)",
              path.filename().string().c_str(), frame_count, builder.stats().distinct_addresses);
    return core::ErrorCode::Ok;
}

core::ErrorCode Controller::stop_playback(std::string& error) {
    const bool was_playing = scheduler_.playing();
    scheduler_.stop();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        playing_path_.clear();
    }
    touch();
    if (!was_playing) {
        error = "not playing";
        return core::ErrorCode::InvalidState;
    }
    return core::ErrorCode::Ok;
}

bool Controller::toggle_passthrough() {
    const bool enabled = passthrough_.toggle();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cfg_.passthrough = enabled;
    }
    util::log(util::LogLevel::Info, "passthrough %s", enabled ? "enabled" : "disabled");
    return enabled;
}

core::ErrorCode Controller::set_fps(std::uint32_t fps, std::string& error) {
    const auto rc = scheduler_.set_fps(fps, error);
    if (rc != core::ErrorCode::Ok) {
        return rc;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    cfg_.fps = fps;
    return core::ErrorCode::Ok;
}

transport::TransmitResult Controller::blackout() {
    const auto res = outputs_.blackout();
    util::log(util::LogLevel::Info, "blackout sent to %zu outputs", res.matched - res.failed);
    return res;
}

std::vector<std::filesystem::path> Controller::list_recordings() const {
    return persist::scan_recordings(cfg_.recordings_dir);
}

core::ErrorCode Controller::highlight(const std::vector<std::uint32_t>& universes, std::string& error) {
    if (universes.empty()) {
        error = "no universe given";
        return core::ErrorCode::InvalidArgument;
    }
    std::size_t bound = 0;
    for (const auto u : universes) {
        if (u > core::max_logical_universe) {
            error = "universe " + std::to_string(u) + " out of range";
            return core::ErrorCode::InvalidArgument;
        }
        bound += outputs_.count_for(core::map_universe(u));
    }
    if (bound == 0) {
        error = "no output bound to universe " + join_universes(universes);
        return core::ErrorCode::NotFound;
    }
    if (highlighting_.exchange(true, std::memory_order_acq_rel)) {
        error = "highlight already running";
        return core::ErrorCode::InvalidState;
    }
    std::thread previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = std::move(highlight_thread_);
    }
    if (previous.joinable()) {
        previous.join();
    }
    util::log(util::LogLevel::Info, "blinking lights on universe %s", join_universes(universes).c_str());
    std::lock_guard<std::mutex> lock(mutex_);
    highlight_thread_ = std::thread(&Controller::highlight_loop, this, universes);
    return core::ErrorCode::Ok;
}

void Controller::highlight_loop(std::vector<std::uint32_t> universes) {
    auto pause = [this] {
        const auto deadline = steady_clock_->now() + opts_.highlight_step;
        while (!shutting_down_.load(std::memory_order_acquire)) {
            const auto now = steady_clock_->now();
            if (now >= deadline) {
                return;
            }
            steady_clock_->sleep_until(std::min(deadline, now + std::chrono::milliseconds{20}));
        }
    };
    for (int i = 0; i < opts_.highlight_blinks && !shutting_down_.load(std::memory_order_acquire); ++i) {
        outputs_.fill(255, universes);
        pause();
        outputs_.fill(0, universes);
        pause();
    }
    if (shutting_down_.load(std::memory_order_acquire)) {
        outputs_.fill(0, universes);
    }
    highlighting_.store(false, std::memory_order_release);
}

void Controller::wait_highlight() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        worker = std::move(highlight_thread_);
    }
    if (worker.joinable()) {
        worker.join();
    }
}

std::string Controller::describe_config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream os;
    os << "name:           " << cfg_.short_name << " (" << cfg_.long_name << ")\n";
    os << "input:          " << cfg_.input_channel << " stream " << cfg_.stream_id << "\n";
    os << "universes:      " << join_universes(cfg_.universes) << "\n";
    os << "outputs:\n";
    for (const auto& line : outputs_.describe()) {
        os << "  " << line << "\n";
    }
    os << "fps:            " << cfg_.fps << "\n";
    os << "timing:         " << core::to_string(cfg_.timing) << "\n";
    os << "fade window:    "
       << (cfg_.fade_window_frames != 0 ? cfg_.fade_window_frames : core::default_fade_window(cfg_.fps))
       << " frames\n";
    os << "passthrough:    " << (cfg_.passthrough ? "on" : "off") << "\n";
    os << "idle timeout:   " << cfg_.idle_timeout.count() << " ms\n";
    os << "recordings dir: " << cfg_.recordings_dir << "\n";
    return os.str();
}

ControllerStatus Controller::status() const {
    ControllerStatus s;
    s.recording = recorder_.recording();
    s.playing = scheduler_.playing();
    s.passthrough = passthrough_.enabled();
    s.recording_path = s.recording ? recorder_.path() : std::filesystem::path{};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        s.fps = cfg_.fps;
        if (s.playing) {
            s.playing_path = playing_path_;
        }
    }
    s.playing_frames = s.playing ? scheduler_.frame_count() : 0;
    s.outputs = outputs_.size();
    s.recorder = recorder_.stats();
    s.scheduler = scheduler_.stats();
    s.passthrough_stats = passthrough_.stats();
    s.output_stats = outputs_.stats();
    return s;
}

void Controller::shutdown() {
    shutting_down_.store(true, std::memory_order_release);
    scheduler_.stop();
    if (recorder_.recording()) {
        std::string error;
        if (recorder_.stop(error) != core::ErrorCode::Ok) {
            util::log(util::LogLevel::Error, "stopping recording on shutdown: %s", error.c_str());
        }
    }
    wait_highlight();
}

} // namespace api
