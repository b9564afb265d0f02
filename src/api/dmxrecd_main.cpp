#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "api/command_shell.hpp"
#include "api/controller.hpp"
#include "persist/config_loader.hpp"
#include "transport/aeron_transport.hpp"
#include "util/async_log.hpp"
#include "util/log.hpp"

namespace {

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  --config <file>          JSON player configuration\n"
              << "  --recordings-dir <dir>   Where recordings are written and looked up\n"
              << "  --fps <1-100>            Playback rate (default 35)\n"
              << "  --no-passthrough         Start with passthrough disabled\n"
              << "  --play <file>            Start playing a recording immediately\n"
              << "  --log-file <path>        Write inbound-path logs to a file\n"
              << "  --run-ms <N>             Run for N ms without a console, then exit\n"
              << "  --quiet                  Suppress non-error logs\n"
              << "  --verbose                Enable debug logging\n";
}

struct Options {
    std::string config_path;
    std::string recordings_dir;
    std::uint32_t fps{0};
    bool no_passthrough{false};
    std::string play;
    std::string log_file;
    long run_ms{-1};
    bool quiet{false};
    bool verbose{false};
};

bool parse_args(int argc, char** argv, Options& opts) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            opts.config_path = argv[++i];
        } else if (arg == "--recordings-dir" && i + 1 < argc) {
            opts.recordings_dir = argv[++i];
        } else if (arg == "--fps" && i + 1 < argc) {
            opts.fps = static_cast<std::uint32_t>(std::strtoul(argv[++i], nullptr, 10));
            if (opts.fps == 0) {
                return false;
            }
        } else if (arg == "--no-passthrough") {
            opts.no_passthrough = true;
        } else if (arg == "--play" && i + 1 < argc) {
            opts.play = argv[++i];
        } else if (arg == "--log-file" && i + 1 < argc) {
            opts.log_file = argv[++i];
        } else if (arg == "--run-ms" && i + 1 < argc) {
            opts.run_ms = std::strtol(argv[++i], nullptr, 10);
        } else if (arg == "--quiet") {
            opts.quiet = true;
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else {
            return false;
        }
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    Options opts;
    if (!parse_args(argc, argv, opts)) {
        print_usage(argv[0]);
        return 1;
    }
    if (opts.quiet) {
        util::set_log_level(util::LogLevel::Error);
    } else if (opts.verbose) {
        util::set_log_level(util::LogLevel::Debug);
    }

    core::PlayerConfig cfg;
    std::string error;
    if (!opts.config_path.empty()) {
        const auto rc = persist::load_player_config(opts.config_path, cfg, error);
        if (rc != core::ErrorCode::Ok) {
            LOG_SLOW_ERROR("config: %s (%s)", error.c_str(), core::to_string(rc));
            return 1;
        }
    }
    if (!opts.recordings_dir.empty()) {
        cfg.recordings_dir = opts.recordings_dir;
    }
    if (opts.fps != 0) {
        cfg.fps = opts.fps;
    }
    if (opts.no_passthrough) {
        cfg.passthrough = false;
    }

    util::AsyncLogger::Config hot_cfg{};
    hot_cfg.capacity_pow2 = 1u << 13;
    hot_cfg.file_path = opts.log_file;
    if (!util::init_hot_logger(hot_cfg)) {
        LOG_SLOW_ERROR("Failed to start async logger for dmxrecd");
    }

    auto transport = transport::AeronTransport::connect(cfg.input_channel, cfg.stream_id, error);
    if (!transport) {
        LOG_SLOW_ERROR("%s", error.c_str());
        util::shutdown_hot_logger();
        return 1;
    }

    api::Controller controller(cfg, *transport);
    if (const auto rc = controller.init(error); rc != core::ErrorCode::Ok) {
        LOG_SLOW_ERROR("init failed: %s (%s)", error.c_str(), core::to_string(rc));
        util::shutdown_hot_logger();
        return 1;
    }

    LOG_SLOW_INFO("Starting %s input=%s stream=%d outputs=%zu fps=%u",
                  cfg.short_name.c_str(), cfg.input_channel.c_str(), cfg.stream_id,
                  controller.outputs().size(), cfg.fps);

    std::atomic<bool> stop_flag{false};
    std::thread poll_thread([&] {
        constexpr int fragment_limit = 16;
        const transport::InboundHandler handler = [&](const transport::InboundPacket& p) { controller.on_inbound(p); };
        int idle_count = 0;
        while (!stop_flag.load(std::memory_order_acquire)) {
            const int delivered = transport->poll(handler, fragment_limit);
            controller.tick();
            if (delivered == 0) {
                if (idle_count < 32) {
                    ++idle_count;
                    std::this_thread::yield();
                } else {
                    std::this_thread::sleep_for(std::chrono::milliseconds(1));
                }
            } else {
                idle_count = 0;
            }
        }
    });

    if (!opts.play.empty()) {
        if (const auto rc = controller.play(opts.play, error); rc != core::ErrorCode::Ok) {
            LOG_SLOW_ERROR("play %s failed: %s (%s)", opts.play.c_str(), error.c_str(), core::to_string(rc));
        }
    }

    if (opts.run_ms >= 0) {
        LOG_SLOW_INFO("dmxrecd running for %ld ms before shutdown.", opts.run_ms);
        std::this_thread::sleep_for(std::chrono::milliseconds{opts.run_ms});
    } else {
        api::CommandShell shell(controller, std::cin, std::cout);
        shell.run();
    }

    stop_flag.store(true, std::memory_order_release);
    poll_thread.join();
    controller.shutdown();

    const auto s = controller.status();
    LOG_SLOW_INFO("Outputs sent=%llu failed=%llu; playback frames=%llu loops=%llu late=%llu",
                  static_cast<unsigned long long>(s.output_stats.sends),
                  static_cast<unsigned long long>(s.output_stats.failures),
                  static_cast<unsigned long long>(s.scheduler.frames_sent),
                  static_cast<unsigned long long>(s.scheduler.loops),
                  static_cast<unsigned long long>(s.scheduler.late_frames));
    LOG_SLOW_INFO("Recorder written=%llu dropped=%llu; hot log dropped=%llu",
                  static_cast<unsigned long long>(s.recorder.written),
                  static_cast<unsigned long long>(s.recorder.dropped()),
                  static_cast<unsigned long long>(util::hot_logger().dropped()));

    util::shutdown_hot_logger();
    return 0;
}
