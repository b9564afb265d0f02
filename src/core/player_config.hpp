#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace core {

enum class TimingMode : std::uint8_t {
    Recorded, // delays reconstructed from capture timestamps
    Fixed,    // every frame 1s/fps apart
};

struct OutputConfig {
    std::string endpoint;
    std::vector<std::uint32_t> universes;
};

inline constexpr std::uint32_t min_fps = 1;
inline constexpr std::uint32_t max_fps = 100;
inline constexpr std::uint32_t max_logical_universe = 255;

struct PlayerConfig {
    std::string short_name{"dmxrec"};
    std::string long_name{"dmxrec - DMX recorder and looper"};

    // Inbound universes captured and forwarded.
    std::vector<std::uint32_t> universes;
    std::vector<OutputConfig> outputs;

    std::string input_channel{"aeron:udp?endpoint=0.0.0.0:6454"};
    std::int32_t stream_id{6454};

    std::uint32_t fps{35};
    bool passthrough{true};
    std::chrono::milliseconds idle_timeout{3000};
    std::string recordings_dir{"."};

    // 0 selects one second of frames at fps.
    std::uint32_t fade_window_frames{0};
    TimingMode timing{TimingMode::Recorded};
};

inline const char* to_string(TimingMode m) noexcept {
    return m == TimingMode::Fixed ? "fixed" : "recorded";
}

} // namespace core
