#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "core/address.hpp"

namespace core {

inline constexpr std::size_t max_channels = 512;

using WallTime = std::chrono::system_clock::time_point;
using FrameDelay = std::chrono::nanoseconds;

// One captured packet. Channel values are opaque bytes.
struct Packet {
    WallTime timestamp{};
    Address address{};
    std::vector<std::uint8_t> data;

    friend bool operator==(const Packet&, const Packet&) = default;
};

struct RecordingMetadata {
    std::string name;
    WallTime created_at{};
    std::vector<std::uint32_t> universes;

    friend bool operator==(const RecordingMetadata&, const RecordingMetadata&) = default;
};

// Packets are sorted non-decreasing by timestamp once loaded.
struct Recording {
    RecordingMetadata metadata;
    std::vector<Packet> packets;
};

// One playback tick: at most one packet per address.
struct Frame {
    std::vector<Packet> packets;
};

// delays.size() == frames.size(); delays[0] == 0 and every delay is >= 0.
struct FrameSet {
    std::vector<Frame> frames;
    std::vector<FrameDelay> delays;

    bool empty() const noexcept { return frames.empty(); }
    std::size_t size() const noexcept { return frames.size(); }
};

} // namespace core
