#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include "core/packet.hpp"

namespace core {

struct FrameBuildStats {
    std::size_t distinct_addresses{0};
    std::size_t short_final_frame{0};
    // Frames in which one address appeared more than once (capture jitter or
    // an address sending at a different rate than the others).
    std::size_t frames_with_repeated_address{0};
};

// Groups a timestamp-sorted packet sequence into frames of k packets, where k
// is the number of distinct addresses in the whole sequence.
//
// This is not a general demultiplexer: it assumes the capture saw every active
// address at the same round-robin rate. When one address sends faster or
// slower than the rest, frames straddle ticks and some carry the same address
// twice; that case is counted in FrameBuildStats and otherwise passed through.
//
// delays[0] is 0; delays[i] is the gap between the first packet of frame i and
// the first packet of frame i-1, clamped at 0.
class FrameBuilder {
public:
    FrameSet build(std::span<const Packet> sorted_packets);

    const FrameBuildStats& stats() const noexcept { return stats_; }

private:
    FrameBuildStats stats_{};
};

std::size_t count_distinct_addresses(std::span<const Packet> packets);

// Spaces every frame one interval of 1s/fps apart (delays[0] stays 0).
void apply_fixed_rate(FrameSet& set, std::uint32_t fps);

[[nodiscard]] FrameDelay frame_interval(std::uint32_t fps) noexcept;

} // namespace core
