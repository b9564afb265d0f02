#pragma once

#include <cstddef>
#include <cstdint>

#include "core/packet.hpp"

namespace core {

struct LoopFadeStats {
    std::size_t half_window{0};     // w after clamping
    std::size_t blended_packets{0};
    std::size_t unmatched_packets{0}; // tail addresses with no head counterpart
};

// Cross-fades the tail of a frame sequence into its head so that wrapping from
// the last frame to the first does not jump.
//
// With w = fade_window_frames / 2 (clamped to frames/2), step i in [0, w)
// blends tail frame (n - w + i) toward head frame i:
//     value = round(tail + (head - tail) * i / w)
// per channel, per address present in both. The first half of the blended
// steps replaces the last frames of the recording and the second half replaces
// the first frames, so the blend runs continuously across the wrap. Delays are
// not touched.
class LoopFader {
public:
    explicit LoopFader(std::size_t fade_window_frames) noexcept : window_(fade_window_frames) {}

    LoopFadeStats splice(FrameSet& set) const;

    std::size_t window() const noexcept { return window_; }

private:
    std::size_t window_;
};

[[nodiscard]] std::uint8_t blend_channel(std::uint8_t tail, std::uint8_t head,
                                         std::size_t step, std::size_t half_window) noexcept;

// Fade window covering one second of frames at fps.
[[nodiscard]] constexpr std::size_t default_fade_window(std::uint32_t fps) noexcept { return fps; }

} // namespace core
