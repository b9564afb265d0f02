#include "core/loop_fader.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace core {
namespace {

const Packet* find_address(const Frame& frame, const Address& addr) noexcept {
    for (const auto& p : frame.packets) {
        if (p.address == addr) {
            return &p;
        }
    }
    return nullptr;
}

Frame blend_frames(const Frame& tail, const Frame& head, std::size_t step, std::size_t w, LoopFadeStats& stats) {
    Frame out;
    out.packets.reserve(std::max(tail.packets.size(), head.packets.size()));
    for (const auto& t : tail.packets) {
        Packet p = t;
        const Packet* h = find_address(head, t.address);
        if (h == nullptr) {
            ++stats.unmatched_packets;
            out.packets.push_back(std::move(p));
            continue;
        }
        const std::size_t n = std::min(t.data.size(), h->data.size());
        for (std::size_t c = 0; c < n; ++c) {
            p.data[c] = blend_channel(t.data[c], h->data[c], step, w);
        }
        ++stats.blended_packets;
        out.packets.push_back(std::move(p));
    }
    for (const auto& h : head.packets) {
        if (find_address(tail, h.address) == nullptr) {
            out.packets.push_back(h);
        }
    }
    return out;
}

void place(Frame blended, Frame& dest) {
    if (!dest.packets.empty()) {
        const auto ts = dest.packets.front().timestamp;
        for (auto& p : blended.packets) {
            p.timestamp = ts;
        }
    }
    dest = std::move(blended);
}

} // namespace

std::uint8_t blend_channel(std::uint8_t tail, std::uint8_t head, std::size_t step, std::size_t half_window) noexcept {
    if (half_window == 0) {
        return tail;
    }
    const double t = static_cast<double>(tail);
    const double h = static_cast<double>(head);
    const double v = t + (h - t) * static_cast<double>(step) / static_cast<double>(half_window);
    return static_cast<std::uint8_t>(std::clamp<long>(std::lround(v), 0, 255));
}

LoopFadeStats LoopFader::splice(FrameSet& set) const {
    LoopFadeStats stats;
    const std::size_t n = set.frames.size();
    std::size_t w = window_ / 2;
    if (n < 2 * w) {
        w = n / 2;
    }
    stats.half_window = w;
    if (w == 0) {
        return stats;
    }

    std::vector<Frame> blended;
    blended.reserve(w);
    for (std::size_t i = 0; i < w; ++i) {
        blended.push_back(blend_frames(set.frames[n - w + i], set.frames[i], i, w, stats));
    }

    // First half ends the recording, second half starts it, so playing
    // frames[n-h..n) then frames[0..w-h) walks the blend from step 0 to w-1.
    // Each step pairs tail[i] with head[i] rather than with the frame it
    // displaces, so content that itself moves across the window is not
    // guaranteed monotone at the seam; steady tail and head content is.
    const std::size_t h = w / 2;
    for (std::size_t j = 0; j < h; ++j) {
        place(std::move(blended[j]), set.frames[n - h + j]);
    }
    for (std::size_t j = h; j < w; ++j) {
        place(std::move(blended[j]), set.frames[j - h]);
    }
    return stats;
}

} // namespace core
