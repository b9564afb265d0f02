#include "core/frame_builder.hpp"

#include <algorithm>
#include <vector>

namespace core {

std::size_t count_distinct_addresses(std::span<const Packet> packets) {
    std::vector<Address> seen;
    seen.reserve(64);
    for (const auto& p : packets) {
        seen.push_back(p.address);
    }
    std::sort(seen.begin(), seen.end());
    return static_cast<std::size_t>(std::unique(seen.begin(), seen.end()) - seen.begin());
}

FrameSet FrameBuilder::build(std::span<const Packet> sorted_packets) {
    stats_ = FrameBuildStats{};
    FrameSet out;
    const std::size_t k = count_distinct_addresses(sorted_packets);
    stats_.distinct_addresses = k;
    if (k == 0) {
        return out;
    }

    const std::size_t n = sorted_packets.size();
    out.frames.reserve((n + k - 1) / k);
    out.delays.reserve((n + k - 1) / k);

    for (std::size_t start = 0; start < n; start += k) {
        const std::size_t end = std::min(start + k, n);
        Frame frame;
        frame.packets.assign(sorted_packets.begin() + static_cast<std::ptrdiff_t>(start),
                             sorted_packets.begin() + static_cast<std::ptrdiff_t>(end));
        if (end - start < k) {
            ++stats_.short_final_frame;
        }

        std::vector<Address> addrs;
        addrs.reserve(frame.packets.size());
        for (const auto& p : frame.packets) {
            addrs.push_back(p.address);
        }
        std::sort(addrs.begin(), addrs.end());
        if (std::adjacent_find(addrs.begin(), addrs.end()) != addrs.end()) {
            ++stats_.frames_with_repeated_address;
        }

        FrameDelay delay{0};
        if (!out.frames.empty()) {
            const auto prev_first = out.frames.back().packets.front().timestamp;
            const auto gap = frame.packets.front().timestamp - prev_first;
            delay = std::max(FrameDelay{0}, std::chrono::duration_cast<FrameDelay>(gap));
        }
        out.frames.push_back(std::move(frame));
        out.delays.push_back(delay);
    }
    return out;
}

FrameDelay frame_interval(std::uint32_t fps) noexcept {
    if (fps == 0) {
        return FrameDelay{0};
    }
    return std::chrono::duration_cast<FrameDelay>(std::chrono::seconds{1}) / fps;
}

void apply_fixed_rate(FrameSet& set, std::uint32_t fps) {
    const auto interval = frame_interval(fps);
    for (std::size_t i = 0; i < set.delays.size(); ++i) {
        set.delays[i] = (i == 0) ? FrameDelay{0} : interval;
    }
}

} // namespace core
