#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <vector>

#include "core/frame_builder.hpp"
#include "core/loop_fader.hpp"
#include "persist/capture_ring.hpp"
#include "persist/recording_format.hpp"

int main() {
    // One minute of 8 universes at 40 Hz.
    constexpr std::uint32_t universes = 8;
    constexpr std::size_t ticks = 40 * 60;
    std::vector<core::Packet> packets;
    packets.reserve(universes * ticks);
    const core::WallTime t0{};
    for (std::size_t tick = 0; tick < ticks; ++tick) {
        for (std::uint32_t u = 0; u < universes; ++u) {
            core::Packet p;
            p.timestamp = t0 + std::chrono::milliseconds(25 * tick) + std::chrono::microseconds(50 * u);
            p.address = core::map_universe(u);
            p.data.assign(core::max_channels, static_cast<std::uint8_t>((tick + u) & 0xFF));
            packets.push_back(std::move(p));
        }
    }

    auto start = std::chrono::steady_clock::now();
    core::FrameBuilder builder;
    auto frames = builder.build(packets);
    const auto fade = core::LoopFader(core::default_fade_window(40)).splice(frames);
    auto end = std::chrono::steady_clock::now();
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
    std::cout << "Frame build + loop fade of " << packets.size() << " packets (" << frames.size() << " frames, "
              << fade.blended_packets << " blended) took " << ns << " ns\n";

    auto ring = std::make_unique<persist::CaptureRing<4096>>();
    std::vector<std::byte> encoded;
    constexpr std::size_t iterations = 100000;
    std::size_t bytes = 0;
    start = std::chrono::steady_clock::now();
    for (std::size_t i = 0; i < iterations; ++i) {
        const auto& p = packets[i % packets.size()];
        ring->try_push(1, static_cast<std::uint64_t>(i), p.address, p.data);
        const auto* slot = ring->front();
        core::Packet out;
        out.address = slot->address;
        out.data.assign(slot->data, slot->data + slot->length);
        ring->release();
        encoded.clear();
        persist::frame_record(persist::encode_packet(out), encoded);
        bytes += encoded.size();
    }
    end = std::chrono::steady_clock::now();
    ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
    std::cout << "Capture + encode loop " << iterations << " iterations (" << bytes << " bytes) took " << ns
              << " ns (" << (ns / iterations) << " ns/iter)\n";
    return 0;
}
