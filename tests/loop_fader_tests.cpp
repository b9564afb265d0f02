#include <gtest/gtest.h>

#include <vector>

#include "core/frame_builder.hpp"
#include "core/loop_fader.hpp"
#include "harness/recording_builder.hpp"

using test_harness::make_packet;

namespace {

// n frames of one universe, frame i holding value i*10 on 4 channels.
core::FrameSet ramp(std::size_t n) {
    std::vector<core::Packet> packets;
    for (std::size_t i = 0; i < n; ++i) {
        packets.push_back(make_packet(static_cast<std::int64_t>(i) * 25, 1, static_cast<std::uint8_t>(i * 10), 4));
    }
    core::FrameBuilder builder;
    return builder.build(packets);
}

std::uint8_t value_of(const core::FrameSet& set, std::size_t frame) {
    return set.frames[frame].packets.at(0).data.at(0);
}

TEST(LoopFaderTests, BlendChannelInterpolates) {
    EXPECT_EQ(core::blend_channel(0, 255, 0, 4), 0);
    EXPECT_EQ(core::blend_channel(0, 255, 2, 4), 128);
    EXPECT_EQ(core::blend_channel(200, 100, 1, 2), 150);
    EXPECT_EQ(core::blend_channel(255, 0, 3, 4), 64);
    EXPECT_EQ(core::blend_channel(90, 10, 0, 0), 90);
}

TEST(LoopFaderTests, SplicesTailIntoHead) {
    auto set = ramp(8);
    const auto delays = set.delays;
    const auto stats = core::LoopFader(4).splice(set);

    EXPECT_EQ(stats.half_window, 2u);
    EXPECT_EQ(stats.blended_packets, 2u);
    EXPECT_EQ(stats.unmatched_packets, 0u);
    ASSERT_EQ(set.size(), 8u);
    // Step 0 is the pure tail frame 6; step 1 is halfway from frame 7 to frame 1.
    EXPECT_EQ(value_of(set, 7), 60);
    EXPECT_EQ(value_of(set, 0), 40);
    for (std::size_t i = 1; i < 7; ++i) {
        EXPECT_EQ(value_of(set, i), i * 10) << "frame " << i;
    }
    EXPECT_EQ(set.delays, delays);
}

TEST(LoopFaderTests, WrapFromSteadyTailToSteadyHeadIsAMonotoneRamp) {
    // 8 dark frames followed by 8 lit frames: unfaded, the wrap jumps 200 -> 0.
    std::vector<core::Packet> packets;
    for (std::size_t i = 0; i < 16; ++i) {
        packets.push_back(make_packet(static_cast<std::int64_t>(i) * 25, 1, i < 8 ? 0 : 200, 4));
    }
    auto set = core::FrameBuilder().build(packets);
    ASSERT_EQ(set.size(), 16u);
    core::LoopFader(8).splice(set);

    // Playback order across the boundary: frames 12..15 then 0..3.
    std::vector<int> played;
    for (std::size_t i = 12; i < 16; ++i) {
        played.push_back(value_of(set, i));
    }
    for (std::size_t i = 0; i < 4; ++i) {
        played.push_back(value_of(set, i));
    }
    EXPECT_EQ(played, (std::vector<int>{200, 200, 200, 150, 100, 50, 0, 0}));
    for (std::size_t i = 1; i < played.size(); ++i) {
        EXPECT_LE(played[i], played[i - 1]) << "step " << i;
        EXPECT_LE(played[i - 1] - played[i], 50) << "step " << i;
    }
}

TEST(LoopFaderTests, BlendedFramesKeepTheirSlotTimestamp) {
    auto set = ramp(8);
    const auto ts0 = set.frames[0].packets[0].timestamp;
    const auto ts7 = set.frames[7].packets[0].timestamp;
    core::LoopFader(4).splice(set);
    EXPECT_EQ(set.frames[0].packets[0].timestamp, ts0);
    EXPECT_EQ(set.frames[7].packets[0].timestamp, ts7);
}

TEST(LoopFaderTests, WindowIsClampedToHalfTheFrames) {
    auto set = ramp(3);
    const auto stats = core::LoopFader(10).splice(set);
    EXPECT_EQ(stats.half_window, 1u);
    ASSERT_EQ(set.size(), 3u);
    EXPECT_EQ(value_of(set, 0), 20);
    EXPECT_EQ(value_of(set, 1), 10);
    EXPECT_EQ(value_of(set, 2), 20);
}

TEST(LoopFaderTests, ZeroOrUnitWindowLeavesFramesAlone) {
    for (std::size_t window : {0u, 1u}) {
        auto set = ramp(6);
        const auto stats = core::LoopFader(window).splice(set);
        EXPECT_EQ(stats.half_window, 0u);
        for (std::size_t i = 0; i < 6; ++i) {
            EXPECT_EQ(value_of(set, i), i * 10);
        }
    }
}

TEST(LoopFaderTests, SingleFrameIsUntouched) {
    auto set = ramp(1);
    const auto stats = core::LoopFader(4).splice(set);
    EXPECT_EQ(stats.half_window, 0u);
    EXPECT_EQ(value_of(set, 0), 0);
}

TEST(LoopFaderTests, AddressesMissingOnOneSidePassThrough) {
    core::FrameSet set;
    for (int i = 0; i < 4; ++i) {
        core::Frame f;
        f.packets.push_back(make_packet(i * 25, 1, 100, 2));
        if (i >= 2) {
            f.packets.push_back(make_packet(i * 25 + 1, 2, 50, 2));
        } else {
            f.packets.push_back(make_packet(i * 25 + 1, 3, 70, 2));
        }
        set.frames.push_back(std::move(f));
        set.delays.push_back(std::chrono::milliseconds{i == 0 ? 0 : 25});
    }
    const auto stats = core::LoopFader(4).splice(set);
    EXPECT_EQ(stats.half_window, 2u);
    EXPECT_EQ(stats.blended_packets, 2u);
    EXPECT_EQ(stats.unmatched_packets, 2u);
    // Tail-only universe 2 kept, head-only universe 3 appended.
    ASSERT_EQ(set.frames[0].packets.size(), 3u);
    EXPECT_EQ(set.frames[0].packets[1].address, core::map_universe(2));
    EXPECT_EQ(set.frames[0].packets[2].address, core::map_universe(3));
}

TEST(LoopFaderTests, ShorterPacketBlendsOnlySharedChannels) {
    core::FrameSet set;
    core::Frame head;
    head.packets.push_back(make_packet(0, 1, 200, 2));
    core::Frame tail;
    tail.packets.push_back(make_packet(25, 1, 0, 4));
    set.frames = {head, tail};
    set.delays = {std::chrono::nanoseconds{0}, std::chrono::milliseconds{25}};

    core::LoopFader(2).splice(set);
    // w == 1: frame 0 is replaced by the tail frame itself.
    ASSERT_EQ(set.frames[0].packets[0].data.size(), 4u);
    EXPECT_EQ(set.frames[0].packets[0].data[0], 0);
    EXPECT_EQ(set.frames[0].packets[0].data[3], 0);
}

TEST(LoopFaderTests, DefaultWindowIsOneSecondOfFrames) {
    EXPECT_EQ(core::default_fade_window(35), 35u);
}

} // namespace
