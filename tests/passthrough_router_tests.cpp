#include <gtest/gtest.h>

#include <atomic>
#include <vector>

#include "harness/fake_transport.hpp"
#include "ingest/passthrough_router.hpp"

using test_harness::FakeTransport;

namespace {

class PassthroughRouterTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::string error;
        ASSERT_EQ(outputs_.configure(transport_, {core::OutputConfig{"out", {1, 2}}}, error), core::ErrorCode::Ok);
    }

    transport::InboundPacket packet(std::uint32_t universe) {
        return transport::InboundPacket{core::map_universe(universe), data_, {}};
    }

    FakeTransport transport_;
    transport::OutputSet outputs_;
    std::atomic<bool> playing_{false};
    std::vector<std::uint8_t> data_{10, 20, 30};
};

TEST_F(PassthroughRouterTest, ForwardsToMatchingOutput) {
    ingest::PassthroughRouter router(outputs_, playing_);
    EXPECT_TRUE(router.on_packet(packet(2)));
    EXPECT_EQ(transport_.find("out", 2)->last(), data_);
    EXPECT_EQ(transport_.find("out", 1)->count(), 0u);
    EXPECT_EQ(router.stats().forwarded, 1u);
}

TEST_F(PassthroughRouterTest, SuppressedWhilePlaying) {
    ingest::PassthroughRouter router(outputs_, playing_);
    playing_ = true;
    EXPECT_FALSE(router.on_packet(packet(1)));
    EXPECT_EQ(transport_.find("out", 1)->count(), 0u);
    EXPECT_EQ(router.stats().suppressed_playing, 1u);

    playing_ = false;
    EXPECT_TRUE(router.on_packet(packet(1)));
}

TEST_F(PassthroughRouterTest, SuppressedWhenDisabled) {
    ingest::PassthroughRouter router(outputs_, playing_, false);
    EXPECT_FALSE(router.on_packet(packet(1)));
    EXPECT_EQ(router.stats().suppressed_disabled, 1u);
    EXPECT_TRUE(router.toggle());
    EXPECT_TRUE(router.enabled());
    EXPECT_TRUE(router.on_packet(packet(1)));
    EXPECT_FALSE(router.toggle());
}

TEST_F(PassthroughRouterTest, UnboundUniverseIsNotForwarded) {
    ingest::PassthroughRouter router(outputs_, playing_);
    EXPECT_FALSE(router.on_packet(packet(9)));
    EXPECT_EQ(router.stats().forwarded, 0u);
}

TEST_F(PassthroughRouterTest, SendFailuresAreCounted) {
    ingest::PassthroughRouter router(outputs_, playing_);
    transport_.find("out", 1)->fail = true;
    EXPECT_FALSE(router.on_packet(packet(1)));
    EXPECT_EQ(router.stats().send_failures, 1u);
}

} // namespace
