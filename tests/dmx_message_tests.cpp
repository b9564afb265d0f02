#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <vector>

#include "transport/dmx_message.hpp"

namespace {

TEST(DmxMessageTests, EncodeDecodeKeepsAddressAndData) {
    std::vector<std::uint8_t> data(core::max_channels);
    for (std::size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<std::uint8_t>(i);
    }
    std::array<std::uint8_t, transport::dmx_max_message_size> buf{};
    const auto addr = core::Address{1, 2, 3};
    const auto n = transport::encode_dmx_message(addr, data, buf);
    ASSERT_EQ(n, transport::dmx_header_size + data.size());

    transport::DmxMessageView view;
    ASSERT_TRUE(transport::decode_dmx_message(std::span<const std::uint8_t>(buf.data(), n), view));
    EXPECT_EQ(view.address, addr);
    ASSERT_EQ(view.data.size(), data.size());
    EXPECT_TRUE(std::equal(view.data.begin(), view.data.end(), data.begin()));
}

TEST(DmxMessageTests, HeaderIsLittleEndian) {
    std::array<std::uint8_t, 2> data{0xAA, 0xBB};
    std::array<std::uint8_t, 32> buf{};
    ASSERT_EQ(transport::encode_dmx_message(core::Address{0, 0x0102, 0x0304}, data, buf), 13u);
    EXPECT_EQ(buf[0], 'D');
    EXPECT_EQ(buf[1], 'X');
    EXPECT_EQ(buf[2], 1);
    EXPECT_EQ(buf[5], 0x02);
    EXPECT_EQ(buf[6], 0x01);
    EXPECT_EQ(buf[7], 0x04);
    EXPECT_EQ(buf[8], 0x03);
    EXPECT_EQ(buf[9], 2);
    EXPECT_EQ(buf[10], 0);
    EXPECT_EQ(buf[11], 0xAA);
}

TEST(DmxMessageTests, EncodeRejectsOversizeOrShortBuffer) {
    std::vector<std::uint8_t> too_long(core::max_channels + 1);
    std::array<std::uint8_t, 1024> big{};
    EXPECT_EQ(transport::encode_dmx_message({}, too_long, big), 0u);

    std::array<std::uint8_t, 4> data{};
    std::array<std::uint8_t, 12> small{};
    EXPECT_EQ(transport::encode_dmx_message({}, data, small), 0u);
}

TEST(DmxMessageTests, DecodeRejectsMalformedMessages) {
    std::array<std::uint8_t, 4> data{1, 2, 3, 4};
    std::array<std::uint8_t, 32> buf{};
    const auto n = transport::encode_dmx_message(core::map_universe(5), data, buf);
    transport::DmxMessageView view;

    EXPECT_FALSE(transport::decode_dmx_message(std::span<const std::uint8_t>(buf.data(), 5), view));
    EXPECT_FALSE(transport::decode_dmx_message(std::span<const std::uint8_t>(buf.data(), n - 1), view));
    EXPECT_FALSE(transport::decode_dmx_message(std::span<const std::uint8_t>(buf.data(), n + 1), view));

    auto bad = buf;
    bad[0] = 'Q';
    EXPECT_FALSE(transport::decode_dmx_message(std::span<const std::uint8_t>(bad.data(), n), view));
    bad = buf;
    bad[2] = 2;
    EXPECT_FALSE(transport::decode_dmx_message(std::span<const std::uint8_t>(bad.data(), n), view));
}

} // namespace
