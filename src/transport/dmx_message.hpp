#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "core/address.hpp"
#include "core/packet.hpp"

namespace transport {

// Message carried over the messaging transport, all integers little-endian:
//   [u8 'D'][u8 'X'][u8 version][u16 net][u16 subnet][u16 universe][u16 length][data]
inline constexpr std::uint8_t dmx_magic0 = 'D';
inline constexpr std::uint8_t dmx_magic1 = 'X';
inline constexpr std::uint8_t dmx_message_version = 1;
inline constexpr std::size_t dmx_header_size = 11;
inline constexpr std::size_t dmx_max_message_size = dmx_header_size + core::max_channels;

struct DmxMessageView {
    core::Address address{};
    std::span<const std::uint8_t> data{};
};

namespace detail {
inline void put_u16(std::uint8_t* p, std::uint16_t v) noexcept {
    p[0] = static_cast<std::uint8_t>(v & 0xFF);
    p[1] = static_cast<std::uint8_t>(v >> 8);
}

inline std::uint16_t get_u16(const std::uint8_t* p) noexcept {
    return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
}
} // namespace detail

// Writes the message into `out` and returns its size, or 0 if `data` is too
// long or `out` too small.
inline std::size_t encode_dmx_message(const core::Address& address,
                                      std::span<const std::uint8_t> data,
                                      std::span<std::uint8_t> out) noexcept {
    if (data.size() > core::max_channels || out.size() < dmx_header_size + data.size()) {
        return 0;
    }
    std::uint8_t* p = out.data();
    p[0] = dmx_magic0;
    p[1] = dmx_magic1;
    p[2] = dmx_message_version;
    detail::put_u16(p + 3, address.net);
    detail::put_u16(p + 5, address.subnet);
    detail::put_u16(p + 7, address.universe);
    detail::put_u16(p + 9, static_cast<std::uint16_t>(data.size()));
    for (std::size_t i = 0; i < data.size(); ++i) {
        p[dmx_header_size + i] = data[i];
    }
    return dmx_header_size + data.size();
}

// The returned view aliases `in`.
inline bool decode_dmx_message(std::span<const std::uint8_t> in, DmxMessageView& out) noexcept {
    if (in.size() < dmx_header_size) {
        return false;
    }
    const std::uint8_t* p = in.data();
    if (p[0] != dmx_magic0 || p[1] != dmx_magic1 || p[2] != dmx_message_version) {
        return false;
    }
    const auto len = detail::get_u16(p + 9);
    if (len > core::max_channels || in.size() != dmx_header_size + len) {
        return false;
    }
    out.address = core::Address{detail::get_u16(p + 3), detail::get_u16(p + 5), detail::get_u16(p + 7)};
    out.data = in.subspan(dmx_header_size, len);
    return true;
}

} // namespace transport
