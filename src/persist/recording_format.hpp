#pragma once

#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string_view>
#include <vector>

#include "core/packet.hpp"
#include "util/crc32c.hpp"

namespace persist {

// Recording files are a gzip stream (extension ".dmxrec") whose decompressed
// content is:
//   header  = [4 bytes "DMXR"][u16 version_le][u16 header_size_le]
//   record* = [u32 payload_len_le][payload bytes][u32 crc32c_le]
// The checksum covers the length prefix (little-endian) and the payload.
// Every record is self-delimited, so a stream cut short loses only the record
// it was cut in. payload[0] is the record type.
//
// Metadata payload (exactly one, first):
//   u8 type=1 | u64 created_at_ns | u16 name_len | name | u16 count | u16 universe[count]
// Packet payload:
//   u8 type=2 | u64 timestamp_ns | u16 net | u16 subnet | u16 universe | u16 data_len | data

inline constexpr std::string_view recording_extension = ".dmxrec";
inline constexpr std::array<std::byte, 4> recording_magic{std::byte{'D'}, std::byte{'M'}, std::byte{'X'}, std::byte{'R'}};
inline constexpr std::uint16_t recording_version = 1;
inline constexpr std::size_t recording_header_size = 8;
inline constexpr std::size_t max_record_payload = 64 * 1024;

enum class RecordType : std::uint8_t {
    Metadata = 1,
    Packet = 2,
};

inline constexpr std::size_t packet_fixed_size = 1 + 8 + 2 + 2 + 2 + 2;

struct RecordView {
    std::uint32_t payload_length{0};
    std::span<const std::byte> payload{};
    std::uint32_t checksum{0};
};

inline constexpr std::uint16_t byteswap16(std::uint16_t v) noexcept {
    return static_cast<std::uint16_t>((v >> 8) | (v << 8));
}

inline constexpr std::uint32_t byteswap32(std::uint32_t v) noexcept {
    return (v >> 24) | ((v >> 8) & 0x0000FF00u) | ((v << 8) & 0x00FF0000u) | (v << 24);
}

inline constexpr std::uint64_t byteswap64(std::uint64_t v) noexcept {
    return (static_cast<std::uint64_t>(byteswap32(static_cast<std::uint32_t>(v))) << 32) |
           byteswap32(static_cast<std::uint32_t>(v >> 32));
}

template <typename T>
inline constexpr T to_le(T v) noexcept {
    if constexpr (std::endian::native == std::endian::little) {
        return v;
    } else if constexpr (sizeof(T) == 2) {
        return byteswap16(v);
    } else if constexpr (sizeof(T) == 4) {
        return byteswap32(v);
    } else {
        return byteswap64(v);
    }
}

template <typename T>
inline T read_le(const std::byte* p) noexcept {
    T v{};
    std::memcpy(&v, p, sizeof(v));
    return to_le(v);
}

template <typename T>
inline void append_le(std::vector<std::byte>& out, T v) noexcept {
    const T le = to_le(v);
    const auto* b = reinterpret_cast<const std::byte*>(&le);
    out.insert(out.end(), b, b + sizeof(le));
}

inline constexpr std::size_t framed_size(std::size_t payload_len) noexcept {
    return sizeof(std::uint32_t) + payload_len + sizeof(std::uint32_t);
}

inline std::uint32_t compute_record_crc(std::uint32_t payload_len_le, std::span<const std::byte> payload) noexcept {
    std::uint32_t crc = util::Crc32c::initial;
    crc = util::Crc32c::update(crc, reinterpret_cast<const std::byte*>(&payload_len_le), sizeof(payload_len_le));
    crc = util::Crc32c::update(crc, payload.data(), payload.size());
    return util::Crc32c::finalize(crc);
}

std::array<std::byte, recording_header_size> encode_header() noexcept;

// False if the magic or version does not match.
bool parse_header(std::span<const std::byte> data) noexcept;

// Appends the framed record for payload to out.
void frame_record(std::span<const std::byte> payload, std::vector<std::byte>& out);

// False when fewer bytes than the framed record are available or the length is
// outside (0, max_record_payload].
bool parse_record(const std::byte* data, std::size_t size, RecordView& out) noexcept;

bool validate_record(const RecordView& rec) noexcept;

std::vector<std::byte> encode_metadata(const core::RecordingMetadata& meta);
std::vector<std::byte> encode_packet(const core::Packet& packet);

bool decode_metadata(std::span<const std::byte> payload, core::RecordingMetadata& out);
bool decode_packet(std::span<const std::byte> payload, core::Packet& out);

} // namespace persist
