#include "persist/recording_format.hpp"

#include <algorithm>

#include "util/time.hpp"

namespace persist {

std::array<std::byte, recording_header_size> encode_header() noexcept {
    std::array<std::byte, recording_header_size> out{};
    std::memcpy(out.data(), recording_magic.data(), recording_magic.size());
    const auto version = to_le(recording_version);
    const auto size = to_le(static_cast<std::uint16_t>(recording_header_size));
    std::memcpy(out.data() + 4, &version, sizeof(version));
    std::memcpy(out.data() + 6, &size, sizeof(size));
    return out;
}

bool parse_header(std::span<const std::byte> data) noexcept {
    if (data.size() < recording_header_size) {
        return false;
    }
    if (std::memcmp(data.data(), recording_magic.data(), recording_magic.size()) != 0) {
        return false;
    }
    return read_le<std::uint16_t>(data.data() + 4) == recording_version &&
           read_le<std::uint16_t>(data.data() + 6) == recording_header_size;
}

void frame_record(std::span<const std::byte> payload, std::vector<std::byte>& out) {
    const auto len_le = to_le(static_cast<std::uint32_t>(payload.size()));
    const auto crc = compute_record_crc(len_le, payload);
    out.reserve(out.size() + framed_size(payload.size()));
    append_le(out, static_cast<std::uint32_t>(payload.size()));
    out.insert(out.end(), payload.begin(), payload.end());
    append_le(out, crc);
}

bool parse_record(const std::byte* data, std::size_t size, RecordView& out) noexcept {
    if (size < framed_size(0)) {
        return false;
    }
    const auto payload_len = read_le<std::uint32_t>(data);
    if (payload_len == 0 || payload_len > max_record_payload) {
        return false;
    }
    if (framed_size(payload_len) > size) {
        return false;
    }
    out.payload_length = payload_len;
    out.payload = std::span<const std::byte>(data + sizeof(std::uint32_t), payload_len);
    out.checksum = read_le<std::uint32_t>(data + sizeof(std::uint32_t) + payload_len);
    return true;
}

bool validate_record(const RecordView& rec) noexcept {
    return compute_record_crc(to_le(rec.payload_length), rec.payload) == rec.checksum;
}

std::vector<std::byte> encode_metadata(const core::RecordingMetadata& meta) {
    std::vector<std::byte> out;
    out.reserve(1 + 8 + 2 + meta.name.size() + 2 + meta.universes.size() * 2);
    out.push_back(static_cast<std::byte>(RecordType::Metadata));
    append_le(out, util::to_epoch_ns(meta.created_at));
    const auto name_len = static_cast<std::uint16_t>(std::min<std::size_t>(meta.name.size(), 0xFFFF));
    append_le(out, name_len);
    const auto* name = reinterpret_cast<const std::byte*>(meta.name.data());
    out.insert(out.end(), name, name + name_len);
    append_le(out, static_cast<std::uint16_t>(meta.universes.size()));
    for (const auto u : meta.universes) {
        append_le(out, static_cast<std::uint16_t>(u));
    }
    return out;
}

std::vector<std::byte> encode_packet(const core::Packet& packet) {
    std::vector<std::byte> out;
    out.reserve(packet_fixed_size + packet.data.size());
    out.push_back(static_cast<std::byte>(RecordType::Packet));
    append_le(out, util::to_epoch_ns(packet.timestamp));
    append_le(out, packet.address.net);
    append_le(out, packet.address.subnet);
    append_le(out, packet.address.universe);
    append_le(out, static_cast<std::uint16_t>(packet.data.size()));
    const auto* d = reinterpret_cast<const std::byte*>(packet.data.data());
    out.insert(out.end(), d, d + packet.data.size());
    return out;
}

bool decode_metadata(std::span<const std::byte> payload, core::RecordingMetadata& out) {
    std::size_t off = 0;
    const auto need = [&](std::size_t n) { return payload.size() - off >= n; };
    if (!need(1 + 8 + 2) || payload[0] != static_cast<std::byte>(RecordType::Metadata)) {
        return false;
    }
    off = 1;
    out.created_at = util::from_epoch_ns(read_le<std::uint64_t>(payload.data() + off));
    off += 8;
    const auto name_len = read_le<std::uint16_t>(payload.data() + off);
    off += 2;
    if (!need(name_len + 2u)) {
        return false;
    }
    out.name.assign(reinterpret_cast<const char*>(payload.data() + off), name_len);
    off += name_len;
    const auto count = read_le<std::uint16_t>(payload.data() + off);
    off += 2;
    if (payload.size() - off != static_cast<std::size_t>(count) * 2) {
        return false;
    }
    out.universes.clear();
    out.universes.reserve(count);
    for (std::uint16_t i = 0; i < count; ++i) {
        out.universes.push_back(read_le<std::uint16_t>(payload.data() + off));
        off += 2;
    }
    return true;
}

bool decode_packet(std::span<const std::byte> payload, core::Packet& out) {
    if (payload.size() < packet_fixed_size || payload[0] != static_cast<std::byte>(RecordType::Packet)) {
        return false;
    }
    const std::byte* p = payload.data() + 1;
    out.timestamp = util::from_epoch_ns(read_le<std::uint64_t>(p));
    p += 8;
    out.address.net = read_le<std::uint16_t>(p);
    p += 2;
    out.address.subnet = read_le<std::uint16_t>(p);
    p += 2;
    out.address.universe = read_le<std::uint16_t>(p);
    p += 2;
    const auto data_len = read_le<std::uint16_t>(p);
    p += 2;
    if (data_len > core::max_channels || payload.size() - packet_fixed_size != data_len) {
        return false;
    }
    const auto* d = reinterpret_cast<const std::uint8_t*>(p);
    out.data.assign(d, d + data_len);
    return true;
}

} // namespace persist
