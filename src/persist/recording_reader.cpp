#include "persist/recording_reader.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>
#include <vector>

#include "persist/gzip_stream.hpp"
#include "persist/recording_format.hpp"
#include "util/log.hpp"

namespace persist {

bool has_recording_extension(const std::filesystem::path& path) {
    return path.extension() == recording_extension;
}

core::ErrorCode RecordingReader::load(const std::filesystem::path& path, core::Recording& out, std::string& error) {
    stats_ = RecordingReaderStats{};
    std::error_code ec;
    if (!std::filesystem::exists(path, ec) || ec) {
        error = "recording not found: " + path.string();
        return core::ErrorCode::NotFound;
    }
    if (!has_recording_extension(path)) {
        error = "invalid file format: " + path.filename().string() + " (expected " +
                std::string(recording_extension) + ")";
        return core::ErrorCode::InvalidFormat;
    }
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        error = "not a regular file: " + path.string();
        return core::ErrorCode::InvalidFormat;
    }
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        error = "cannot stat " + path.string() + ": " + ec.message();
        return core::ErrorCode::IoError;
    }

    std::vector<std::byte> bytes(static_cast<std::size_t>(size));
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        error = "cannot open " + path.string();
        return core::ErrorCode::IoError;
    }
    in.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!in && !in.eof()) {
        error = "read failed: " + path.string();
        return core::ErrorCode::IoError;
    }
    return load_bytes(bytes, out, error);
}

core::ErrorCode RecordingReader::load_bytes(std::span<const std::byte> file_bytes, core::Recording& out,
                                            std::string& error) {
    stats_ = RecordingReaderStats{};
    stats_.compressed_bytes = file_bytes.size();
    if (!has_gzip_magic(file_bytes)) {
        error = "not a compressed recording (bad gzip magic)";
        return core::ErrorCode::InvalidFormat;
    }

    std::vector<std::byte> content;
    content.reserve(file_bytes.size() * 4);
    const GunzipResult gz = gunzip_tolerant(file_bytes, content);
    stats_.decompressed_bytes = content.size();
    switch (gz.status) {
    case GunzipStatus::Complete:
        stats_.stream_complete = true;
        break;
    case GunzipStatus::Truncated:
        ++stats_.truncated_tail;
        util::log(util::LogLevel::Warn, "recording stream truncated after %zu bytes; keeping complete records",
                  content.size());
        break;
    case GunzipStatus::BadHeader:
        error = "unreadable gzip header";
        return core::ErrorCode::InvalidFormat;
    case GunzipStatus::DataError:
        ++stats_.truncated_tail;
        util::log(util::LogLevel::Warn, "recording stream corrupt after %zu bytes; keeping complete records",
                  content.size());
        break;
    }
    return parse_records(content, out, error);
}

core::ErrorCode RecordingReader::parse_records(std::span<const std::byte> content, core::Recording& out,
                                               std::string& error) {
    if (content.size() < recording_header_size) {
        error = "recording too short for header";
        return core::ErrorCode::CorruptRecording;
    }
    if (!parse_header(content)) {
        error = "bad recording magic or version";
        return core::ErrorCode::InvalidFormat;
    }

    core::Recording rec;
    bool have_metadata = false;
    std::size_t offset = recording_header_size;
    while (offset < content.size()) {
        const std::size_t remaining = content.size() - offset;
        const std::byte* ptr = content.data() + offset;
        RecordView view{};
        if (!parse_record(ptr, remaining, view)) {
            const auto len = remaining >= sizeof(std::uint32_t) ? read_le<std::uint32_t>(ptr) : 0u;
            const bool bad_length = remaining >= sizeof(std::uint32_t) && (len == 0 || len > max_record_payload);
            if (bad_length) {
                error = "record boundary lost at offset " + std::to_string(offset);
                return core::ErrorCode::CorruptRecording;
            }
            // Partial last record.
            if (stats_.truncated_tail == 0) {
                ++stats_.truncated_tail;
            }
            break;
        }
        offset += framed_size(view.payload_length);

        if (!validate_record(view)) {
            ++stats_.checksum_failures;
            if (!have_metadata) {
                error = "metadata record failed checksum";
                return core::ErrorCode::CorruptRecording;
            }
            continue;
        }

        const auto type = static_cast<RecordType>(view.payload[0]);
        if (!have_metadata) {
            if (type != RecordType::Metadata || !decode_metadata(view.payload, rec.metadata)) {
                error = "first record is not recording metadata";
                return core::ErrorCode::CorruptRecording;
            }
            have_metadata = true;
            ++stats_.records_ok;
            continue;
        }
        if (type == RecordType::Metadata) {
            ++stats_.duplicate_metadata;
            continue;
        }
        core::Packet packet;
        if (type != RecordType::Packet || !decode_packet(view.payload, packet)) {
            ++stats_.malformed_packets;
            continue;
        }
        rec.packets.push_back(std::move(packet));
        ++stats_.records_ok;
    }

    if (!have_metadata) {
        error = "recording has no metadata record";
        return core::ErrorCode::CorruptRecording;
    }
    if (stats_.checksum_failures > 0 || stats_.malformed_packets > 0) {
        util::log(util::LogLevel::Warn, "dropped %llu corrupt and %llu malformed records",
                  static_cast<unsigned long long>(stats_.checksum_failures),
                  static_cast<unsigned long long>(stats_.malformed_packets));
    }

    std::stable_sort(rec.packets.begin(), rec.packets.end(),
                     [](const core::Packet& a, const core::Packet& b) { return a.timestamp < b.timestamp; });
    out = std::move(rec);
    return core::ErrorCode::Ok;
}

} // namespace persist
