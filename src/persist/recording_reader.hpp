#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>

#include "core/error.hpp"
#include "core/packet.hpp"

namespace persist {

struct RecordingReaderStats {
    std::uint64_t compressed_bytes{0};
    std::uint64_t decompressed_bytes{0};
    std::uint64_t records_ok{0};
    std::uint64_t checksum_failures{0};
    std::uint64_t malformed_packets{0};
    std::uint64_t duplicate_metadata{0};
    std::uint64_t truncated_tail{0}; // 1 when the stream or last record was cut short
    bool stream_complete{false};    // gzip trailer present
};

// Loads a whole .dmxrec file. The result's packets are stably sorted by
// timestamp whatever order they were written in.
//
// Errors:
//   NotFound         - path does not exist (checked before the extension)
//   InvalidFormat    - wrong extension, not gzip, or wrong inner magic
//   CorruptRecording - no metadata record, or a record boundary cannot be found
// A record cut off by a crash ends the load successfully; records failing
// their checksum and malformed packets are skipped and counted.
class RecordingReader {
public:
    core::ErrorCode load(const std::filesystem::path& path, core::Recording& out, std::string& error);

    // Same, for a gzip buffer already in memory.
    core::ErrorCode load_bytes(std::span<const std::byte> file_bytes, core::Recording& out, std::string& error);

    const RecordingReaderStats& stats() const noexcept { return stats_; }

private:
    core::ErrorCode parse_records(std::span<const std::byte> content, core::Recording& out, std::string& error);

    RecordingReaderStats stats_{};
};

bool has_recording_extension(const std::filesystem::path& path);

} // namespace persist
