#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "core/error.hpp"
#include "core/packet.hpp"
#include "persist/file_sink.hpp"
#include "persist/gzip_stream.hpp"

namespace persist {

struct RecordingWriterOptions {
    int compression_level{6};
    // Compressed bytes are handed to the sink once this many are pending.
    std::size_t write_threshold{64 * 1024};
    // Sync-flush after every record instead of on flush().
    bool flush_each_record{false};
    std::function<std::unique_ptr<IFileSink>()> sink_factory{};
};

struct RecordingWriterStats {
    std::uint64_t records_written{0};
    std::uint64_t packets_written{0};
    std::uint64_t raw_bytes{0};
    std::uint64_t compressed_bytes{0};
    std::uint64_t flushes{0};
    std::uint64_t partial_writes{0};
};

// Append-only streaming writer for .dmxrec files.
//
//   open(path) -> append_metadata() once -> append_packet()* -> close()
//
// Memory use does not grow with the recording. After flush() returns, every
// record appended so far can be read back even if the process dies before
// close().
class RecordingWriter {
public:
    RecordingWriter();
    explicit RecordingWriter(RecordingWriterOptions opts);
    ~RecordingWriter();

    RecordingWriter(const RecordingWriter&) = delete;
    RecordingWriter& operator=(const RecordingWriter&) = delete;

    core::ErrorCode open(const std::filesystem::path& path, std::string& error);
    core::ErrorCode append_metadata(const core::RecordingMetadata& meta, std::string& error);
    core::ErrorCode append_packet(const core::Packet& packet, std::string& error);
    core::ErrorCode flush(std::string& error);
    core::ErrorCode close(std::string& error);

    bool is_open() const noexcept { return state_ != State::Closed; }
    const std::filesystem::path& path() const noexcept { return path_; }
    const RecordingWriterStats& stats() const noexcept { return stats_; }

private:
    enum class State { Closed, AwaitingMetadata, Streaming };

    core::ErrorCode append_record(const std::vector<std::byte>& payload, std::string& error);
    core::ErrorCode drain(std::string& error);
    void abandon() noexcept;

    RecordingWriterOptions opts_;
    std::unique_ptr<IFileSink> sink_;
    GzipDeflater deflater_;
    std::vector<std::byte> record_buf_;
    std::vector<std::byte> pending_;
    std::filesystem::path path_;
    State state_{State::Closed};
    RecordingWriterStats stats_{};
};

} // namespace persist
