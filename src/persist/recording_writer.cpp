#include "persist/recording_writer.hpp"

#include <cerrno>
#include <cstring>

#include "persist/recording_format.hpp"
#include "util/log.hpp"

namespace persist {

RecordingWriter::RecordingWriter() : RecordingWriter(RecordingWriterOptions{}) {}

RecordingWriter::RecordingWriter(RecordingWriterOptions opts) : opts_(std::move(opts)) {
    record_buf_.reserve(framed_size(packet_fixed_size + core::max_channels));
}

RecordingWriter::~RecordingWriter() {
    if (state_ != State::Closed) {
        std::string error;
        if (close(error) != core::ErrorCode::Ok) {
            util::log(util::LogLevel::Error, "RecordingWriter close on destruction failed: %s", error.c_str());
        }
    }
}

core::ErrorCode RecordingWriter::open(const std::filesystem::path& path, std::string& error) {
    if (state_ != State::Closed) {
        error = "writer already open: " + path_.string();
        return core::ErrorCode::InvalidState;
    }
    sink_ = opts_.sink_factory ? opts_.sink_factory() : std::make_unique<PosixFileSink>();
    const IoResult res = sink_->open(path.string());
    if (!res.ok) {
        error = "failed to open " + path.string() + ": " + std::strerror(res.error_code);
        sink_.reset();
        return res.error_code == ENOENT ? core::ErrorCode::NotFound : core::ErrorCode::IoError;
    }
    if (!deflater_.init(opts_.compression_level)) {
        error = "deflateInit2 failed";
        abandon();
        return core::ErrorCode::IoError;
    }
    path_ = path;
    stats_ = RecordingWriterStats{};
    pending_.clear();
    state_ = State::AwaitingMetadata;

    const auto header = encode_header();
    if (!deflater_.write(header, pending_)) {
        error = "compression failed writing header";
        abandon();
        return core::ErrorCode::IoError;
    }
    stats_.raw_bytes += header.size();
    return core::ErrorCode::Ok;
}

core::ErrorCode RecordingWriter::append_metadata(const core::RecordingMetadata& meta, std::string& error) {
    if (state_ != State::AwaitingMetadata) {
        error = state_ == State::Closed ? "writer not open" : "metadata already written";
        return core::ErrorCode::InvalidState;
    }
    const auto rc = append_record(encode_metadata(meta), error);
    if (rc != core::ErrorCode::Ok) {
        return rc;
    }
    state_ = State::Streaming;
    // Make the metadata durable right away so even an empty recording loads.
    return flush(error);
}

core::ErrorCode RecordingWriter::append_packet(const core::Packet& packet, std::string& error) {
    if (state_ != State::Streaming) {
        error = state_ == State::Closed ? "writer not open" : "metadata must be written first";
        return core::ErrorCode::InvalidState;
    }
    if (packet.data.size() > core::max_channels) {
        error = "packet exceeds 512 channels";
        return core::ErrorCode::InvalidArgument;
    }
    const auto rc = append_record(encode_packet(packet), error);
    if (rc == core::ErrorCode::Ok) {
        ++stats_.packets_written;
    }
    return rc;
}

core::ErrorCode RecordingWriter::append_record(const std::vector<std::byte>& payload, std::string& error) {
    record_buf_.clear();
    frame_record(payload, record_buf_);
    if (!deflater_.write(record_buf_, pending_)) {
        error = "compression failed (zlib " + std::to_string(deflater_.last_error()) + ")";
        return core::ErrorCode::IoError;
    }
    ++stats_.records_written;
    stats_.raw_bytes += record_buf_.size();
    if (opts_.flush_each_record) {
        return flush(error);
    }
    if (pending_.size() >= opts_.write_threshold) {
        return drain(error);
    }
    return core::ErrorCode::Ok;
}

core::ErrorCode RecordingWriter::flush(std::string& error) {
    if (state_ == State::Closed) {
        error = "writer not open";
        return core::ErrorCode::InvalidState;
    }
    if (!deflater_.sync_flush(pending_)) {
        error = "compression flush failed";
        return core::ErrorCode::IoError;
    }
    ++stats_.flushes;
    return drain(error);
}

core::ErrorCode RecordingWriter::drain(std::string& error) {
    if (pending_.empty()) {
        return core::ErrorCode::Ok;
    }
    const IoResult res = write_fully(*sink_, pending_.data(), pending_.size(), stats_.partial_writes);
    if (!res.ok) {
        error = "write to " + path_.string() + " failed: " + std::strerror(res.error_code);
        return core::ErrorCode::IoError;
    }
    stats_.compressed_bytes += pending_.size();
    pending_.clear();
    return core::ErrorCode::Ok;
}

core::ErrorCode RecordingWriter::close(std::string& error) {
    if (state_ == State::Closed) {
        return core::ErrorCode::Ok;
    }
    auto rc = core::ErrorCode::Ok;
    if (!deflater_.finish(pending_)) {
        error = "compression finish failed";
        rc = core::ErrorCode::IoError;
    }
    if (rc == core::ErrorCode::Ok) {
        rc = drain(error);
    }
    if (rc == core::ErrorCode::Ok) {
        const IoResult res = sink_->sync();
        if (!res.ok) {
            util::log(util::LogLevel::Warn, "RecordingWriter sync of %s failed: %s",
                      path_.string().c_str(), std::strerror(res.error_code));
        }
    }
    sink_->close();
    sink_.reset();
    pending_.clear();
    state_ = State::Closed;
    return rc;
}

void RecordingWriter::abandon() noexcept {
    if (sink_) {
        sink_->close();
        sink_.reset();
    }
    pending_.clear();
    state_ = State::Closed;
}

} // namespace persist
