#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "harness/fake_file_sink.hpp"
#include "harness/recording_builder.hpp"
#include "persist/gzip_stream.hpp"
#include "persist/recording_format.hpp"
#include "persist/recording_reader.hpp"
#include "persist/recording_scan.hpp"
#include "persist/recording_writer.hpp"

using test_harness::FakeFileSink;
using test_harness::HolderSink;
using test_harness::make_metadata;
using test_harness::make_packet;
using test_harness::TempDir;

namespace {

persist::RecordingWriterOptions fake_sink_options(std::shared_ptr<FakeFileSink> sink) {
    persist::RecordingWriterOptions opts;
    opts.sink_factory = [sink]() { return std::make_unique<HolderSink>(sink); };
    return opts;
}

// Deflates a raw record stream the way the writer would, without validation.
std::vector<std::byte> gzip_content(const std::vector<std::byte>& content) {
    persist::GzipDeflater deflater;
    std::vector<std::byte> out;
    if (!deflater.init() || !deflater.write(content, out) || !deflater.finish(out)) {
        return {};
    }
    return out;
}

std::vector<std::byte> content_with(const std::vector<std::vector<std::byte>>& payloads) {
    std::vector<std::byte> content;
    const auto header = persist::encode_header();
    content.insert(content.end(), header.begin(), header.end());
    for (const auto& p : payloads) {
        persist::frame_record(p, content);
    }
    return content;
}

TEST(RecordingIoTests, WriteThenLoadSortsByTimestamp) {
    TempDir dir("dmxrec_io_roundtrip");
    const auto path = dir / "2024-05-01-10-00-00.dmxrec";
    const auto meta = make_metadata(path.filename().string(), {1, 2});
    const std::vector<core::Packet> packets{
        make_packet(50, 2, 20),
        make_packet(0, 1, 10),
        make_packet(120, 1, 30),
    };
    std::string error;
    ASSERT_EQ(test_harness::write_recording(path, meta, packets, error), core::ErrorCode::Ok) << error;

    persist::RecordingReader reader;
    core::Recording rec;
    ASSERT_EQ(reader.load(path, rec, error), core::ErrorCode::Ok) << error;
    EXPECT_EQ(rec.metadata, meta);
    ASSERT_EQ(rec.packets.size(), 3u);
    EXPECT_EQ(rec.packets[0], packets[1]);
    EXPECT_EQ(rec.packets[1], packets[0]);
    EXPECT_EQ(rec.packets[2], packets[2]);
    EXPECT_TRUE(reader.stats().stream_complete);
    EXPECT_EQ(reader.stats().records_ok, 4u);
    EXPECT_EQ(reader.stats().truncated_tail, 0u);
}

TEST(RecordingIoTests, EmptyRecordingLoadsWithMetadataOnly) {
    TempDir dir("dmxrec_io_empty");
    const auto path = dir / "empty.dmxrec";
    std::string error;
    ASSERT_EQ(test_harness::write_recording(path, make_metadata("empty", {}), {}, error), core::ErrorCode::Ok);

    persist::RecordingReader reader;
    core::Recording rec;
    ASSERT_EQ(reader.load(path, rec, error), core::ErrorCode::Ok) << error;
    EXPECT_TRUE(rec.packets.empty());
    EXPECT_EQ(rec.metadata.name, "empty");
}

TEST(RecordingIoTests, FileCutAfterLastFlushKeepsCompleteRecords) {
    auto sink = std::make_shared<FakeFileSink>();
    persist::RecordingWriter writer(fake_sink_options(sink));
    std::string error;
    ASSERT_EQ(writer.open("mem.dmxrec", error), core::ErrorCode::Ok);
    ASSERT_EQ(writer.append_metadata(make_metadata("mem", {1}), error), core::ErrorCode::Ok);
    for (int i = 0; i < 10; ++i) {
        ASSERT_EQ(writer.append_packet(make_packet(i * 25, 1, static_cast<std::uint8_t>(i)), error),
                  core::ErrorCode::Ok);
    }
    ASSERT_EQ(writer.flush(error), core::ErrorCode::Ok);
    const auto durable = sink->data_;
    // Never flushed or closed: the process "crashes" here.
    ASSERT_EQ(writer.append_packet(make_packet(1000, 1, 99), error), core::ErrorCode::Ok);

    persist::RecordingReader reader;
    core::Recording rec;
    ASSERT_EQ(reader.load_bytes(durable, rec, error), core::ErrorCode::Ok) << error;
    ASSERT_EQ(rec.packets.size(), 10u);
    EXPECT_EQ(rec.packets.back(), make_packet(225, 1, 9));
    EXPECT_FALSE(reader.stats().stream_complete);
    EXPECT_EQ(reader.stats().truncated_tail, 1u);
}

TEST(RecordingIoTests, MissingFinalRecordLoadsPriorRecords) {
    std::vector<std::vector<std::byte>> payloads{persist::encode_metadata(make_metadata("cut", {1}))};
    for (int i = 0; i < 5; ++i) {
        payloads.push_back(persist::encode_packet(make_packet(i * 10, 1, static_cast<std::uint8_t>(i))));
    }
    auto content = content_with(payloads);
    // Drop the last 7 bytes: the fifth packet record is incomplete.
    content.resize(content.size() - 7);

    persist::RecordingReader reader;
    core::Recording rec;
    std::string error;
    ASSERT_EQ(reader.load_bytes(gzip_content(content), rec, error), core::ErrorCode::Ok) << error;
    EXPECT_EQ(rec.packets.size(), 4u);
    EXPECT_EQ(reader.stats().truncated_tail, 1u);
}

TEST(RecordingIoTests, TruncatedFileOnDiskLoads) {
    TempDir dir("dmxrec_io_truncated");
    const auto path = dir / "cut.dmxrec";
    std::vector<core::Packet> packets;
    for (int i = 0; i < 200; ++i) {
        packets.push_back(make_packet(i * 25, static_cast<std::uint32_t>(i % 4), static_cast<std::uint8_t>(i)));
    }
    std::string error;
    persist::RecordingWriterOptions opts;
    opts.flush_each_record = true;
    {
        persist::RecordingWriter writer(opts);
        ASSERT_EQ(writer.open(path, error), core::ErrorCode::Ok);
        ASSERT_EQ(writer.append_metadata(make_metadata("cut", {0, 1, 2, 3}), error), core::ErrorCode::Ok);
        for (const auto& p : packets) {
            ASSERT_EQ(writer.append_packet(p, error), core::ErrorCode::Ok);
        }
        ASSERT_EQ(writer.close(error), core::ErrorCode::Ok);
    }
    auto bytes = test_harness::read_file(path);
    bytes.resize(bytes.size() * 3 / 4);
    test_harness::write_file(path, bytes);

    persist::RecordingReader reader;
    core::Recording rec;
    ASSERT_EQ(reader.load(path, rec, error), core::ErrorCode::Ok) << error;
    EXPECT_GT(rec.packets.size(), 0u);
    EXPECT_LT(rec.packets.size(), packets.size());
    for (std::size_t i = 0; i < rec.packets.size(); ++i) {
        EXPECT_EQ(rec.packets[i], packets[i]);
    }
}

TEST(RecordingIoTests, ChecksumFailureSkipsOnlyThatRecord) {
    std::vector<std::vector<std::byte>> payloads{persist::encode_metadata(make_metadata("crc", {1}))};
    for (int i = 0; i < 3; ++i) {
        payloads.push_back(persist::encode_packet(make_packet(i * 10, 1, static_cast<std::uint8_t>(i), 4)));
    }
    auto content = content_with(payloads);
    // Corrupt one data byte of the second packet record.
    const std::size_t meta_framed = persist::framed_size(payloads[0].size());
    const std::size_t packet_framed = persist::framed_size(payloads[1].size());
    const std::size_t second = persist::recording_header_size + meta_framed + packet_framed;
    content[second + 4 + persist::packet_fixed_size] ^= std::byte{0xff};

    persist::RecordingReader reader;
    core::Recording rec;
    std::string error;
    ASSERT_EQ(reader.load_bytes(gzip_content(content), rec, error), core::ErrorCode::Ok) << error;
    ASSERT_EQ(rec.packets.size(), 2u);
    EXPECT_EQ(rec.packets[0].data[0], 0);
    EXPECT_EQ(rec.packets[1].data[0], 2);
    EXPECT_EQ(reader.stats().checksum_failures, 1u);
}

TEST(RecordingIoTests, LostRecordBoundaryIsCorrupt) {
    std::vector<std::vector<std::byte>> payloads{persist::encode_metadata(make_metadata("lost", {1})),
                                                 persist::encode_packet(make_packet(0, 1, 0, 4))};
    auto content = content_with(payloads);
    // Garbage length prefix after the metadata.
    const std::size_t at = persist::recording_header_size + persist::framed_size(payloads[0].size());
    content[at] = std::byte{0};
    content[at + 1] = std::byte{0};
    content[at + 2] = std::byte{0};
    content[at + 3] = std::byte{0};

    persist::RecordingReader reader;
    core::Recording rec;
    std::string error;
    EXPECT_EQ(reader.load_bytes(gzip_content(content), rec, error), core::ErrorCode::CorruptRecording);
}

TEST(RecordingIoTests, MissingMetadataIsCorrupt) {
    auto content = content_with({persist::encode_packet(make_packet(0, 1, 0, 4))});
    persist::RecordingReader reader;
    core::Recording rec;
    std::string error;
    EXPECT_EQ(reader.load_bytes(gzip_content(content), rec, error), core::ErrorCode::CorruptRecording);

    auto header_only = content_with({});
    EXPECT_EQ(reader.load_bytes(gzip_content(header_only), rec, error), core::ErrorCode::CorruptRecording);
}

TEST(RecordingIoTests, DuplicateMetadataAndUnknownRecordsAreSkipped) {
    std::vector<std::byte> unknown{std::byte{7}, std::byte{1}, std::byte{2}};
    auto content = content_with({persist::encode_metadata(make_metadata("dup", {1})),
                                 persist::encode_metadata(make_metadata("again", {2})),
                                 unknown,
                                 persist::encode_packet(make_packet(0, 1, 5, 4))});
    persist::RecordingReader reader;
    core::Recording rec;
    std::string error;
    ASSERT_EQ(reader.load_bytes(gzip_content(content), rec, error), core::ErrorCode::Ok) << error;
    EXPECT_EQ(rec.metadata.name, "dup");
    EXPECT_EQ(rec.packets.size(), 1u);
    EXPECT_EQ(reader.stats().duplicate_metadata, 1u);
    EXPECT_EQ(reader.stats().malformed_packets, 1u);
}

TEST(RecordingIoTests, WrongInnerMagicIsInvalidFormat) {
    auto content = content_with({persist::encode_metadata(make_metadata("magic", {1}))});
    content[0] = std::byte{'Z'};
    persist::RecordingReader reader;
    core::Recording rec;
    std::string error;
    EXPECT_EQ(reader.load_bytes(gzip_content(content), rec, error), core::ErrorCode::InvalidFormat);
}

TEST(RecordingIoTests, LoadReportsNotFoundBeforeExtension) {
    TempDir dir("dmxrec_io_missing");
    persist::RecordingReader reader;
    core::Recording rec;
    std::string error;
    EXPECT_EQ(reader.load(dir / "missing.rec", rec, error), core::ErrorCode::NotFound);
    EXPECT_EQ(reader.load(dir / "missing.dmxrec", rec, error), core::ErrorCode::NotFound);
}

TEST(RecordingIoTests, WrongExtensionOrPlainTextIsInvalidFormat) {
    TempDir dir("dmxrec_io_format");
    test_harness::write_text(dir / "show.json", "[]");
    test_harness::write_text(dir / "show.dmxrec", "[{\"timestamp\": 0}]");

    persist::RecordingReader reader;
    core::Recording rec;
    std::string error;
    EXPECT_EQ(reader.load(dir / "show.json", rec, error), core::ErrorCode::InvalidFormat);
    EXPECT_EQ(reader.load(dir / "show.dmxrec", rec, error), core::ErrorCode::InvalidFormat);
}

TEST(RecordingIoTests, WriterSurvivesPartialWritesAndEintr) {
    auto sink = std::make_shared<FakeFileSink>(3, true);
    persist::RecordingWriter writer(fake_sink_options(sink));
    std::string error;
    ASSERT_EQ(writer.open("mem.dmxrec", error), core::ErrorCode::Ok);
    ASSERT_EQ(writer.append_metadata(make_metadata("partial", {1}), error), core::ErrorCode::Ok);
    ASSERT_EQ(writer.append_packet(make_packet(0, 1, 1), error), core::ErrorCode::Ok);
    ASSERT_EQ(writer.close(error), core::ErrorCode::Ok);
    EXPECT_GT(writer.stats().partial_writes, 0u);
    EXPECT_EQ(sink->syncs_, 1);

    persist::RecordingReader reader;
    core::Recording rec;
    ASSERT_EQ(reader.load_bytes(sink->data_, rec, error), core::ErrorCode::Ok) << error;
    EXPECT_EQ(rec.packets.size(), 1u);
    EXPECT_TRUE(reader.stats().stream_complete);
}

TEST(RecordingIoTests, WriterEnforcesRecordOrder) {
    auto sink = std::make_shared<FakeFileSink>();
    persist::RecordingWriter writer(fake_sink_options(sink));
    std::string error;
    EXPECT_EQ(writer.append_metadata(make_metadata("x", {}), error), core::ErrorCode::InvalidState);
    ASSERT_EQ(writer.open("mem.dmxrec", error), core::ErrorCode::Ok);
    EXPECT_EQ(writer.append_packet(make_packet(0, 1, 1), error), core::ErrorCode::InvalidState);
    ASSERT_EQ(writer.append_metadata(make_metadata("x", {}), error), core::ErrorCode::Ok);
    EXPECT_EQ(writer.append_metadata(make_metadata("x", {}), error), core::ErrorCode::InvalidState);
    EXPECT_EQ(writer.append_packet(make_packet(0, 1, 1, 513), error), core::ErrorCode::InvalidArgument);
    EXPECT_EQ(writer.open("other.dmxrec", error), core::ErrorCode::InvalidState);
}

TEST(RecordingIoTests, WriterReportsSinkFailures) {
    auto sink = std::make_shared<FakeFileSink>();
    sink->fail_open_ = true;
    persist::RecordingWriter writer(fake_sink_options(sink));
    std::string error;
    EXPECT_EQ(writer.open("mem.dmxrec", error), core::ErrorCode::IoError);
    EXPECT_FALSE(writer.is_open());

    sink->fail_open_ = false;
    ASSERT_EQ(writer.open("mem.dmxrec", error), core::ErrorCode::Ok);
    sink->fail_after_bytes_ = 0;
    EXPECT_EQ(writer.append_metadata(make_metadata("full", {}), error), core::ErrorCode::IoError);
    EXPECT_FALSE(error.empty());
}

TEST(RecordingIoTests, OpenInMissingDirectoryIsNotFound) {
    TempDir dir("dmxrec_io_nodir");
    persist::RecordingWriter writer;
    std::string error;
    EXPECT_EQ(writer.open(dir / "no" / "such" / "x.dmxrec", error), core::ErrorCode::NotFound);
}

TEST(RecordingScanTests, ListsRecordingsOldestFirst) {
    TempDir dir("dmxrec_scan");
    test_harness::write_text(dir / "2024-05-01-10-00-00.dmxrec", "");
    test_harness::write_text(dir / "2023-12-31-23-59-59.dmxrec", "");
    test_harness::write_text(dir / "custom.dmxrec", "");
    test_harness::write_text(dir / "notes.txt", "");
    std::filesystem::create_directories(dir / "sub.dmxrec");

    const auto files = persist::scan_recordings(dir.path());
    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0].filename().string(), "2023-12-31-23-59-59.dmxrec");
    EXPECT_EQ(files[1].filename().string(), "2024-05-01-10-00-00.dmxrec");
    EXPECT_EQ(files[2].filename().string(), "custom.dmxrec");
}

TEST(RecordingScanTests, MissingDirectoryIsEmpty) {
    EXPECT_TRUE(persist::scan_recordings("/nonexistent/dmxrec/dir").empty());
    EXPECT_TRUE(persist::scan_recordings("").empty());
}

TEST(RecordingScanTests, ParsesTimestampedNames) {
    persist::RecordingFileInfo info;
    ASSERT_TRUE(persist::parse_recording_filename("2024-05-01-10-00-07.dmxrec", info));
    EXPECT_EQ(info.timestamp_key, 20240501100007u);
    EXPECT_FALSE(persist::parse_recording_filename("2024-05-01-10-00-07-1.dmxrec", info));
    EXPECT_FALSE(persist::parse_recording_filename("2024_05-01-10-00-07.dmxrec", info));
}

} // namespace
