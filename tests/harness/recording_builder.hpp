#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include <vector>

#include <unistd.h>

#include "core/address.hpp"
#include "core/error.hpp"
#include "core/packet.hpp"
#include "persist/recording_writer.hpp"

namespace test_harness {

// Scratch directory removed when the test ends.
class TempDir {
public:
    explicit TempDir(const std::string& prefix) {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                (prefix + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter.fetch_add(1)));
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        std::filesystem::create_directories(path_, ec);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const noexcept { return path_; }
    std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

inline core::WallTime epoch_ms(std::int64_t ms) {
    return core::WallTime(std::chrono::duration_cast<core::WallTime::duration>(std::chrono::milliseconds{ms}));
}

inline core::Packet make_packet(std::int64_t ms, std::uint32_t logical_universe, std::uint8_t value,
                                std::size_t channels = core::max_channels) {
    core::Packet p;
    p.timestamp = epoch_ms(ms);
    p.address = core::map_universe(logical_universe);
    p.data.assign(channels, value);
    return p;
}

inline core::RecordingMetadata make_metadata(const std::string& name, std::vector<std::uint32_t> universes) {
    core::RecordingMetadata meta;
    meta.name = name;
    meta.created_at = epoch_ms(1'700'000'000'000);
    meta.universes = std::move(universes);
    return meta;
}

inline core::ErrorCode write_recording(const std::filesystem::path& path,
                                       const core::RecordingMetadata& meta,
                                       const std::vector<core::Packet>& packets,
                                       std::string& error) {
    persist::RecordingWriter writer;
    auto rc = writer.open(path, error);
    if (rc != core::ErrorCode::Ok) {
        return rc;
    }
    rc = writer.append_metadata(meta, error);
    for (std::size_t i = 0; rc == core::ErrorCode::Ok && i < packets.size(); ++i) {
        rc = writer.append_packet(packets[i], error);
    }
    const auto close_rc = writer.close(error);
    return rc != core::ErrorCode::Ok ? rc : close_rc;
}

inline std::vector<std::byte> read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::vector<char> chars((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    std::vector<std::byte> out(chars.size());
    for (std::size_t i = 0; i < chars.size(); ++i) {
        out[i] = static_cast<std::byte>(chars[i]);
    }
    return out;
}

inline void write_file(const std::filesystem::path& path, const std::vector<std::byte>& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

inline void write_text(const std::filesystem::path& path, const std::string& text) {
    std::ofstream out(path, std::ios::trunc);
    out << text;
}

} // namespace test_harness
