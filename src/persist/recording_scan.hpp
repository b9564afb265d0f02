#pragma once

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "persist/recording_format.hpp"

namespace persist {

struct RecordingFileInfo {
    std::filesystem::path path;
    std::uint64_t timestamp_key{0};
    bool parsed{false};
};

// Recording names are YYYY-MM-DD-HH-MM-SS.dmxrec; the key is YYYYMMDDHHMMSS.
inline bool parse_recording_filename(const std::filesystem::path& path, RecordingFileInfo& out) {
    const auto stem = path.stem().string();
    if (stem.size() != 19) {
        return false;
    }
    std::uint64_t key = 0;
    for (std::size_t i = 0; i < stem.size(); ++i) {
        const bool dash_pos = (i == 4 || i == 7 || i == 10 || i == 13 || i == 16);
        if (dash_pos) {
            if (stem[i] != '-') {
                return false;
            }
            continue;
        }
        unsigned digit = 0;
        const auto res = std::from_chars(stem.data() + i, stem.data() + i + 1, digit);
        if (res.ec != std::errc()) {
            return false;
        }
        key = key * 10 + digit;
    }
    out.path = path;
    out.timestamp_key = key;
    out.parsed = true;
    return true;
}

// Regular files with the recording extension, oldest timestamped name first,
// then the rest by name. Never throws.
inline std::vector<std::filesystem::path> scan_recordings(const std::filesystem::path& dir) {
    std::vector<RecordingFileInfo> infos;
    std::error_code ec;
    if (dir.empty()) {
        return {};
    }
    std::filesystem::directory_iterator it(dir, ec);
    for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        const auto& entry = *it;
        std::error_code type_ec;
        if (!entry.is_regular_file(type_ec) || entry.path().extension() != recording_extension) {
            continue;
        }
        RecordingFileInfo info;
        if (!parse_recording_filename(entry.path(), info)) {
            info.path = entry.path();
        }
        infos.push_back(std::move(info));
    }
    std::sort(infos.begin(), infos.end(), [](const RecordingFileInfo& a, const RecordingFileInfo& b) {
        if (a.parsed != b.parsed) {
            return a.parsed;
        }
        if (a.parsed && a.timestamp_key != b.timestamp_key) {
            return a.timestamp_key < b.timestamp_key;
        }
        return a.path < b.path;
    });
    std::vector<std::filesystem::path> out;
    out.reserve(infos.size());
    for (auto& info : infos) {
        out.push_back(std::move(info.path));
    }
    return out;
}

} // namespace persist
