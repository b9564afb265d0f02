#pragma once

#include <chrono>
#include <cstdint>

namespace util {

using WallTime = std::chrono::system_clock::time_point;

[[nodiscard]] inline std::uint64_t to_epoch_ns(WallTime tp) noexcept {
    return static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count());
}

[[nodiscard]] inline WallTime from_epoch_ns(std::uint64_t ns) noexcept {
    return WallTime(std::chrono::duration_cast<WallTime::duration>(
        std::chrono::nanoseconds(static_cast<std::int64_t>(ns))));
}

} // namespace util
