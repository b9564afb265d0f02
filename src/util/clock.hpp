#pragma once

#include <chrono>
#include <thread>

namespace util {

// Clock seams so pacing, idle timeouts and capture timestamps can be driven
// deterministically in tests.
class SteadyClock {
public:
    using time_point = std::chrono::steady_clock::time_point;
    using duration = std::chrono::steady_clock::duration;

    virtual ~SteadyClock() = default;
    virtual time_point now() const noexcept { return std::chrono::steady_clock::now(); }
    virtual void sleep_until(time_point deadline) { std::this_thread::sleep_until(deadline); }
};

class SystemClock {
public:
    using time_point = std::chrono::system_clock::time_point;

    virtual ~SystemClock() = default;
    virtual time_point now() const noexcept { return std::chrono::system_clock::now(); }
};

} // namespace util
