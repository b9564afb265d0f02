#pragma once

#include <chrono>

namespace core {

// Fires once after `window` without activity while the system is neither
// recording nor playing. Any activity re-arms it.
class IdleWatchdog {
public:
    using time_point = std::chrono::steady_clock::time_point;

    explicit IdleWatchdog(std::chrono::milliseconds window) noexcept : window_(window) {}

    void touch(time_point now) noexcept {
        last_activity_ = now;
        armed_ = true;
    }

    // Returns true exactly once per idle period.
    [[nodiscard]] bool poll(time_point now, bool busy) noexcept {
        if (!armed_ || window_.count() <= 0) {
            return false;
        }
        if (now - last_activity_ < window_) {
            return false;
        }
        armed_ = false;
        return !busy;
    }

    bool armed() const noexcept { return armed_; }
    std::chrono::milliseconds window() const noexcept { return window_; }

private:
    std::chrono::milliseconds window_;
    time_point last_activity_{};
    bool armed_{false};
};

} // namespace core
