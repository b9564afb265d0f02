#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <thread>

#include "util/clock.hpp"

namespace test_harness {

// Steady clock that only moves when told to. sleep_until() jumps straight to
// the deadline, so paced loops run instantly and sleeps can be inspected.
class FakeSteadyClock : public util::SteadyClock {
public:
    using time_point = util::SteadyClock::time_point;

    time_point now() const noexcept override { return time_point(duration(now_.load(std::memory_order_acquire))); }

    void sleep_until(time_point deadline) override {
        sleeps_.fetch_add(1, std::memory_order_relaxed);
        auto cur = now_.load(std::memory_order_acquire);
        const auto target = deadline.time_since_epoch().count();
        while (cur < target && !now_.compare_exchange_weak(cur, target, std::memory_order_acq_rel)) {
        }
        std::this_thread::yield();
    }

    void advance(std::chrono::nanoseconds d) noexcept {
        now_.fetch_add(std::chrono::duration_cast<duration>(d).count(), std::memory_order_acq_rel);
    }

    std::uint64_t sleeps() const noexcept { return sleeps_.load(std::memory_order_relaxed); }

private:
    std::atomic<duration::rep> now_{std::chrono::duration_cast<duration>(std::chrono::hours{1}).count()};
    std::atomic<std::uint64_t> sleeps_{0};
};

class FakeSystemClock : public util::SystemClock {
public:
    using time_point = util::SystemClock::time_point;

    time_point now() const noexcept override { return now_; }
    void set(time_point tp) noexcept { now_ = tp; }

private:
    time_point now_{std::chrono::system_clock::now()};
};

} // namespace test_harness
