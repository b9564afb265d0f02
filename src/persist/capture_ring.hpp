#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>

#include "core/packet.hpp"

namespace persist {

// Fixed-size copy of an inbound packet. Lives in the ring so the receive
// path never allocates.
struct CapturedPacket {
    // Producer-chosen marker, e.g. the recording session the packet belongs to.
    std::uint32_t tag{0};
    std::uint64_t timestamp_ns{0};
    core::Address address{};
    std::uint16_t length{0};
    std::uint8_t data[core::max_channels]{};

    std::span<const std::uint8_t> payload() const noexcept { return {data, length}; }
};

// Single producer (transport poll thread), single consumer (recording writer thread).
template <std::size_t CapacityPow2>
class CaptureRing {
    static_assert((CapacityPow2 & (CapacityPow2 - 1)) == 0, "Capacity must be power of two");

public:
    CaptureRing() = default;

    CaptureRing(const CaptureRing&) = delete;
    CaptureRing& operator=(const CaptureRing&) = delete;

    static constexpr std::size_t capacity() noexcept { return CapacityPow2; }

    bool try_push(std::uint32_t tag,
                  std::uint64_t timestamp_ns,
                  const core::Address& address,
                  std::span<const std::uint8_t> data) noexcept {
        if (data.size() > core::max_channels) {
            return false;
        }
        const auto tail = tail_.load(std::memory_order_relaxed);
        const auto head = head_.load(std::memory_order_acquire);
        const auto next_tail = increment(tail);
        if (next_tail == head) {
            return false; // full
        }
        CapturedPacket& slot = slots_[tail];
        slot.tag = tag;
        slot.timestamp_ns = timestamp_ns;
        slot.address = address;
        slot.length = static_cast<std::uint16_t>(data.size());
        if (!data.empty()) {
            std::memcpy(slot.data, data.data(), data.size());
        }
        tail_.store(next_tail, std::memory_order_release);
        return true;
    }

    // Returned pointer stays valid until release() is called.
    const CapturedPacket* front() const noexcept {
        const auto head_val = head_.load(std::memory_order_relaxed);
        if (head_val == tail_.load(std::memory_order_acquire)) {
            return nullptr;
        }
        return &slots_[head_val];
    }

    void release() noexcept {
        const auto head_val = head_.load(std::memory_order_relaxed);
        head_.store(increment(head_val), std::memory_order_release);
    }

    std::size_t size_approx() const noexcept {
        const auto h = head_.load(std::memory_order_acquire);
        const auto t = tail_.load(std::memory_order_acquire);
        return t >= h ? t - h : CapacityPow2 - (h - t);
    }

private:
    static constexpr std::size_t mask() noexcept { return CapacityPow2 - 1; }
    static constexpr std::size_t increment(std::size_t v) noexcept { return (v + 1) & mask(); }

    alignas(64) std::atomic<std::size_t> head_{0};
    char pad1_[64 - sizeof(head_)]{};
    alignas(64) std::atomic<std::size_t> tail_{0};
    char pad2_[64 - sizeof(tail_)]{};
    alignas(64) CapturedPacket slots_[CapacityPow2]{};
};

} // namespace persist
