#pragma once

#include <atomic>
#include <cstdint>

#include "transport/output_set.hpp"
#include "transport/transport.hpp"

namespace ingest {

struct PassthroughStats {
    std::uint64_t forwarded{0};
    std::uint64_t suppressed_playing{0};
    std::uint64_t suppressed_disabled{0};
    std::uint64_t send_failures{0};
};

// Forwards live inbound packets to the outputs bound to the same address.
// Runs inline in the inbound callback; `playing` is owned by the playback
// scheduler and gates forwarding so only one of the two drives the outputs.
class PassthroughRouter {
public:
    PassthroughRouter(transport::OutputSet& outputs, const std::atomic<bool>& playing, bool enabled = true) noexcept
        : outputs_(outputs), playing_(playing), enabled_(enabled) {}

    // Returns true if the packet was handed to at least one output.
    bool on_packet(const transport::InboundPacket& packet);

    void set_enabled(bool enabled) noexcept { enabled_.store(enabled, std::memory_order_release); }
    // Returns the new state.
    bool toggle() noexcept {
        bool prev = enabled_.load(std::memory_order_acquire);
        while (!enabled_.compare_exchange_weak(prev, !prev, std::memory_order_acq_rel)) {
        }
        return !prev;
    }
    bool enabled() const noexcept { return enabled_.load(std::memory_order_acquire); }

    PassthroughStats stats() const noexcept;

private:
    transport::OutputSet& outputs_;
    const std::atomic<bool>& playing_;
    std::atomic<bool> enabled_;
    std::atomic<std::uint64_t> forwarded_{0};
    std::atomic<std::uint64_t> suppressed_playing_{0};
    std::atomic<std::uint64_t> suppressed_disabled_{0};
    std::atomic<std::uint64_t> send_failures_{0};
};

} // namespace ingest
