#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "core/address.hpp"
#include "core/error.hpp"
#include "core/packet.hpp"
#include "core/player_config.hpp"
#include "transport/transport.hpp"

namespace transport {

struct TransmitResult {
    std::size_t matched{0};
    std::size_t failed{0};

    bool ok() const noexcept { return failed == 0; }
};

struct OutputSetStats {
    std::uint64_t sends{0};
    std::uint64_t failures{0};
    std::uint64_t unmatched{0};
};

// The configured output senders. Read-only after construction, so playback,
// passthrough and the operator thread can transmit through it concurrently.
// A failing sender is logged and counted, never allowed to stop delivery to
// the remaining senders.
class OutputSet {
public:
    OutputSet() = default;
    explicit OutputSet(std::chrono::milliseconds log_rate_limit) : log_rate_limit_(log_rate_limit) {}

    OutputSet(const OutputSet&) = delete;
    OutputSet& operator=(const OutputSet&) = delete;

    // Creates one sender per (endpoint, universe) pair.
    core::ErrorCode configure(ITransport& transport,
                              const std::vector<core::OutputConfig>& outputs,
                              std::string& error);

    void add(std::unique_ptr<ISender> sender);

    TransmitResult transmit(const core::Address& address, std::span<const std::uint8_t> data);
    TransmitResult transmit(const core::Packet& packet) { return transmit(packet.address, packet.data); }

    // Sends a full 512-channel frame of `value` to every sender, or only to
    // senders whose logical universe is in `universes` when it is non-empty.
    TransmitResult fill(std::uint8_t value, std::span<const std::uint32_t> universes = {});
    TransmitResult blackout() { return fill(0); }

    std::size_t size() const noexcept { return entries_.size(); }
    std::size_t count_for(const core::Address& address) const noexcept;
    std::vector<std::string> describe() const;

    OutputSetStats stats() const noexcept;

private:
    struct Entry {
        std::unique_ptr<ISender> sender;
        std::atomic<std::int64_t> last_log_ns{0};
        std::atomic<std::uint64_t> failures{0};
    };

    bool send_one(Entry& entry, std::span<const std::uint8_t> data);
    bool should_log(Entry& entry) noexcept;

    std::vector<std::unique_ptr<Entry>> entries_;
    std::chrono::milliseconds log_rate_limit_{std::chrono::milliseconds{5000}};
    std::atomic<std::uint64_t> sends_{0};
    std::atomic<std::uint64_t> failures_{0};
    std::atomic<std::uint64_t> unmatched_{0};
};

} // namespace transport
