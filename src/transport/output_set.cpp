#include "transport/output_set.hpp"

#include <algorithm>
#include <array>

#include "util/log.hpp"

namespace transport {

core::ErrorCode OutputSet::configure(ITransport& transport,
                                     const std::vector<core::OutputConfig>& outputs,
                                     std::string& error) {
    for (const auto& out : outputs) {
        for (const auto u : out.universes) {
            const auto address = core::map_universe(u);
            auto sender = transport.make_sender(out.endpoint, address, error);
            if (!sender) {
                error = "output " + out.endpoint + " universe " + std::to_string(u) + ": " + error;
                return core::ErrorCode::TransportError;
            }
            util::log(util::LogLevel::Info, "sender ready endpoint=%s universe=%u (net=%u subnet=%u universe=%u)",
                      out.endpoint.c_str(), u, address.net, address.subnet, address.universe);
            add(std::move(sender));
        }
    }
    return core::ErrorCode::Ok;
}

void OutputSet::add(std::unique_ptr<ISender> sender) {
    auto entry = std::make_unique<Entry>();
    entry->sender = std::move(sender);
    entries_.push_back(std::move(entry));
}

bool OutputSet::should_log(Entry& entry) noexcept {
    const auto now_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                            std::chrono::steady_clock::now().time_since_epoch())
                            .count();
    const auto limit_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(log_rate_limit_).count();
    auto last = entry.last_log_ns.load(std::memory_order_relaxed);
    if (last != 0 && now_ns - last < limit_ns) {
        return false;
    }
    return entry.last_log_ns.compare_exchange_strong(last, now_ns, std::memory_order_relaxed);
}

bool OutputSet::send_one(Entry& entry, std::span<const std::uint8_t> data) {
    std::string error;
    const auto rc = entry.sender->send(data, error);
    if (rc == core::ErrorCode::Ok) {
        sends_.fetch_add(1, std::memory_order_relaxed);
        return true;
    }
    failures_.fetch_add(1, std::memory_order_relaxed);
    const auto total = entry.failures.fetch_add(1, std::memory_order_relaxed) + 1;
    if (should_log(entry)) {
        const auto& a = entry.sender->address();
        util::log(util::LogLevel::Warn, "send failed endpoint=%s universe=%u: %s (%s, %llu failures)",
                  entry.sender->endpoint().c_str(), core::logical_universe(a), error.c_str(),
                  core::to_string(rc), static_cast<unsigned long long>(total));
    }
    return false;
}

TransmitResult OutputSet::transmit(const core::Address& address, std::span<const std::uint8_t> data) {
    TransmitResult result;
    for (auto& entry : entries_) {
        if (entry->sender->address() != address) {
            continue;
        }
        ++result.matched;
        if (!send_one(*entry, data)) {
            ++result.failed;
        }
    }
    if (result.matched == 0) {
        unmatched_.fetch_add(1, std::memory_order_relaxed);
    }
    return result;
}

TransmitResult OutputSet::fill(std::uint8_t value, std::span<const std::uint32_t> universes) {
    std::array<std::uint8_t, core::max_channels> frame;
    frame.fill(value);
    TransmitResult result;
    for (auto& entry : entries_) {
        if (!universes.empty()) {
            const auto u = core::logical_universe(entry->sender->address());
            if (std::find(universes.begin(), universes.end(), u) == universes.end()) {
                continue;
            }
        }
        ++result.matched;
        if (!send_one(*entry, frame)) {
            ++result.failed;
        }
    }
    return result;
}

std::size_t OutputSet::count_for(const core::Address& address) const noexcept {
    return static_cast<std::size_t>(std::count_if(entries_.begin(), entries_.end(), [&](const auto& e) {
        return e->sender->address() == address;
    }));
}

std::vector<std::string> OutputSet::describe() const {
    std::vector<std::string> lines;
    lines.reserve(entries_.size());
    for (const auto& entry : entries_) {
        const auto& a = entry->sender->address();
        lines.push_back(entry->sender->endpoint() + " universe " + std::to_string(core::logical_universe(a)) +
                        " (net " + std::to_string(a.net) + ", subnet " + std::to_string(a.subnet) +
                        ", universe " + std::to_string(a.universe) + ")");
    }
    return lines;
}

OutputSetStats OutputSet::stats() const noexcept {
    OutputSetStats s;
    s.sends = sends_.load(std::memory_order_relaxed);
    s.failures = failures_.load(std::memory_order_relaxed);
    s.unmatched = unmatched_.load(std::memory_order_relaxed);
    return s;
}

} // namespace transport
