#include "ingest/passthrough_router.hpp"

#include "util/async_log.hpp"

namespace ingest {

bool PassthroughRouter::on_packet(const transport::InboundPacket& packet) {
    if (!enabled_.load(std::memory_order_acquire)) {
        suppressed_disabled_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
    if (playing_.load(std::memory_order_acquire)) {
        suppressed_playing_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
    const auto result = outputs_.transmit(packet.address, packet.data);
    if (result.failed > 0) {
        send_failures_.fetch_add(result.failed, std::memory_order_relaxed);
        LOG_HOT_DEBUG("passthru", "%zu of %zu outputs failed for universe %u", result.failed, result.matched,
                      core::logical_universe(packet.address));
    }
    if (result.matched == result.failed) {
        return false;
    }
    forwarded_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

PassthroughStats PassthroughRouter::stats() const noexcept {
    PassthroughStats s;
    s.forwarded = forwarded_.load(std::memory_order_relaxed);
    s.suppressed_playing = suppressed_playing_.load(std::memory_order_relaxed);
    s.suppressed_disabled = suppressed_disabled_.load(std::memory_order_relaxed);
    s.send_failures = send_failures_.load(std::memory_order_relaxed);
    return s;
}

} // namespace ingest
