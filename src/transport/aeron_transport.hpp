#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "transport/aeron_client_view.hpp"
#include "transport/transport.hpp"
#include "util/clock.hpp"

namespace transport {

struct AeronTransportStats {
    std::uint64_t received{0};
    std::uint64_t decode_failures{0};
    std::uint64_t filtered{0};
};

// ITransport over Aeron: one publication per sender (output endpoint channel,
// shared stream id) and one subscription on the inbound channel. Payloads use
// the envelope in dmx_message.hpp.
class AeronTransport final : public ITransport {
public:
    AeronTransport(std::shared_ptr<AeronClientView> client,
                   std::string input_channel,
                   std::int32_t stream_id,
                   std::unique_ptr<util::SystemClock> clock = std::make_unique<util::SystemClock>());

    static std::unique_ptr<AeronTransport> connect(const std::string& input_channel,
                                                   std::int32_t stream_id,
                                                   std::string& error);

    std::unique_ptr<ISender> make_sender(const std::string& endpoint,
                                         const core::Address& address,
                                         std::string& error) override;
    core::ErrorCode listen(const std::vector<core::Address>& addresses, std::string& error) override;
    int poll(const InboundHandler& handler, int limit) override;

    const AeronTransportStats& stats() const noexcept { return stats_; }

private:
    bool accepts(const core::Address& address) const noexcept;

    std::shared_ptr<AeronClientView> client_;
    std::string input_channel_;
    std::int32_t stream_id_;
    std::unique_ptr<util::SystemClock> clock_;

    std::int64_t subscription_id_{-1};
    std::shared_ptr<SubscriptionView> subscription_;
    std::vector<core::Address> accepted_;
    AeronTransportStats stats_{};
};

} // namespace transport
