#include "transport/aeron_transport.hpp"

#include <algorithm>
#include <array>
#include <exception>
#include <thread>

#include "transport/dmx_message.hpp"
#include "util/log.hpp"

namespace transport {
namespace {

constexpr int offer_attempts = 3;

const char* describe_offer_result(std::int64_t result) noexcept {
    switch (result) {
    case aeron::NOT_CONNECTED: return "not connected";
    case aeron::BACK_PRESSURED: return "back pressured";
    case aeron::ADMIN_ACTION: return "admin action";
    case aeron::PUBLICATION_CLOSED: return "publication closed";
    case aeron::MAX_POSITION_EXCEEDED: return "max position exceeded";
    default: return "offer failed";
    }
}

class AeronSender final : public ISender {
public:
    AeronSender(std::shared_ptr<AeronClientView> client,
                std::int64_t registration_id,
                std::string endpoint,
                const core::Address& address)
        : client_(std::move(client))
        , registration_id_(registration_id)
        , endpoint_(std::move(endpoint))
        , address_(address)
        , buffer_(scratch_.data(), scratch_.size()) {}

    const std::string& endpoint() const noexcept override { return endpoint_; }
    const core::Address& address() const noexcept override { return address_; }

    core::ErrorCode send(std::span<const std::uint8_t> data, std::string& error) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!publication_) {
            publication_ = client_->find_publication(registration_id_);
            if (!publication_) {
                error = "publication not ready";
                return core::ErrorCode::TransportError;
            }
        }
        const auto len = encode_dmx_message(address_, data, scratch_);
        if (len == 0) {
            error = "payload exceeds " + std::to_string(core::max_channels) + " channels";
            return core::ErrorCode::InvalidArgument;
        }
        std::int64_t result = 0;
        for (int attempt = 0; attempt < offer_attempts; ++attempt) {
            result = publication_->offer(buffer_, static_cast<aeron::util::index_t>(len));
            if (result > 0) {
                return core::ErrorCode::Ok;
            }
            if (result != aeron::BACK_PRESSURED && result != aeron::ADMIN_ACTION) {
                break;
            }
            std::this_thread::yield();
        }
        error = describe_offer_result(result);
        return core::ErrorCode::TransportError;
    }

private:
    std::shared_ptr<AeronClientView> client_;
    std::int64_t registration_id_;
    std::string endpoint_;
    core::Address address_;
    std::mutex mutex_;
    std::shared_ptr<PublicationView> publication_;
    std::array<std::uint8_t, dmx_max_message_size> scratch_{};
    aeron::concurrent::AtomicBuffer buffer_;
};

} // namespace

AeronTransport::AeronTransport(std::shared_ptr<AeronClientView> client,
                               std::string input_channel,
                               std::int32_t stream_id,
                               std::unique_ptr<util::SystemClock> clock)
    : client_(std::move(client))
    , input_channel_(std::move(input_channel))
    , stream_id_(stream_id)
    , clock_(std::move(clock)) {}

std::unique_ptr<AeronTransport> AeronTransport::connect(const std::string& input_channel,
                                                        std::int32_t stream_id,
                                                        std::string& error) {
    try {
        aeron::Context ctx;
        auto client = aeron::Aeron::connect(ctx);
        return std::make_unique<AeronTransport>(make_aeron_client_view(std::move(client)), input_channel, stream_id);
    } catch (const std::exception& e) {
        error = std::string("aeron connect failed: ") + e.what();
        return nullptr;
    }
}

std::unique_ptr<ISender> AeronTransport::make_sender(const std::string& endpoint,
                                                     const core::Address& address,
                                                     std::string& error) {
    if (endpoint.empty()) {
        error = "empty endpoint";
        return nullptr;
    }
    std::int64_t registration_id = -1;
    try {
        registration_id = client_->add_publication(endpoint, stream_id_);
    } catch (const std::exception& e) {
        error = std::string("add publication failed: ") + e.what();
        return nullptr;
    }
    return std::make_unique<AeronSender>(client_, registration_id, endpoint, address);
}

core::ErrorCode AeronTransport::listen(const std::vector<core::Address>& addresses, std::string& error) {
    accepted_ = addresses;
    if (subscription_id_ >= 0) {
        return core::ErrorCode::Ok;
    }
    try {
        subscription_id_ = client_->add_subscription(input_channel_, stream_id_);
    } catch (const std::exception& e) {
        error = std::string("add subscription failed: ") + e.what();
        return core::ErrorCode::TransportError;
    }
    util::log(util::LogLevel::Info, "listening on %s stream %d (%zu universes)",
              input_channel_.c_str(), stream_id_, accepted_.size());
    return core::ErrorCode::Ok;
}

bool AeronTransport::accepts(const core::Address& address) const noexcept {
    return accepted_.empty() || std::find(accepted_.begin(), accepted_.end(), address) != accepted_.end();
}

int AeronTransport::poll(const InboundHandler& handler, int limit) {
    if (subscription_id_ < 0) {
        return 0;
    }
    if (!subscription_) {
        subscription_ = client_->find_subscription(subscription_id_);
        if (!subscription_) {
            return 0;
        }
    }
    int delivered = 0;
    auto on_fragment = [&](const aeron::concurrent::AtomicBuffer& buffer,
                           aeron::util::index_t offset,
                           aeron::util::index_t length,
                           const aeron::Header&) {
        ++stats_.received;
        const auto* ptr = reinterpret_cast<const std::uint8_t*>(buffer.buffer() + offset);
        DmxMessageView msg;
        if (!decode_dmx_message({ptr, static_cast<std::size_t>(length)}, msg)) {
            ++stats_.decode_failures;
            return;
        }
        if (!accepts(msg.address)) {
            ++stats_.filtered;
            return;
        }
        handler(InboundPacket{msg.address, msg.data, clock_->now()});
        ++delivered;
    };
    subscription_->poll(on_fragment, limit);
    return delivered;
}

} // namespace transport
