#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include <Aeron.h>
#include <concurrent/AtomicBuffer.h>
#include <concurrent/logbuffer/Header.h>

namespace transport {

using FragmentHandler = std::function<void(const aeron::concurrent::AtomicBuffer&,
                                           aeron::util::index_t,
                                           aeron::util::index_t,
                                           const aeron::Header&)>;

// Narrow views over the Aeron client so the adapter can be driven by stubs.
class SubscriptionView {
public:
    virtual ~SubscriptionView() = default;
    virtual int poll(const FragmentHandler& handler, int fragment_limit) = 0;
};

class PublicationView {
public:
    virtual ~PublicationView() = default;
    // Aeron result: new stream position when > 0, else a back-pressure or
    // connection status code.
    virtual std::int64_t offer(aeron::concurrent::AtomicBuffer& buffer, aeron::util::index_t length) = 0;
};

class AeronClientView {
public:
    virtual ~AeronClientView() = default;
    virtual std::int64_t add_subscription(const std::string& channel, std::int32_t stream_id) = 0;
    virtual std::shared_ptr<SubscriptionView> find_subscription(std::int64_t registration_id) = 0;
    virtual std::int64_t add_publication(const std::string& channel, std::int32_t stream_id) = 0;
    virtual std::shared_ptr<PublicationView> find_publication(std::int64_t registration_id) = 0;
};

class RealSubscriptionView final : public SubscriptionView {
public:
    explicit RealSubscriptionView(std::shared_ptr<aeron::Subscription> sub) : sub_(std::move(sub)) {}

    int poll(const FragmentHandler& handler, int fragment_limit) override {
        return sub_->poll(handler, fragment_limit);
    }

private:
    std::shared_ptr<aeron::Subscription> sub_;
};

class RealPublicationView final : public PublicationView {
public:
    explicit RealPublicationView(std::shared_ptr<aeron::Publication> pub) : pub_(std::move(pub)) {}

    std::int64_t offer(aeron::concurrent::AtomicBuffer& buffer, aeron::util::index_t length) override {
        return pub_->offer(buffer, 0, length);
    }

private:
    std::shared_ptr<aeron::Publication> pub_;
};

class RealAeronClientView final : public AeronClientView {
public:
    explicit RealAeronClientView(std::shared_ptr<aeron::Aeron> client) : client_(std::move(client)) {}

    std::int64_t add_subscription(const std::string& channel, std::int32_t stream_id) override {
        return client_->addSubscription(channel, stream_id);
    }

    std::shared_ptr<SubscriptionView> find_subscription(std::int64_t registration_id) override {
        auto subscription = client_->findSubscription(registration_id);
        if (!subscription) {
            return nullptr;
        }
        return std::make_shared<RealSubscriptionView>(std::move(subscription));
    }

    std::int64_t add_publication(const std::string& channel, std::int32_t stream_id) override {
        return client_->addPublication(channel, stream_id);
    }

    std::shared_ptr<PublicationView> find_publication(std::int64_t registration_id) override {
        auto publication = client_->findPublication(registration_id);
        if (!publication) {
            return nullptr;
        }
        return std::make_shared<RealPublicationView>(std::move(publication));
    }

private:
    std::shared_ptr<aeron::Aeron> client_;
};

inline std::shared_ptr<AeronClientView> make_aeron_client_view(std::shared_ptr<aeron::Aeron> client) {
    return std::make_shared<RealAeronClientView>(std::move(client));
}

} // namespace transport
