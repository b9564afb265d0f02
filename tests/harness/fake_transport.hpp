#pragma once

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/address.hpp"
#include "core/packet.hpp"
#include "transport/transport.hpp"

namespace test_harness {

// Everything one fake sender was asked to send. Shared with the test so it
// outlives the OutputSet that owns the sender.
struct SentLog {
    std::string endpoint;
    core::Address address{};
    std::atomic<bool> fail{false};

    mutable std::mutex mutex;
    std::vector<std::vector<std::uint8_t>> frames;

    std::size_t count() const {
        std::lock_guard<std::mutex> lock(mutex);
        return frames.size();
    }
    std::vector<std::vector<std::uint8_t>> snapshot() const {
        std::lock_guard<std::mutex> lock(mutex);
        return frames;
    }
    std::vector<std::uint8_t> last() const {
        std::lock_guard<std::mutex> lock(mutex);
        return frames.empty() ? std::vector<std::uint8_t>{} : frames.back();
    }
    void clear() {
        std::lock_guard<std::mutex> lock(mutex);
        frames.clear();
    }
};

class FakeSender : public transport::ISender {
public:
    explicit FakeSender(std::shared_ptr<SentLog> log) : log_(std::move(log)) {}

    const std::string& endpoint() const noexcept override { return log_->endpoint; }
    const core::Address& address() const noexcept override { return log_->address; }

    core::ErrorCode send(std::span<const std::uint8_t> data, std::string& error) override {
        if (log_->fail.load(std::memory_order_acquire)) {
            error = "injected send failure";
            return core::ErrorCode::TransportError;
        }
        std::lock_guard<std::mutex> lock(log_->mutex);
        log_->frames.emplace_back(data.begin(), data.end());
        return core::ErrorCode::Ok;
    }

private:
    std::shared_ptr<SentLog> log_;
};

// In-memory transport: senders record what they send, inbound packets are
// queued by the test and delivered by poll().
class FakeTransport : public transport::ITransport {
public:
    std::unique_ptr<transport::ISender> make_sender(const std::string& endpoint,
                                                    const core::Address& address,
                                                    std::string& error) override {
        if (!fail_endpoint.empty() && endpoint == fail_endpoint) {
            error = "cannot reach " + endpoint;
            return nullptr;
        }
        auto log = std::make_shared<SentLog>();
        log->endpoint = endpoint;
        log->address = address;
        std::lock_guard<std::mutex> lock(mutex_);
        logs_.push_back(log);
        return std::make_unique<FakeSender>(std::move(log));
    }

    core::ErrorCode listen(const std::vector<core::Address>& addresses, std::string& error) override {
        if (fail_listen) {
            error = "listen refused";
            return core::ErrorCode::TransportError;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        listening_ = addresses;
        return core::ErrorCode::Ok;
    }

    int poll(const transport::InboundHandler& handler, int limit) override {
        int delivered = 0;
        while (delivered < limit) {
            Pending p;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (queue_.empty()) {
                    break;
                }
                p = std::move(queue_.front());
                queue_.pop_front();
                if (!listening_.empty() &&
                    std::find(listening_.begin(), listening_.end(), p.address) == listening_.end()) {
                    continue;
                }
            }
            handler(transport::InboundPacket{p.address, p.data, p.arrival});
            ++delivered;
        }
        return delivered;
    }

    void inject(const core::Address& address, std::vector<std::uint8_t> data, core::WallTime arrival = {}) {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(Pending{address, std::move(data), arrival});
    }

    std::vector<std::shared_ptr<SentLog>> senders() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return logs_;
    }

    std::shared_ptr<SentLog> find(const std::string& endpoint, std::uint32_t logical_universe) const {
        const auto address = core::map_universe(logical_universe);
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& log : logs_) {
            if (log->endpoint == endpoint && log->address == address) {
                return log;
            }
        }
        return nullptr;
    }

    std::vector<core::Address> listening() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return listening_;
    }

    std::string fail_endpoint;
    bool fail_listen{false};

private:
    struct Pending {
        core::Address address{};
        std::vector<std::uint8_t> data;
        core::WallTime arrival{};
    };

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<SentLog>> logs_;
    std::vector<core::Address> listening_;
    std::deque<Pending> queue_;
};

} // namespace test_harness
