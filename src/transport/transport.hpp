#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "core/address.hpp"
#include "core/error.hpp"
#include "core/packet.hpp"

namespace transport {

// View of one inbound packet; `data` is only valid for the duration of the
// handler call.
struct InboundPacket {
    core::Address address{};
    std::span<const std::uint8_t> data{};
    core::WallTime arrival{};
};

using InboundHandler = std::function<void(const InboundPacket&)>;

// One physical output bound to one address.
class ISender {
public:
    virtual ~ISender() = default;

    virtual const std::string& endpoint() const noexcept = 0;
    virtual const core::Address& address() const noexcept = 0;
    virtual core::ErrorCode send(std::span<const std::uint8_t> data, std::string& error) = 0;
};

class ITransport {
public:
    virtual ~ITransport() = default;

    virtual std::unique_ptr<ISender> make_sender(const std::string& endpoint,
                                                 const core::Address& address,
                                                 std::string& error) = 0;

    // Restricts inbound delivery to `addresses`. An empty list accepts every address.
    virtual core::ErrorCode listen(const std::vector<core::Address>& addresses, std::string& error) = 0;

    // Delivers up to `limit` pending inbound packets on the calling thread.
    // Returns the number delivered.
    virtual int poll(const InboundHandler& handler, int limit) = 0;
};

} // namespace transport
