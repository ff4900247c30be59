#ifndef JANUS_NETWORK_TRANSPORT_HPP
#define JANUS_NETWORK_TRANSPORT_HPP

#include "core/non_copyable.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace network {
    using Frame = std::vector<uint8_t>;

    enum class TransportKind {
        Udp,
        Tcp
    };

    // Send half of a link. Implementations throw core::TransportError.
    class Transport : private core::NonCopyable {
    public:
        virtual ~Transport() = default;

        virtual void send(const Frame& payload) = 0;

        // Bytes that actually go on the wire for a payload of this size.
        virtual size_t framed_size(size_t payload_size) const { return payload_size; }
    };

    // Receive half of a link.
    class FrameReceiver : private core::NonCopyable {
    public:
        virtual ~FrameReceiver() = default;

        // Empty result means the timeout elapsed without a complete frame.
        virtual std::optional<Frame> receive(std::chrono::milliseconds timeout) = 0;

        virtual uint16_t port() const = 0;
    };
}

#endif
