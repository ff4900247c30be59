#ifndef JANUS_NETWORK_TCP_TRANSPORT_HPP
#define JANUS_NETWORK_TCP_TRANSPORT_HPP

#include "network/transport.hpp"
#include <string>

namespace network {
    // Stream framing: 4-byte big-endian payload length, then the payload.
    constexpr size_t TCP_HEADER_SIZE = 4;

    class TcpTransport : public Transport {
    public:
        TcpTransport(std::string target_ip, uint16_t target_port);
        ~TcpTransport() override;

        // Connects on first use. After a failure the connection is dropped
        // and the next send dials again.
        void send(const Frame& payload) override;
        size_t framed_size(size_t payload_size) const override { return payload_size + TCP_HEADER_SIZE; }

        bool connected() const { return socket_ >= 0; }

    private:
        void connect();
        void disconnect();

        std::string target_ip_;
        uint16_t target_port_;
        int socket_ = -1;
    };

    class TcpFrameReceiver : public FrameReceiver {
    public:
        static constexpr size_t MAX_FRAME = 64 * 1024;

        explicit TcpFrameReceiver(uint16_t listen_port);
        ~TcpFrameReceiver() override;

        // Accepts a peer if none is connected, then reads until one whole
        // frame is buffered or the timeout elapses.
        std::optional<Frame> receive(std::chrono::milliseconds timeout) override;
        uint16_t port() const override { return port_; }

    private:
        bool accept_peer(int timeout_ms);
        void drop_peer();
        std::optional<Frame> take_frame();

        int listen_socket_ = -1;
        int peer_socket_ = -1;
        uint16_t port_ = 0;
        std::vector<uint8_t> pending_;
    };
}

#endif
