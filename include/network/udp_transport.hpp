#ifndef JANUS_NETWORK_UDP_TRANSPORT_HPP
#define JANUS_NETWORK_UDP_TRANSPORT_HPP

#include "network/transport.hpp"
#include <netinet/in.h>
#include <string>

namespace network {
    class UdpTransport : public Transport {
    public:
        UdpTransport(const std::string& target_ip, uint16_t target_port);
        ~UdpTransport() override;

        void send(const Frame& payload) override;

    private:
        int socket_ = -1;
        sockaddr_in target_{};
    };

    class UdpFrameReceiver : public FrameReceiver {
    public:
        static constexpr size_t MAX_DATAGRAM = 4096;

        // Port 0 binds an ephemeral port, see port().
        explicit UdpFrameReceiver(uint16_t listen_port);
        ~UdpFrameReceiver() override;

        std::optional<Frame> receive(std::chrono::milliseconds timeout) override;
        uint16_t port() const override { return port_; }

    private:
        int socket_ = -1;
        uint16_t port_ = 0;
    };
}

#endif
