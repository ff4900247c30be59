#include "network/udp_transport.hpp"
#include "core/errors.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace network {

UdpTransport::UdpTransport(const std::string& target_ip, uint16_t target_port) {
    target_.sin_family = AF_INET;
    target_.sin_port = htons(target_port);
    if (inet_pton(AF_INET, target_ip.c_str(), &target_.sin_addr) <= 0) {
        throw core::TransportError("invalid IP address: " + target_ip);
    }

    socket_ = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (socket_ < 0) {
        throw core::TransportError(std::string("UDP socket: ") + std::strerror(errno));
    }
}

UdpTransport::~UdpTransport() {
    if (socket_ >= 0) {
        ::close(socket_);
    }
}

void UdpTransport::send(const Frame& payload) {
    ssize_t sent = ::sendto(socket_, payload.data(), payload.size(), 0,
                            reinterpret_cast<const sockaddr*>(&target_), sizeof(target_));
    if (sent < 0) {
        throw core::TransportError(std::string("UDP sendto: ") + std::strerror(errno));
    }
    if (static_cast<size_t>(sent) != payload.size()) {
        throw core::TransportError("UDP sendto: short datagram");
    }
}

UdpFrameReceiver::UdpFrameReceiver(uint16_t listen_port) {
    socket_ = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (socket_ < 0) {
        throw core::TransportError(std::string("UDP socket: ") + std::strerror(errno));
    }

    int opt = 1;
    setsockopt(socket_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(listen_port);

    if (::bind(socket_, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
        const std::string reason = std::strerror(errno);
        ::close(socket_);
        socket_ = -1;
        throw core::TransportError("UDP bind to port " + std::to_string(listen_port) + ": " + reason);
    }

    socklen_t len = sizeof(addr);
    getsockname(socket_, reinterpret_cast<sockaddr*>(&addr), &len);
    port_ = ntohs(addr.sin_port);
}

UdpFrameReceiver::~UdpFrameReceiver() {
    if (socket_ >= 0) {
        ::close(socket_);
    }
}

std::optional<Frame> UdpFrameReceiver::receive(std::chrono::milliseconds timeout) {
    pollfd pfd{socket_, POLLIN, 0};
    int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ready < 0) {
        if (errno == EINTR) {
            return std::nullopt;
        }
        throw core::TransportError(std::string("UDP poll: ") + std::strerror(errno));
    }
    if (ready == 0) {
        return std::nullopt;
    }

    Frame buffer(MAX_DATAGRAM);
    ssize_t received = ::recvfrom(socket_, buffer.data(), buffer.size(), 0, nullptr, nullptr);
    if (received < 0) {
        if (errno == EINTR || errno == EAGAIN) {
            return std::nullopt;
        }
        throw core::TransportError(std::string("UDP recvfrom: ") + std::strerror(errno));
    }
    buffer.resize(static_cast<size_t>(received));
    return buffer;
}

}
