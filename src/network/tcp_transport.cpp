#include "network/tcp_transport.hpp"
#include "core/errors.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace network {

namespace {

void write_all(int fd, const uint8_t* data, size_t size) {
    while (size > 0) {
        ssize_t written = ::send(fd, data, size, MSG_NOSIGNAL);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw core::TransportError(std::string("TCP send: ") + std::strerror(errno));
        }
        data += written;
        size -= static_cast<size_t>(written);
    }
}

}

TcpTransport::TcpTransport(std::string target_ip, uint16_t target_port)
    : target_ip_(std::move(target_ip)), target_port_(target_port) {}

TcpTransport::~TcpTransport() {
    disconnect();
}

void TcpTransport::connect() {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(target_port_);
    if (inet_pton(AF_INET, target_ip_.c_str(), &addr.sin_addr) <= 0) {
        throw core::TransportError("invalid IP address: " + target_ip_);
    }

    int fd = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (fd < 0) {
        throw core::TransportError(std::string("TCP socket: ") + std::strerror(errno));
    }

    if (::connect(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
        const std::string reason = std::strerror(errno);
        ::close(fd);
        throw core::TransportError("TCP connect to " + target_ip_ + ":" +
                                   std::to_string(target_port_) + ": " + reason);
    }

    int opt = 1;
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));
    socket_ = fd;
    std::cout << "TCP link connected to " << target_ip_ << ":" << target_port_ << std::endl;
}

void TcpTransport::disconnect() {
    if (socket_ >= 0) {
        ::close(socket_);
        socket_ = -1;
    }
}

void TcpTransport::send(const Frame& payload) {
    if (socket_ < 0) {
        connect();
    }

    const uint32_t length = static_cast<uint32_t>(payload.size());
    Frame framed;
    framed.reserve(framed_size(payload.size()));
    framed.push_back(static_cast<uint8_t>(length >> 24));
    framed.push_back(static_cast<uint8_t>(length >> 16));
    framed.push_back(static_cast<uint8_t>(length >> 8));
    framed.push_back(static_cast<uint8_t>(length));
    framed.insert(framed.end(), payload.begin(), payload.end());

    try {
        write_all(socket_, framed.data(), framed.size());
    } catch (const core::TransportError&) {
        disconnect();
        throw;
    }
}

TcpFrameReceiver::TcpFrameReceiver(uint16_t listen_port) {
    listen_socket_ = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (listen_socket_ < 0) {
        throw core::TransportError(std::string("TCP socket: ") + std::strerror(errno));
    }

    int opt = 1;
    setsockopt(listen_socket_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(listen_port);

    if (::bind(listen_socket_, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0 ||
        ::listen(listen_socket_, 1) < 0) {
        const std::string reason = std::strerror(errno);
        ::close(listen_socket_);
        listen_socket_ = -1;
        throw core::TransportError("TCP listen on port " + std::to_string(listen_port) + ": " + reason);
    }

    socklen_t len = sizeof(addr);
    getsockname(listen_socket_, reinterpret_cast<sockaddr*>(&addr), &len);
    port_ = ntohs(addr.sin_port);
}

TcpFrameReceiver::~TcpFrameReceiver() {
    drop_peer();
    if (listen_socket_ >= 0) {
        ::close(listen_socket_);
    }
}

bool TcpFrameReceiver::accept_peer(int timeout_ms) {
    pollfd pfd{listen_socket_, POLLIN, 0};
    int ready = ::poll(&pfd, 1, timeout_ms);
    if (ready <= 0) {
        return false;
    }

    sockaddr_in client{};
    socklen_t len = sizeof(client);
    int fd = ::accept(listen_socket_, reinterpret_cast<sockaddr*>(&client), &len);
    if (fd < 0) {
        std::cerr << "WARNING: TCP accept: " << std::strerror(errno) << std::endl;
        return false;
    }

    char client_ip[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &client.sin_addr, client_ip, INET_ADDRSTRLEN);
    std::cout << "Connection established from " << client_ip << ":" << ntohs(client.sin_port) << std::endl;

    peer_socket_ = fd;
    pending_.clear();
    return true;
}

void TcpFrameReceiver::drop_peer() {
    if (peer_socket_ >= 0) {
        ::close(peer_socket_);
        peer_socket_ = -1;
    }
    pending_.clear();
}

std::optional<Frame> TcpFrameReceiver::take_frame() {
    if (pending_.size() < TCP_HEADER_SIZE) {
        return std::nullopt;
    }
    const uint32_t length = (static_cast<uint32_t>(pending_[0]) << 24) |
                            (static_cast<uint32_t>(pending_[1]) << 16) |
                            (static_cast<uint32_t>(pending_[2]) << 8) |
                            static_cast<uint32_t>(pending_[3]);
    if (length > MAX_FRAME) {
        std::cerr << "WARNING: oversized frame (" << length << " bytes), dropping connection" << std::endl;
        drop_peer();
        return std::nullopt;
    }
    if (pending_.size() < TCP_HEADER_SIZE + length) {
        return std::nullopt;
    }

    Frame frame(pending_.begin() + TCP_HEADER_SIZE, pending_.begin() + TCP_HEADER_SIZE + length);
    pending_.erase(pending_.begin(), pending_.begin() + TCP_HEADER_SIZE + length);
    return frame;
}

std::optional<Frame> TcpFrameReceiver::receive(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    auto remaining_ms = [&deadline]() {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        return left > 0 ? static_cast<int>(left) : 0;
    };

    if (peer_socket_ < 0 && !accept_peer(remaining_ms())) {
        return std::nullopt;
    }

    if (auto frame = take_frame()) {
        return frame;
    }

    while (peer_socket_ >= 0) {
        pollfd pfd{peer_socket_, POLLIN, 0};
        int ready = ::poll(&pfd, 1, remaining_ms());
        if (ready < 0) {
            if (errno == EINTR) {
                return std::nullopt;
            }
            throw core::TransportError(std::string("TCP poll: ") + std::strerror(errno));
        }
        if (ready == 0) {
            return std::nullopt;
        }

        uint8_t buffer[4096];
        ssize_t received = ::recv(peer_socket_, buffer, sizeof(buffer), 0);
        if (received < 0 && errno == EINTR) {
            continue;
        }
        if (received <= 0) {
            std::cout << "Connection closed by sender" << std::endl;
            drop_peer();
            return std::nullopt;
        }
        pending_.insert(pending_.end(), buffer, buffer + received);

        if (auto frame = take_frame()) {
            return frame;
        }
        if (remaining_ms() == 0) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

}
