#ifndef JANUS_NETWORK_LINK_SIMULATOR_HPP
#define JANUS_NETWORK_LINK_SIMULATOR_HPP

#include "core/non_copyable.hpp"
#include "network/transport.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>

namespace network {
    enum class SendResult {
        Sent,
        Skipped,    // nothing to send, no time spent
        Cancelled   // gave up while waiting for the link; nothing written
    };

    const char* to_string(SendResult result);

    // Application-layer throttle. Every packet "spends" its bits at the
    // configured rate before it is handed to the real transport, so a
    // 40-byte packet at 300 bps leaves about a second after send() is called.
    class LinkSimulator : private core::NonCopyable {
    public:
        using Clock = std::chrono::steady_clock;
        using CancelCheck = std::function<bool()>;

        static constexpr std::chrono::milliseconds WAIT_SLICE{20};

        LinkSimulator(Transport& transport, uint32_t bits_per_second);

        // Throws core::TransportError if the underlying write fails.
        SendResult send(const Frame& payload, const CancelCheck& cancelled = {});

        std::chrono::microseconds transmit_duration(size_t wire_bytes) const;

        uint32_t bits_per_second() const { return bits_per_second_; }
        uint64_t packets_sent() const;
        uint64_t bytes_sent() const;

    private:
        Transport& transport_;
        const uint32_t bits_per_second_;

        mutable std::mutex stats_mutex_;
        Clock::time_point busy_until_{};
        uint64_t packets_sent_ = 0;
        uint64_t bytes_sent_ = 0;
    };
}

#endif
