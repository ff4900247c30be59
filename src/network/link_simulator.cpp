#include "network/link_simulator.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace network {

const char* to_string(SendResult result) {
    switch (result) {
        case SendResult::Sent:      return "sent";
        case SendResult::Skipped:   return "skipped";
        case SendResult::Cancelled: return "cancelled";
    }
    return "skipped";
}

LinkSimulator::LinkSimulator(Transport& transport, uint32_t bits_per_second)
    : transport_(transport), bits_per_second_(bits_per_second) {
    if (bits_per_second_ == 0) {
        throw std::invalid_argument("link bitrate must be positive");
    }
}

std::chrono::microseconds LinkSimulator::transmit_duration(size_t wire_bytes) const {
    const uint64_t bits = static_cast<uint64_t>(wire_bytes) * 8;
    return std::chrono::microseconds(bits * 1000000ULL / bits_per_second_);
}

SendResult LinkSimulator::send(const Frame& payload, const CancelCheck& cancelled) {
    if (payload.empty()) {
        return SendResult::Skipped;
    }

    const size_t wire_bytes = transport_.framed_size(payload.size());
    const auto duration = transmit_duration(wire_bytes);

    // The link is a single channel: a packet starts when the previous one
    // has finished "transmitting", never earlier.
    Clock::time_point deadline;
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        deadline = std::max(Clock::now(), busy_until_) + duration;
        busy_until_ = deadline;
    }

    std::cout << "Transmitting " << wire_bytes << " bytes @ " << bits_per_second_ << "bps ("
              << std::chrono::duration_cast<std::chrono::milliseconds>(duration).count() << " ms)" << std::endl;

    while (true) {
        const auto now = Clock::now();
        if (now >= deadline) {
            break;
        }
        if (cancelled && cancelled()) {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            busy_until_ = Clock::now();
            return SendResult::Cancelled;
        }
        std::this_thread::sleep_for(std::min<Clock::duration>(deadline - now, WAIT_SLICE));
    }

    transport_.send(payload);

    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++packets_sent_;
    bytes_sent_ += wire_bytes;
    return SendResult::Sent;
}

uint64_t LinkSimulator::packets_sent() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return packets_sent_;
}

uint64_t LinkSimulator::bytes_sent() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return bytes_sent_;
}

}
