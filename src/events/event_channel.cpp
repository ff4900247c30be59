#include "events/event_channel.hpp"
#include <nlohmann/json.hpp>
#include <thread>

using json = nlohmann::json;

namespace events {

namespace {

template <typename T>
json optional_value(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

}

EventChannel::EventChannel(size_t capacity_per_queue)
    : transcripts_(capacity_per_queue),
      summaries_(capacity_per_queue),
      errors_(capacity_per_queue) {}

void EventChannel::publish_transcript(TranscriptEvent event) {
    transcripts_.push(std::move(event));
}

void EventChannel::publish_packet_summary(PacketSummaryEvent event) {
    summaries_.push(std::move(event));
}

void EventChannel::publish_error(ErrorEvent event) {
    errors_.push(std::move(event));
}

// Each queue has its own condition variable, so the three are polled in
// 5 ms slices. Event latency is bounded by one slice.
std::optional<Event> EventChannel::next(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (auto event = transcripts_.try_pop()) return Event(std::move(*event));
        if (auto event = summaries_.try_pop()) return Event(std::move(*event));
        if (auto event = errors_.try_pop()) return Event(std::move(*event));

        if (transcripts_.closed() || std::chrono::steady_clock::now() >= deadline) {
            return std::nullopt;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

void EventChannel::close() {
    transcripts_.close();
    summaries_.close();
    errors_.close();
}

const char* direction_name(Direction direction) {
    switch (direction) {
        case Direction::Outbound: return "outbound";
        case Direction::Inbound:  return "inbound";
    }
    return "outbound";
}

json to_message(const Event& event) {
    if (const auto* transcript = std::get_if<TranscriptEvent>(&event)) {
        return {
            {"type", "transcript"},
            {"direction", direction_name(transcript->direction)},
            {"text", transcript->text},
            {"start_ms", optional_value(transcript->start_ms)},
            {"end_ms", optional_value(transcript->end_ms)},
            {"avg_pitch_hz", optional_value(transcript->avg_pitch_hz)},
            {"avg_energy", optional_value(transcript->avg_energy)}
        };
    }
    if (const auto* packet = std::get_if<PacketSummaryEvent>(&event)) {
        return {
            {"type", "packet_summary"},
            {"direction", direction_name(packet->direction)},
            {"bytes", packet->summary.byte_size},
            {"mode", protocol::mode_name(packet->summary.mode)},
            {"created_at_ms", packet->summary.created_at_ms}
        };
    }
    const auto& error = std::get<ErrorEvent>(event);
    return {
        {"type", "error"},
        {"source", error.source},
        {"message", error.message}
    };
}

std::string to_json_line(const Event& event) {
    return to_message(event).dump(-1, ' ', false, json::error_handler_t::replace);
}

}
