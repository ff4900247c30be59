#ifndef JANUS_EVENTS_EVENT_CHANNEL_HPP
#define JANUS_EVENTS_EVENT_CHANNEL_HPP

#include "core/bounded_queue.hpp"
#include "protocol/janus_packet.hpp"
#include <chrono>
#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <variant>

namespace events {
    enum class Direction {
        Outbound,   // this node transmitted it
        Inbound     // this node received it
    };

    struct TranscriptEvent {
        Direction direction = Direction::Outbound;
        std::string text;
        std::optional<int64_t> start_ms;
        std::optional<int64_t> end_ms;
        std::optional<float> avg_pitch_hz;
        std::optional<float> avg_energy;
    };

    struct PacketSummaryEvent {
        Direction direction = Direction::Outbound;
        protocol::PacketSummary summary;
    };

    struct ErrorEvent {
        std::string source;     // "transport", "synthesis", "decode", ...
        std::string message;
    };

    using Event = std::variant<TranscriptEvent, PacketSummaryEvent, ErrorEvent>;

    // What the engines publish to. Publishing must never block an engine.
    class EventSink {
    public:
        virtual ~EventSink() = default;

        virtual void publish_transcript(TranscriptEvent event) = 0;
        virtual void publish_packet_summary(PacketSummaryEvent event) = 0;
        virtual void publish_error(ErrorEvent event) = 0;
    };

    // Bounded fan-out queues read by an outer transport (console, WebSocket).
    // A slow reader loses the oldest events instead of stalling the engines.
    class EventChannel : public EventSink {
    public:
        explicit EventChannel(size_t capacity_per_queue = 256);

        void publish_transcript(TranscriptEvent event) override;
        void publish_packet_summary(PacketSummaryEvent event) override;
        void publish_error(ErrorEvent event) override;

        // Next event of any kind; transcripts first, then summaries, then errors.
        std::optional<Event> next(std::chrono::milliseconds timeout);

        core::BoundedQueue<TranscriptEvent>& transcripts() { return transcripts_; }
        core::BoundedQueue<PacketSummaryEvent>& packet_summaries() { return summaries_; }
        core::BoundedQueue<ErrorEvent>& errors() { return errors_; }

        void close();

    private:
        core::BoundedQueue<TranscriptEvent> transcripts_;
        core::BoundedQueue<PacketSummaryEvent> summaries_;
        core::BoundedQueue<ErrorEvent> errors_;
    };

    const char* direction_name(Direction direction);

    // The JSON messages the UI understands ({"type":"transcript", ...}).
    nlohmann::json to_message(const Event& event);

    // One line of compact JSON. Bytes that are not UTF-8 are written as U+FFFD
    // instead of failing the whole message.
    std::string to_json_line(const Event& event);
}

#endif
