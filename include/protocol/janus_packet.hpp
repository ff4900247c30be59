#ifndef JANUS_PROTOCOL_JANUS_PACKET_HPP
#define JANUS_PROTOCOL_JANUS_PACKET_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace protocol {
    // Wire values are fixed; do not renumber.
    enum class Mode : uint8_t {
        Semantic = 0,   // text + prosody
        TextOnly = 1,   // text, receiver uses its default voice
        Morse = 2       // text keyed as tones on the receiver
    };

    enum class EmotionOverride : uint8_t {
        Auto,
        Relaxed,
        Panicked
    };

    const char* to_string(Mode mode);
    const char* to_string(EmotionOverride emotion);

    // Names used by the control/event JSON ("semantic", "text_only", "morse").
    const char* mode_name(Mode mode);
    std::optional<Mode> mode_from_name(const std::string& name);

    // One utterance. Built once by the sender, encoded and thrown away.
    struct JanusPacket {
        Mode mode = Mode::Semantic;
        std::string text;
        std::optional<int64_t> start_ms;
        std::optional<int64_t> end_ms;
        std::optional<float> avg_pitch_hz;
        std::optional<float> avg_energy;
        EmotionOverride emotion_override = EmotionOverride::Auto;

        bool operator==(const JanusPacket& other) const;
        bool operator!=(const JanusPacket& other) const { return !(*this == other); }
    };

    struct PacketSummary {
        size_t byte_size = 0;
        Mode mode = Mode::Semantic;
        int64_t created_at_ms = 0;
    };

    PacketSummary summarize(const JanusPacket& packet, size_t byte_size, int64_t created_at_ms);
}

#endif
