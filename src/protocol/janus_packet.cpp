#include "protocol/janus_packet.hpp"

namespace protocol {

const char* to_string(Mode mode) {
    switch (mode) {
        case Mode::Semantic: return "Semantic Voice";
        case Mode::TextOnly: return "Text Only";
        case Mode::Morse:    return "Morse Code";
    }
    return "Unknown";
}

const char* to_string(EmotionOverride emotion) {
    switch (emotion) {
        case EmotionOverride::Auto:     return "Auto";
        case EmotionOverride::Relaxed:  return "Relaxed";
        case EmotionOverride::Panicked: return "Panicked";
    }
    return "Auto";
}

const char* mode_name(Mode mode) {
    switch (mode) {
        case Mode::Semantic: return "semantic";
        case Mode::TextOnly: return "text_only";
        case Mode::Morse:    return "morse";
    }
    return "semantic";
}

std::optional<Mode> mode_from_name(const std::string& name) {
    if (name == "semantic") return Mode::Semantic;
    if (name == "text_only" || name == "text") return Mode::TextOnly;
    if (name == "morse") return Mode::Morse;
    return std::nullopt;
}

bool JanusPacket::operator==(const JanusPacket& other) const {
    return mode == other.mode &&
           text == other.text &&
           start_ms == other.start_ms &&
           end_ms == other.end_ms &&
           avg_pitch_hz == other.avg_pitch_hz &&
           avg_energy == other.avg_energy &&
           emotion_override == other.emotion_override;
}

PacketSummary summarize(const JanusPacket& packet, size_t byte_size, int64_t created_at_ms) {
    PacketSummary summary;
    summary.byte_size = byte_size;
    summary.mode = packet.mode;
    summary.created_at_ms = created_at_ms;
    return summary;
}

}
