#ifndef JANUS_SYNTHESIS_VOICE_PROFILE_HPP
#define JANUS_SYNTHESIS_VOICE_PROFILE_HPP

#include "protocol/janus_packet.hpp"
#include <optional>
#include <string>
#include <variant>

namespace synthesis {
    // Fixed receiver voice; never looks at prosody.
    struct DefaultVoice {
        bool operator==(const DefaultVoice&) const { return true; }
    };

    // Automatic affect driven by the sender's measured pitch and energy.
    struct ProsodyVoice {
        std::optional<float> avg_pitch_hz;
        std::optional<float> avg_energy;

        bool operator==(const ProsodyVoice& other) const {
            return avg_pitch_hz == other.avg_pitch_hz && avg_energy == other.avg_energy;
        }
    };

    // Explicit affect chosen by the sender's operator.
    struct EmotionVoice {
        protocol::EmotionOverride emotion = protocol::EmotionOverride::Relaxed;

        bool operator==(const EmotionVoice& other) const { return emotion == other.emotion; }
    };

    using VoiceProfile = std::variant<DefaultVoice, ProsodyVoice, EmotionVoice>;

    enum class PitchBand { Deep, Normal, High };
    enum class EnergyBand { Quiet, Normal, Loud };

    PitchBand pitch_band(float avg_pitch_hz);
    EnergyBand energy_band(float avg_energy);

    // Prompt tag handed to the synthesizer: "Excited", "Calm", "Neutral", ...
    std::string emotion_tag(const VoiceProfile& voice);
}

#endif
