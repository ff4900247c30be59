#include "synthesis/voice_profile.hpp"

namespace synthesis {

PitchBand pitch_band(float avg_pitch_hz) {
    if (avg_pitch_hz < 120.0f) return PitchBand::Deep;
    if (avg_pitch_hz < 200.0f) return PitchBand::Normal;
    return PitchBand::High;
}

EnergyBand energy_band(float avg_energy) {
    if (avg_energy < 0.05f) return EnergyBand::Quiet;
    if (avg_energy < 0.15f) return EnergyBand::Normal;
    return EnergyBand::Loud;
}

namespace {

std::string prosody_tag(const ProsodyVoice& voice) {
    const PitchBand pitch = voice.avg_pitch_hz ? pitch_band(*voice.avg_pitch_hz) : PitchBand::Normal;
    const EnergyBand energy = voice.avg_energy ? energy_band(*voice.avg_energy) : EnergyBand::Normal;

    switch (pitch) {
        case PitchBand::High:
            if (energy == EnergyBand::Loud) return "Excited";
            if (energy == EnergyBand::Normal) return "Happy";
            return "Neutral";
        case PitchBand::Deep:
            // Intentional extension: a deep voice at shouting energy is
            // voiced as Panicked rather than falling through to Calm.
            if (energy == EnergyBand::Loud) return "Panicked";
            if (energy == EnergyBand::Normal) return "Calm";
            return "Serious";
        case PitchBand::Normal:
            return "Neutral";
    }
    return "Neutral";
}

}

std::string emotion_tag(const VoiceProfile& voice) {
    if (std::holds_alternative<DefaultVoice>(voice)) {
        return "Neutral";
    }
    if (const auto* prosody = std::get_if<ProsodyVoice>(&voice)) {
        return prosody_tag(*prosody);
    }
    return protocol::to_string(std::get<EmotionVoice>(voice).emotion);
}

}
