#ifndef JANUS_ENGINE_COLLABORATORS_HPP
#define JANUS_ENGINE_COLLABORATORS_HPP

#include "audio/audio_io.hpp"
#include "synthesis/voice_profile.hpp"
#include <optional>
#include <string>

namespace engine {
    struct Prosody {
        float avg_pitch_hz = 0.0f;
        float avg_energy = 0.0f;
    };

    // The model-backed stages are black boxes behind these interfaces.
    // Each is called from exactly one engine thread.

    class VoiceActivityDetector {
    public:
        virtual ~VoiceActivityDetector() = default;
        virtual bool is_speech(const audio::Samples& chunk) = 0;
        virtual void reset() {}
    };

    class Transcriber {
    public:
        virtual ~Transcriber() = default;
        // Empty string when nothing usable was recognized.
        virtual std::string transcribe(const audio::Samples& utterance) = 0;
    };

    class ProsodyExtractor {
    public:
        virtual ~ProsodyExtractor() = default;
        virtual std::optional<Prosody> extract(const audio::Samples& utterance) = 0;
    };

    class Synthesizer {
    public:
        virtual ~Synthesizer() = default;
        // Throws core::SynthesisError.
        virtual audio::Pcm synthesize(const std::string& text, const synthesis::VoiceProfile& voice) = 0;
    };
}

#endif
