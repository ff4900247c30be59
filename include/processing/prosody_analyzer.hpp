#ifndef JANUS_PROCESSING_PROSODY_ANALYZER_HPP
#define JANUS_PROCESSING_PROSODY_ANALYZER_HPP

#include "engine/collaborators.hpp"

namespace processing {
    struct ProsodyConfig {
        int sample_rate = audio::SAMPLE_RATE;
        size_t frame_size = 1024;
        size_t hop_size = 512;
        float min_pitch_hz = 60.0f;
        float max_pitch_hz = 400.0f;
        float voicing_rms = 0.01f;          // quieter frames are not pitch-tracked
        float voicing_correlation = 0.5f;   // normalized autocorrelation peak
    };

    // Average energy (RMS over the utterance) and average F0 of voiced frames.
    class ProsodyAnalyzer : public engine::ProsodyExtractor {
    public:
        explicit ProsodyAnalyzer(ProsodyConfig config = {});

        std::optional<engine::Prosody> extract(const audio::Samples& utterance) override;

        // F0 of one frame, or none when the frame is unvoiced.
        std::optional<float> frame_pitch(const float* frame, size_t size) const;

    private:
        ProsodyConfig config_;
    };
}

#endif
