#ifndef JANUS_PROCESSING_ENERGY_VAD_HPP
#define JANUS_PROCESSING_ENERGY_VAD_HPP

#include "engine/collaborators.hpp"

namespace processing {
    struct EnergyVadConfig {
        float energy_threshold = 0.01f;         // RMS, normalized samples
        float zero_crossing_threshold = 0.3f;   // crossings per sample
        int hangover_chunks = 2;                // speech held after the last loud chunk
    };

    // Speech = loud enough and not noise-like. Cheap enough to run on every
    // captured chunk.
    class EnergyVad : public engine::VoiceActivityDetector {
    public:
        explicit EnergyVad(EnergyVadConfig config = {});

        bool is_speech(const audio::Samples& chunk) override;
        void reset() override;

        static float rms(const audio::Samples& chunk);
        static float zero_crossing_rate(const audio::Samples& chunk);

    private:
        EnergyVadConfig config_;
        int hangover_left_ = 0;
    };
}

#endif
