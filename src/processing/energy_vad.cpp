#include "processing/energy_vad.hpp"
#include <cmath>

namespace processing {

EnergyVad::EnergyVad(EnergyVadConfig config) : config_(config) {}

bool EnergyVad::is_speech(const audio::Samples& chunk) {
    bool voiced = rms(chunk) > config_.energy_threshold &&
                  zero_crossing_rate(chunk) < config_.zero_crossing_threshold;
    if (voiced) {
        hangover_left_ = config_.hangover_chunks;
        return true;
    }
    if (hangover_left_ > 0) {
        --hangover_left_;
        return true;
    }
    return false;
}

void EnergyVad::reset() {
    hangover_left_ = 0;
}

float EnergyVad::rms(const audio::Samples& chunk) {
    if (chunk.empty()) {
        return 0.0f;
    }
    double energy = 0.0;
    for (float sample : chunk) {
        energy += static_cast<double>(sample) * sample;
    }
    return static_cast<float>(std::sqrt(energy / chunk.size()));
}

float EnergyVad::zero_crossing_rate(const audio::Samples& chunk) {
    if (chunk.size() < 2) {
        return 0.0f;
    }
    int crossings = 0;
    for (size_t i = 1; i < chunk.size(); ++i) {
        if ((chunk[i] >= 0 && chunk[i - 1] < 0) || (chunk[i] < 0 && chunk[i - 1] >= 0)) {
            crossings++;
        }
    }
    return static_cast<float>(crossings) / (chunk.size() - 1);
}

}
