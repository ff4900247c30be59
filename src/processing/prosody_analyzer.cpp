#include "processing/prosody_analyzer.hpp"
#include "processing/energy_vad.hpp"
#include <cmath>
#include <stdexcept>

namespace processing {

ProsodyAnalyzer::ProsodyAnalyzer(ProsodyConfig config) : config_(config) {
    if (config_.sample_rate <= 0 || config_.frame_size == 0 || config_.hop_size == 0 ||
        config_.min_pitch_hz <= 0.0f || config_.max_pitch_hz <= config_.min_pitch_hz) {
        throw std::invalid_argument("invalid prosody analyzer configuration");
    }
}

std::optional<engine::Prosody> ProsodyAnalyzer::extract(const audio::Samples& utterance) {
    if (utterance.empty()) {
        return std::nullopt;
    }

    double pitch_sum = 0.0;
    size_t voiced_frames = 0;
    for (size_t start = 0; start + config_.frame_size <= utterance.size(); start += config_.hop_size) {
        if (auto pitch = frame_pitch(utterance.data() + start, config_.frame_size)) {
            pitch_sum += *pitch;
            voiced_frames++;
        }
    }
    if (voiced_frames == 0) {
        return std::nullopt;
    }

    engine::Prosody prosody;
    prosody.avg_energy = EnergyVad::rms(utterance);
    prosody.avg_pitch_hz = static_cast<float>(pitch_sum / voiced_frames);
    return prosody;
}

std::optional<float> ProsodyAnalyzer::frame_pitch(const float* frame, size_t size) const {
    const size_t min_lag = static_cast<size_t>(config_.sample_rate / config_.max_pitch_hz);
    const size_t max_lag = static_cast<size_t>(config_.sample_rate / config_.min_pitch_hz);
    if (size <= max_lag || min_lag == 0) {
        return std::nullopt;
    }

    double energy = 0.0;
    for (size_t i = 0; i < size; ++i) {
        energy += static_cast<double>(frame[i]) * frame[i];
    }
    if (std::sqrt(energy / size) < config_.voicing_rms) {
        return std::nullopt;
    }

    // Normalized autocorrelation; the first peak above the voicing
    // threshold wins so octave errors favour the fundamental.
    std::vector<double> correlation(max_lag + 1, 0.0);
    for (size_t lag = min_lag; lag <= max_lag; ++lag) {
        double sum = 0.0;
        double energy_a = 0.0;
        double energy_b = 0.0;
        for (size_t i = 0; i + lag < size; ++i) {
            sum += static_cast<double>(frame[i]) * frame[i + lag];
            energy_a += static_cast<double>(frame[i]) * frame[i];
            energy_b += static_cast<double>(frame[i + lag]) * frame[i + lag];
        }
        double norm = std::sqrt(energy_a * energy_b);
        correlation[lag] = norm > 0.0 ? sum / norm : 0.0;
    }

    size_t best_lag = 0;
    double best = config_.voicing_correlation;
    for (size_t lag = min_lag; lag <= max_lag; ++lag) {
        if (correlation[lag] > best) {
            best = correlation[lag];
            best_lag = lag;
        } else if (best_lag != 0 && correlation[lag] < best) {
            // Past the first peak.
            break;
        }
    }
    if (best_lag == 0) {
        return std::nullopt;
    }

    double lag = static_cast<double>(best_lag);
    // Parabolic interpolation around the peak.
    if (best_lag > min_lag && best_lag < max_lag) {
        double a = correlation[best_lag - 1];
        double b = correlation[best_lag];
        double c = correlation[best_lag + 1];
        double denom = a - 2.0 * b + c;
        if (std::fabs(denom) > 1e-12) {
            lag += 0.5 * (a - c) / denom;
        }
    }
    return static_cast<float>(config_.sample_rate / lag);
}

}
