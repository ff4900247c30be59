#include "audio/audio_io.hpp"
#include <algorithm>

namespace audio {

Samples to_float(const Pcm& pcm) {
    Samples out(pcm.size());
    std::transform(pcm.begin(), pcm.end(), out.begin(),
                   [](int16_t sample) { return static_cast<float>(sample) / 32768.0f; });
    return out;
}

Pcm to_pcm(const Samples& samples) {
    Pcm out(samples.size());
    std::transform(samples.begin(), samples.end(), out.begin(), [](float sample) {
        return static_cast<int16_t>(std::clamp(sample, -1.0f, 1.0f) * 32767.0f);
    });
    return out;
}

}
