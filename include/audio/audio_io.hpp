#ifndef JANUS_AUDIO_AUDIO_IO_HPP
#define JANUS_AUDIO_AUDIO_IO_HPP

#include <cstdint>
#include <vector>

namespace audio {
    // Capture side works in normalized float, playback side in int16 PCM.
    using Samples = std::vector<float>;
    using Pcm = std::vector<int16_t>;

    constexpr int SAMPLE_RATE = 16000;
    constexpr int NUM_CHANNELS = 1;
    constexpr int FRAMES_PER_CHUNK = 512;   // 32 ms

    // Owned by the sender engine only.
    class AudioSource {
    public:
        virtual ~AudioSource() = default;
        // Blocks for about one chunk of real time.
        virtual Samples read_chunk() = 0;
    };

    // Owned by the playback worker only.
    class AudioSink {
    public:
        virtual ~AudioSink() = default;
        virtual void write_chunk(const Pcm& samples) = 0;
    };

    Samples to_float(const Pcm& pcm);
    Pcm to_pcm(const Samples& samples);
}

#endif
