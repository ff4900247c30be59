#ifndef JANUS_AUDIO_AUDIO_MANAGER_HPP
#define JANUS_AUDIO_AUDIO_MANAGER_HPP

#include "audio/audio_io.hpp"
#include "core/bounded_queue.hpp"
#include "core/non_copyable.hpp"
#include <portaudio.h>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>

namespace audio {
    // One full-duplex PortAudio stream. The callback hands captured chunks to
    // read_chunk() and plays whatever write_chunk() queued, silence otherwise.
    class AudioManager : public AudioSource, public AudioSink, private core::NonCopyable {
    public:
        static constexpr PaSampleFormat FORMAT = paInt16;

        explicit AudioManager(size_t capture_chunks = 64, size_t max_output_ms = 2000);
        ~AudioManager() override;

        // Throws std::runtime_error when a default device is missing or the
        // stream cannot be opened.
        void start();
        void stop();
        bool is_active() const;

        // Empty after ~100 ms without input, or once stopped.
        Samples read_chunk() override;

        // Blocks while more than max_output_ms of audio is waiting.
        void write_chunk(const Pcm& samples) override;

    private:
        static int pa_callback(const void* input, void* output, unsigned long frame_count,
                               const PaStreamCallbackTimeInfo* time_info,
                               PaStreamCallbackFlags status_flags, void* user_data);

        int process(const int16_t* input, int16_t* output, unsigned long frame_count);

        PaStream* stream_ = nullptr;
        std::atomic<bool> is_active_{false};

        core::BoundedQueue<Pcm> captured_;

        std::mutex output_mutex_;
        std::condition_variable output_drained_;
        std::deque<int16_t> output_;
        const size_t max_output_samples_;
    };
}

#endif
