#ifndef JANUS_ENGINE_PLAYBACK_WORKER_HPP
#define JANUS_ENGINE_PLAYBACK_WORKER_HPP

#include "audio/audio_io.hpp"
#include "core/bounded_queue.hpp"
#include "core/non_copyable.hpp"
#include <atomic>
#include <chrono>
#include <thread>

namespace engine {
    using PlaybackQueue = core::BoundedQueue<audio::Pcm>;

    // Sole writer of the output device. Plays chunks strictly in the order
    // the receiver queued them.
    class PlaybackWorker : private core::NonCopyable {
    public:
        PlaybackWorker(audio::AudioSink& sink, PlaybackQueue& queue);
        ~PlaybackWorker();

        void start();
        void stop();

        // Plays one chunk if one arrives within the timeout.
        bool play_next(std::chrono::milliseconds timeout);

        uint64_t chunks_played() const { return chunks_played_; }

    private:
        void run();

        audio::AudioSink& sink_;
        PlaybackQueue& queue_;
        std::atomic<bool> running_{false};
        std::thread thread_;
        std::atomic<uint64_t> chunks_played_{0};
    };
}

#endif
