#ifndef JANUS_ENGINE_CAPTURE_TRIGGER_HPP
#define JANUS_ENGINE_CAPTURE_TRIGGER_HPP

#include "audio/audio_io.hpp"
#include "control/control_state.hpp"
#include "engine/collaborators.hpp"
#include <cstdint>
#include <optional>

namespace engine {
    enum class TriggerState {
        Idle,
        Recording,        // hold-to-record, VAD bypassed
        StreamingArmed,   // toggle streaming, waiting for speech
        Capturing         // toggle streaming, speech in progress
    };

    const char* to_string(TriggerState state);

    struct Utterance {
        audio::Samples samples;
        int64_t start_ms = 0;   // since capture started
        int64_t end_ms = 0;
        // Flags of the chunk that closed the utterance; they pick the mode.
        control::ControlSnapshot control;
    };

    struct TriggerConfig {
        int sample_rate = audio::SAMPLE_RATE;
        // Consecutive silent chunks that end a streamed utterance
        // (16 x 32 ms ~ 500 ms of trailing silence).
        int silence_chunks = 16;
        // Longer utterances are cut here even without silence.
        int max_utterance_ms = 30000;
    };

    // Arbitrates hold-to-record against VAD-gated streaming. Runs once per
    // captured chunk and yields at most one finished utterance per chunk.
    // When both flags are set, hold-to-record wins.
    class CaptureTrigger {
    public:
        CaptureTrigger(VoiceActivityDetector& vad, TriggerConfig config = {});

        std::optional<Utterance> on_chunk(const control::ControlSnapshot& control,
                                          const audio::Samples& chunk);

        TriggerState state() const { return state_; }
        size_t buffered_samples() const { return buffer_.size(); }
        int64_t elapsed_ms() const;

    private:
        std::optional<Utterance> advance(const control::ControlSnapshot& control,
                                         const audio::Samples& chunk);
        std::optional<Utterance> take_utterance(int64_t end_ms);
        void append(const audio::Samples& chunk, int64_t chunk_start_ms);

        VoiceActivityDetector& vad_;
        TriggerConfig config_;
        TriggerState state_ = TriggerState::Idle;
        audio::Samples buffer_;
        int64_t buffer_start_ms_ = 0;
        int silence_run_ = 0;
        uint64_t samples_seen_ = 0;
    };
}

#endif
