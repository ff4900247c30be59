#ifndef JANUS_ENGINE_SENDER_ENGINE_HPP
#define JANUS_ENGINE_SENDER_ENGINE_HPP

#include "audio/audio_io.hpp"
#include "control/control_state.hpp"
#include "core/bounded_queue.hpp"
#include "core/non_copyable.hpp"
#include "engine/capture_trigger.hpp"
#include "engine/collaborators.hpp"
#include "events/event_channel.hpp"
#include "network/link_simulator.hpp"
#include "protocol/janus_packet.hpp"
#include <atomic>
#include <optional>
#include <string>
#include <thread>

namespace engine {
    enum class UtteranceOutcome {
        Sent,
        Discarded,   // nothing recognized, nothing sent
        Cancelled,   // capture stopped while the link was busy
        Failed       // transport error, reported on the event channel
    };

    const char* to_string(UtteranceOutcome outcome);

    struct SenderConfig {
        TriggerConfig trigger;
        // Chunks waiting while an earlier utterance is transcribed and sent.
        // Sized to hold one maximum-length utterance (about 32 s).
        size_t capture_queue_capacity = 1024;
    };

    // A chunk paired with the control flags in force when it was captured.
    struct CapturedChunk {
        audio::Samples samples;
        control::ControlSnapshot control;
    };

    // Capture -> trigger -> transcribe -> prosody -> packet -> throttled send.
    // Two threads: one blocks on the microphone, the other runs the pipeline,
    // so a slow transcription or a long link delay never stalls capture.
    class SenderEngine : private core::NonCopyable {
    public:
        SenderEngine(control::ControlState& control,
                     VoiceActivityDetector& vad,
                     Transcriber& transcriber,
                     ProsodyExtractor& prosody,
                     network::LinkSimulator& link,
                     events::EventSink& events,
                     SenderConfig config = {});
        ~SenderEngine();

        void start(audio::AudioSource& source);
        void stop();
        bool is_running() const { return running_; }

        // Feeds one captured chunk through the trigger and, when it closes an
        // utterance, through the rest of the pipeline on the calling thread.
        // The one-argument form judges the chunk against the current flags.
        std::optional<UtteranceOutcome> process_chunk(const audio::Samples& chunk);
        std::optional<UtteranceOutcome> process_chunk(const audio::Samples& chunk,
                                                      const control::ControlSnapshot& control);

        UtteranceOutcome handle_utterance(const Utterance& utterance);

        static protocol::JanusPacket build_packet(const std::string& text,
                                                  const Utterance& utterance,
                                                  const control::ControlSnapshot& control,
                                                  const std::optional<Prosody>& prosody);

        TriggerState trigger_state() const { return trigger_.state(); }
        uint64_t utterances_sent() const { return utterances_sent_; }
        size_t chunks_dropped() const { return capture_queue_.dropped(); }

    private:
        void capture_loop(audio::AudioSource& source);
        void engine_loop();
        std::string transcribe(const audio::Samples& samples);
        std::optional<Prosody> extract_prosody(const audio::Samples& samples);

        control::ControlState& control_;
        Transcriber& transcriber_;
        ProsodyExtractor& prosody_;
        network::LinkSimulator& link_;
        events::EventSink& events_;
        SenderConfig config_;

        CaptureTrigger trigger_;
        core::BoundedQueue<CapturedChunk> capture_queue_;

        std::atomic<bool> running_{false};
        std::atomic<bool> stopping_{false};
        std::thread capture_thread_;
        std::thread engine_thread_;
        std::atomic<uint64_t> utterances_sent_{0};
    };
}

#endif
