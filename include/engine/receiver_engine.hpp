#ifndef JANUS_ENGINE_RECEIVER_ENGINE_HPP
#define JANUS_ENGINE_RECEIVER_ENGINE_HPP

#include "core/non_copyable.hpp"
#include "engine/collaborators.hpp"
#include "engine/playback_worker.hpp"
#include "events/event_channel.hpp"
#include "network/transport.hpp"
#include "protocol/janus_packet.hpp"
#include "synthesis/morse_keyer.hpp"
#include "synthesis/voice_profile.hpp"
#include <atomic>
#include <thread>

namespace engine {
    // Voice for a received packet: TextOnly always gets the default voice,
    // Semantic takes an explicit override over measured prosody.
    synthesis::VoiceProfile select_voice(const protocol::JanusPacket& packet);

    // Receive -> decode -> sentence split -> synthesize -> playback queue.
    // One packet, and one sentence within it, at a time so playback order
    // is arrival order.
    class ReceiverEngine : private core::NonCopyable {
    public:
        ReceiverEngine(network::FrameReceiver& receiver,
                       Synthesizer& synthesizer,
                       PlaybackQueue& playback,
                       events::EventSink& events,
                       synthesis::MorseKeyer keyer = synthesis::MorseKeyer());
        ~ReceiverEngine();

        void start();
        void stop();
        bool is_running() const { return running_; }

        // False when the frame could not be decoded.
        bool handle_frame(const network::Frame& frame);

        // Returns the number of audio chunks queued for playback.
        size_t handle_packet(const protocol::JanusPacket& packet);

        uint64_t packets_received() const { return packets_received_; }
        uint64_t decode_errors() const { return decode_errors_; }

    private:
        void run();
        size_t speak(const protocol::JanusPacket& packet);
        size_t key_morse(const protocol::JanusPacket& packet);
        bool synthesize_sentence(const std::string& sentence, const synthesis::VoiceProfile& voice);
        void enqueue(audio::Pcm pcm);

        network::FrameReceiver& receiver_;
        Synthesizer& synthesizer_;
        PlaybackQueue& playback_;
        events::EventSink& events_;
        synthesis::MorseKeyer keyer_;

        std::atomic<bool> running_{false};
        std::thread thread_;
        std::atomic<uint64_t> packets_received_{0};
        std::atomic<uint64_t> decode_errors_{0};
    };
}

#endif
