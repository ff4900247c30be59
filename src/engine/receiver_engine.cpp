#include "engine/receiver_engine.hpp"
#include "core/clock.hpp"
#include "core/errors.hpp"
#include "protocol/packet_codec.hpp"
#include "text/sentence_segmenter.hpp"
#include <chrono>
#include <iostream>

namespace engine {

synthesis::VoiceProfile select_voice(const protocol::JanusPacket& packet) {
    switch (packet.mode) {
        case protocol::Mode::Semantic:
            if (packet.emotion_override != protocol::EmotionOverride::Auto) {
                return synthesis::EmotionVoice{packet.emotion_override};
            }
            if (packet.avg_pitch_hz || packet.avg_energy) {
                return synthesis::ProsodyVoice{packet.avg_pitch_hz, packet.avg_energy};
            }
            return synthesis::DefaultVoice{};
        case protocol::Mode::TextOnly:
            return synthesis::DefaultVoice{};
        case protocol::Mode::Morse:
            // Never synthesized; keyed locally.
            return synthesis::DefaultVoice{};
    }
    return synthesis::DefaultVoice{};
}

ReceiverEngine::ReceiverEngine(network::FrameReceiver& receiver,
                               Synthesizer& synthesizer,
                               PlaybackQueue& playback,
                               events::EventSink& events,
                               synthesis::MorseKeyer keyer)
    : receiver_(receiver),
      synthesizer_(synthesizer),
      playback_(playback),
      events_(events),
      keyer_(std::move(keyer)) {}

ReceiverEngine::~ReceiverEngine() {
    stop();
}

void ReceiverEngine::start() {
    if (running_) {
        return;
    }
    running_ = true;
    thread_ = std::thread([this] { run(); });
    std::cout << "✓ Receiver engine listening on port " << receiver_.port() << std::endl;
}

void ReceiverEngine::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    std::cout << "Receiver engine stopped." << std::endl;
}

void ReceiverEngine::run() {
    while (running_) {
        try {
            auto frame = receiver_.receive(std::chrono::milliseconds(200));
            if (frame) {
                handle_frame(*frame);
            }
        } catch (const core::TransportError& e) {
            std::cerr << "ERROR: receive: " << e.what() << std::endl;
            events_.publish_error({"transport", e.what()});
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        } catch (const std::exception& e) {
            std::cerr << "ERROR: receiver: " << e.what() << std::endl;
            events_.publish_error({"receiver", e.what()});
        }
    }
}

bool ReceiverEngine::handle_frame(const network::Frame& frame) {
    protocol::JanusPacket packet;
    try {
        packet = protocol::PacketCodec::decode(frame);
    } catch (const core::DecodeError& e) {
        ++decode_errors_;
        std::cerr << "ERROR: corrupt packet received (" << frame.size() << " bytes): " << e.what() << std::endl;
        events_.publish_error({"decode", e.what()});
        return false;
    }

    ++packets_received_;

    events::TranscriptEvent transcript;
    transcript.direction = events::Direction::Inbound;
    transcript.text = packet.text;
    transcript.start_ms = packet.start_ms;
    transcript.end_ms = packet.end_ms;
    transcript.avg_pitch_hz = packet.avg_pitch_hz;
    transcript.avg_energy = packet.avg_energy;
    events_.publish_transcript(std::move(transcript));
    events_.publish_packet_summary({events::Direction::Inbound,
                                    protocol::summarize(packet, frame.size(), core::now_ms())});

    handle_packet(packet);
    return true;
}

size_t ReceiverEngine::handle_packet(const protocol::JanusPacket& packet) {
    std::cout << "[RECEIVED] [" << protocol::to_string(packet.mode) << "] '" << packet.text << "'" << std::endl;

    switch (packet.mode) {
        case protocol::Mode::Semantic:
        case protocol::Mode::TextOnly:
            return speak(packet);
        case protocol::Mode::Morse:
            return key_morse(packet);
    }
    return 0;
}

size_t ReceiverEngine::speak(const protocol::JanusPacket& packet) {
    const synthesis::VoiceProfile voice = select_voice(packet);
    std::cout << "   Voice prompt: [" << synthesis::emotion_tag(voice) << "]" << std::endl;

    size_t queued = 0;
    text::SentenceSegmenter segmenter;
    for (const auto& token : text::tokenize(packet.text)) {
        if (auto sentence = segmenter.add_token(token)) {
            queued += synthesize_sentence(*sentence, voice) ? 1 : 0;
        }
    }
    // End of packet is an implicit full stop.
    if (auto tail = segmenter.flush()) {
        queued += synthesize_sentence(*tail, voice) ? 1 : 0;
    }
    return queued;
}

size_t ReceiverEngine::key_morse(const protocol::JanusPacket& packet) {
    audio::Pcm tones = keyer_.key(packet.text);
    if (tones.empty()) {
        return 0;
    }
    enqueue(std::move(tones));
    return 1;
}

bool ReceiverEngine::synthesize_sentence(const std::string& sentence, const synthesis::VoiceProfile& voice) {
    audio::Pcm pcm;
    try {
        pcm = synthesizer_.synthesize(sentence, voice);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: synthesis failed for '" << sentence << "': " << e.what() << std::endl;
        events_.publish_error({"synthesis", e.what()});
        return false;
    }
    if (pcm.empty()) {
        std::cerr << "WARNING: synthesizer returned no audio for '" << sentence << "'" << std::endl;
        return false;
    }
    enqueue(std::move(pcm));
    return true;
}

void ReceiverEngine::enqueue(audio::Pcm pcm) {
    if (playback_.push(std::move(pcm)) > 0) {
        std::cerr << "WARNING: playback queue full, dropped the oldest unplayed audio" << std::endl;
    }
}

}
