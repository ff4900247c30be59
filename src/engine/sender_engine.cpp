#include "engine/sender_engine.hpp"
#include "core/clock.hpp"
#include "core/errors.hpp"
#include "protocol/packet_codec.hpp"
#include "text/utf8.hpp"
#include <chrono>
#include <iostream>

namespace engine {

const char* to_string(UtteranceOutcome outcome) {
    switch (outcome) {
        case UtteranceOutcome::Sent:      return "sent";
        case UtteranceOutcome::Discarded: return "discarded";
        case UtteranceOutcome::Cancelled: return "cancelled";
        case UtteranceOutcome::Failed:    return "failed";
    }
    return "failed";
}

SenderEngine::SenderEngine(control::ControlState& control,
                           VoiceActivityDetector& vad,
                           Transcriber& transcriber,
                           ProsodyExtractor& prosody,
                           network::LinkSimulator& link,
                           events::EventSink& events,
                           SenderConfig config)
    : control_(control),
      transcriber_(transcriber),
      prosody_(prosody),
      link_(link),
      events_(events),
      config_(config),
      trigger_(vad, config.trigger),
      capture_queue_(config.capture_queue_capacity) {}

SenderEngine::~SenderEngine() {
    stop();
}

void SenderEngine::start(audio::AudioSource& source) {
    if (running_) {
        return;
    }
    stopping_ = false;
    running_ = true;
    capture_thread_ = std::thread([this, &source] { capture_loop(source); });
    engine_thread_ = std::thread([this] { engine_loop(); });
    std::cout << "✓ Sender engine started" << std::endl;
}

void SenderEngine::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    stopping_ = true;
    capture_queue_.close();
    if (capture_thread_.joinable()) {
        capture_thread_.join();
    }
    if (engine_thread_.joinable()) {
        engine_thread_.join();
    }
    std::cout << "Sender engine stopped." << std::endl;
}

void SenderEngine::capture_loop(audio::AudioSource& source) {
    while (running_) {
        try {
            audio::Samples samples = source.read_chunk();
            if (samples.empty()) {
                continue;
            }
            // The trigger runs later on the engine thread; it must see the
            // hold and stream flags as they were when this audio was heard.
            CapturedChunk chunk{std::move(samples), control_.get()};
            if (capture_queue_.push(std::move(chunk)) > 0) {
                static int drop_counter = 0;
                if (++drop_counter % 50 == 1) {
                    std::cerr << "WARNING: sender is behind, dropped "
                              << capture_queue_.dropped() << " capture chunks so far" << std::endl;
                }
            }
        } catch (const std::exception& e) {
            std::cerr << "ERROR: audio capture: " << e.what() << std::endl;
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }
}

void SenderEngine::engine_loop() {
    while (running_) {
        auto chunk = capture_queue_.pop(std::chrono::milliseconds(50));
        if (!chunk) {
            continue;
        }
        try {
            process_chunk(chunk->samples, chunk->control);
        } catch (const std::exception& e) {
            std::cerr << "ERROR: sender pipeline: " << e.what() << std::endl;
            events_.publish_error({"sender", e.what()});
        }
    }
}

std::optional<UtteranceOutcome> SenderEngine::process_chunk(const audio::Samples& chunk) {
    return process_chunk(chunk, control_.get());
}

std::optional<UtteranceOutcome> SenderEngine::process_chunk(const audio::Samples& chunk,
                                                            const control::ControlSnapshot& control) {
    auto utterance = trigger_.on_chunk(control, chunk);
    if (!utterance) {
        return std::nullopt;
    }
    return handle_utterance(*utterance);
}

std::string SenderEngine::transcribe(const audio::Samples& samples) {
    // Token-wise decoders can split a multi-byte character; the peer
    // rejects packets whose text is not UTF-8.
    const std::string transcript = text::repair_utf8(transcriber_.transcribe(samples));
    const auto first = transcript.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        throw core::EmptyUtteranceError();
    }
    const auto last = transcript.find_last_not_of(" \t\r\n");
    return transcript.substr(first, last - first + 1);
}

std::optional<Prosody> SenderEngine::extract_prosody(const audio::Samples& samples) {
    try {
        return prosody_.extract(samples);
    } catch (const std::exception& e) {
        std::cerr << "WARNING: prosody extraction failed, sending without it: " << e.what() << std::endl;
        return std::nullopt;
    }
}

protocol::JanusPacket SenderEngine::build_packet(const std::string& text,
                                                 const Utterance& utterance,
                                                 const control::ControlSnapshot& control,
                                                 const std::optional<Prosody>& prosody) {
    protocol::JanusPacket packet;
    packet.mode = control.mode;
    packet.text = text;
    packet.start_ms = utterance.start_ms;
    packet.end_ms = utterance.end_ms;

    switch (control.mode) {
        case protocol::Mode::Semantic:
            if (prosody) {
                packet.avg_pitch_hz = prosody->avg_pitch_hz;
                packet.avg_energy = prosody->avg_energy;
            }
            packet.emotion_override = control.emotion_override;
            break;
        case protocol::Mode::TextOnly:
        case protocol::Mode::Morse:
            // The receiver ignores affect in these modes; keep the bytes.
            break;
    }
    return packet;
}

UtteranceOutcome SenderEngine::handle_utterance(const Utterance& utterance) {
    const control::ControlSnapshot& control = utterance.control;

    std::string text;
    try {
        text = transcribe(utterance.samples);
    } catch (const core::EmptyUtteranceError&) {
        return UtteranceOutcome::Discarded;
    } catch (const std::exception& e) {
        std::cerr << "WARNING: transcription failed, utterance dropped: " << e.what() << std::endl;
        return UtteranceOutcome::Discarded;
    }

    std::optional<Prosody> prosody;
    if (control.mode == protocol::Mode::Semantic) {
        prosody = extract_prosody(utterance.samples);
    }

    const protocol::JanusPacket packet = build_packet(text, utterance, control, prosody);
    const auto payload = protocol::PacketCodec::encode(packet);

    std::cout << "Captured: '" << text << "' [" << protocol::to_string(packet.mode) << ", "
              << payload.size() << " bytes";
    if (packet.avg_pitch_hz) {
        std::cout << ", pitch " << *packet.avg_pitch_hz << " Hz, energy " << packet.avg_energy.value_or(0.0f);
    }
    std::cout << "]" << std::endl;

    // Give up the wait when the operator switched streaming off under us.
    auto cancelled = [this, &control]() {
        if (stopping_) {
            return true;
        }
        if (!control.is_streaming) {
            return false;
        }
        return !control_.get().capture_active();
    };

    network::SendResult result;
    try {
        result = link_.send(payload, cancelled);
    } catch (const core::TransportError& e) {
        std::cerr << "ERROR: transmission failed, utterance lost: " << e.what() << std::endl;
        events_.publish_error({"transport", e.what()});
        return UtteranceOutcome::Failed;
    }

    if (result == network::SendResult::Cancelled) {
        std::cout << "Transmission cancelled: capture stopped" << std::endl;
        return UtteranceOutcome::Cancelled;
    }
    if (result == network::SendResult::Skipped) {
        return UtteranceOutcome::Discarded;
    }

    ++utterances_sent_;

    events::TranscriptEvent transcript;
    transcript.direction = events::Direction::Outbound;
    transcript.text = packet.text;
    transcript.start_ms = packet.start_ms;
    transcript.end_ms = packet.end_ms;
    transcript.avg_pitch_hz = packet.avg_pitch_hz;
    transcript.avg_energy = packet.avg_energy;
    events_.publish_transcript(std::move(transcript));

    events_.publish_packet_summary({events::Direction::Outbound,
                                    protocol::summarize(packet, payload.size(), core::now_ms())});
    return UtteranceOutcome::Sent;
}

}
