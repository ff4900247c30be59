#include "engine/capture_trigger.hpp"

namespace engine {

const char* to_string(TriggerState state) {
    switch (state) {
        case TriggerState::Idle:           return "Idle";
        case TriggerState::Recording:      return "Recording";
        case TriggerState::StreamingArmed: return "StreamingArmed";
        case TriggerState::Capturing:      return "Capturing";
    }
    return "Idle";
}

CaptureTrigger::CaptureTrigger(VoiceActivityDetector& vad, TriggerConfig config)
    : vad_(vad), config_(config) {}

int64_t CaptureTrigger::elapsed_ms() const {
    return static_cast<int64_t>(samples_seen_ * 1000 / static_cast<uint64_t>(config_.sample_rate));
}

void CaptureTrigger::append(const audio::Samples& chunk, int64_t chunk_start_ms) {
    if (buffer_.empty()) {
        buffer_start_ms_ = chunk_start_ms;
    }
    buffer_.insert(buffer_.end(), chunk.begin(), chunk.end());
}

std::optional<Utterance> CaptureTrigger::take_utterance(int64_t end_ms) {
    silence_run_ = 0;
    if (buffer_.empty()) {
        return std::nullopt;
    }
    Utterance utterance;
    utterance.samples = std::move(buffer_);
    utterance.start_ms = buffer_start_ms_;
    utterance.end_ms = end_ms;
    buffer_.clear();
    return utterance;
}

std::optional<Utterance> CaptureTrigger::on_chunk(const control::ControlSnapshot& control,
                                                   const audio::Samples& chunk) {
    auto utterance = advance(control, chunk);
    if (utterance) {
        utterance->control = control;
    }
    return utterance;
}

std::optional<Utterance> CaptureTrigger::advance(const control::ControlSnapshot& control,
                                                  const audio::Samples& chunk) {
    const int64_t chunk_start_ms = elapsed_ms();
    samples_seen_ += chunk.size();
    const int64_t chunk_end_ms = elapsed_ms();

    const size_t max_samples =
        static_cast<size_t>(static_cast<int64_t>(config_.sample_rate) * config_.max_utterance_ms / 1000);

    if (control.is_recording) {
        // Speech already captured by the stream is kept; the hold extends it.
        state_ = TriggerState::Recording;
        append(chunk, chunk_start_ms);
        if (buffer_.size() >= max_samples) {
            return take_utterance(chunk_end_ms);
        }
        return std::nullopt;
    }

    if (state_ == TriggerState::Recording) {
        // Hold released. The release chunk itself belongs to whatever comes next.
        auto utterance = take_utterance(chunk_start_ms);
        state_ = control.is_streaming ? TriggerState::StreamingArmed : TriggerState::Idle;
        vad_.reset();
        return utterance;
    }

    if (!control.is_streaming) {
        const bool was_capturing = state_ == TriggerState::Capturing;
        state_ = TriggerState::Idle;
        if (was_capturing) {
            return take_utterance(chunk_start_ms);
        }
        buffer_.clear();
        silence_run_ = 0;
        return std::nullopt;
    }

    if (state_ == TriggerState::Idle) {
        state_ = TriggerState::StreamingArmed;
        vad_.reset();
    }

    const bool speech = vad_.is_speech(chunk);

    if (state_ == TriggerState::StreamingArmed) {
        if (!speech) {
            return std::nullopt;
        }
        state_ = TriggerState::Capturing;
        silence_run_ = 0;
        append(chunk, chunk_start_ms);
        return std::nullopt;
    }

    // Capturing: trailing silence stays in the buffer so words are not clipped.
    append(chunk, chunk_start_ms);
    silence_run_ = speech ? 0 : silence_run_ + 1;

    if (silence_run_ >= config_.silence_chunks || buffer_.size() >= max_samples) {
        state_ = TriggerState::StreamingArmed;
        return take_utterance(chunk_end_ms);
    }
    return std::nullopt;
}

}
