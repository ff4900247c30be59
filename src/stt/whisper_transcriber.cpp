#include "stt/whisper_transcriber.hpp"
#include "stt/transcript_filter.hpp"
#include <iostream>
#include <stdexcept>
#include <whisper.h>

namespace stt {

WhisperTranscriber::WhisperTranscriber(WhisperConfig config) : config_(std::move(config)) {
    whisper_context_params params = whisper_context_default_params();
    context_ = whisper_init_from_file_with_params(config_.model_path.c_str(), params);
    if (!context_) {
        throw std::runtime_error("failed to load whisper model: " + config_.model_path);
    }
    std::cout << "✓ Whisper model loaded: " << config_.model_path << std::endl;
}

WhisperTranscriber::~WhisperTranscriber() {
    if (context_) {
        whisper_free(context_);
        context_ = nullptr;
    }
}

std::string WhisperTranscriber::transcribe(const audio::Samples& utterance) {
    if (utterance.empty()) {
        return {};
    }

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    params.no_timestamps = true;
    params.print_progress = false;
    params.print_realtime = false;
    params.print_special = false;
    params.single_segment = false;
    params.language = config_.language.c_str();
    params.n_threads = config_.threads;

    if (whisper_full(context_, params, utterance.data(), static_cast<int>(utterance.size())) != 0) {
        throw std::runtime_error("whisper inference failed");
    }

    const whisper_token eot = whisper_token_eot(context_);
    std::string transcript;
    double probability_sum = 0.0;
    int token_count = 0;

    const int segments = whisper_full_n_segments(context_);
    for (int i = 0; i < segments; ++i) {
        transcript += whisper_full_get_segment_text(context_, i);
        transcript += " ";

        const int tokens = whisper_full_n_tokens(context_, i);
        for (int j = 0; j < tokens; ++j) {
            // Special tokens (timestamps, language, eot) sort after eot.
            if (whisper_full_get_token_id(context_, i, j) >= eot) {
                continue;
            }
            probability_sum += whisper_full_get_token_p(context_, i, j);
            token_count++;
        }
    }

    std::string text = strip_non_speech(transcript);
    if (text.empty() || token_count == 0) {
        return {};
    }

    const double confidence = probability_sum / token_count;
    if (confidence < config_.min_confidence) {
        std::cout << "Low-confidence transcription dropped (" << confidence << "): '" << text << "'" << std::endl;
        return {};
    }
    return text;
}

}
