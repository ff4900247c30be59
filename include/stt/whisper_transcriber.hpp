#ifndef JANUS_STT_WHISPER_TRANSCRIBER_HPP
#define JANUS_STT_WHISPER_TRANSCRIBER_HPP

#include "core/non_copyable.hpp"
#include "engine/collaborators.hpp"
#include <string>

struct whisper_context;

namespace stt {
    struct WhisperConfig {
        std::string model_path;
        std::string language = "en";
        int threads = 4;
        float min_confidence = 0.4f;    // mean token probability
    };

    class WhisperTranscriber : public engine::Transcriber, private core::NonCopyable {
    public:
        // Throws std::runtime_error when the model cannot be loaded.
        explicit WhisperTranscriber(WhisperConfig config);
        ~WhisperTranscriber() override;

        std::string transcribe(const audio::Samples& utterance) override;

    private:
        WhisperConfig config_;
        whisper_context* context_ = nullptr;
    };
}

#endif
