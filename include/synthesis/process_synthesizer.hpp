#ifndef JANUS_SYNTHESIS_PROCESS_SYNTHESIZER_HPP
#define JANUS_SYNTHESIS_PROCESS_SYNTHESIZER_HPP

#include "engine/collaborators.hpp"
#include <string>

namespace synthesis {
    // Runs an external TTS command per sentence and reads raw s16le mono
    // PCM from its stdout. The template may use {text} and {emotion};
    // both are substituted shell-quoted, e.g.
    //   piper --model en_US.onnx --output-raw <<< {text}
    class ProcessSynthesizer : public engine::Synthesizer {
    public:
        explicit ProcessSynthesizer(std::string command_template);

        audio::Pcm synthesize(const std::string& text, const VoiceProfile& voice) override;

        std::string build_command(const std::string& text, const VoiceProfile& voice) const;
        static std::string shell_quote(const std::string& value);

    private:
        std::string command_template_;
    };
}

#endif
