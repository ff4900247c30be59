#include "synthesis/process_synthesizer.hpp"
#include "core/errors.hpp"
#include <cstdio>
#include <stdexcept>
#include <sys/wait.h>

namespace synthesis {

namespace {
    void replace_all(std::string& target, const std::string& placeholder, const std::string& value) {
        size_t pos = 0;
        while ((pos = target.find(placeholder, pos)) != std::string::npos) {
            target.replace(pos, placeholder.size(), value);
            pos += value.size();
        }
    }
}

ProcessSynthesizer::ProcessSynthesizer(std::string command_template)
    : command_template_(std::move(command_template)) {
    if (command_template_.empty()) {
        throw std::invalid_argument("synthesizer command is empty");
    }
}

std::string ProcessSynthesizer::shell_quote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string ProcessSynthesizer::build_command(const std::string& text, const VoiceProfile& voice) const {
    std::string command = command_template_;
    replace_all(command, "{text}", shell_quote(text));
    replace_all(command, "{emotion}", shell_quote(emotion_tag(voice)));
    return command;
}

audio::Pcm ProcessSynthesizer::synthesize(const std::string& text, const VoiceProfile& voice) {
    const std::string command = build_command(text, voice);

    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe) {
        throw core::SynthesisError("failed to start synthesizer process");
    }

    std::vector<uint8_t> bytes;
    uint8_t buffer[4096];
    size_t n;
    while ((n = fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        bytes.insert(bytes.end(), buffer, buffer + n);
    }

    int status = pclose(pipe);
    if (status == -1) {
        throw core::SynthesisError("failed to wait for synthesizer process");
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        throw core::SynthesisError("synthesizer exited with status " +
                                   std::to_string(WIFEXITED(status) ? WEXITSTATUS(status) : -1));
    }

    audio::Pcm pcm(bytes.size() / 2);
    for (size_t i = 0; i < pcm.size(); ++i) {
        pcm[i] = static_cast<int16_t>(bytes[2 * i] | (bytes[2 * i + 1] << 8));
    }
    if (pcm.empty()) {
        throw core::SynthesisError("synthesizer produced no audio");
    }
    return pcm;
}

}
