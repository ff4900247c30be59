#ifndef JANUS_CORE_ERRORS_HPP
#define JANUS_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace core {
    // Malformed or truncated packet. The frame is dropped, the loop continues.
    class DecodeError : public std::runtime_error {
    public:
        explicit DecodeError(const std::string& what) : std::runtime_error(what) {}
    };

    // Connection-level failure (refused, reset, broken pipe, bind failure).
    class TransportError : public std::runtime_error {
    public:
        explicit TransportError(const std::string& what) : std::runtime_error(what) {}
    };

    // Synthesizer failed for one sentence.
    class SynthesisError : public std::runtime_error {
    public:
        explicit SynthesisError(const std::string& what) : std::runtime_error(what) {}
    };

    // Transcription produced nothing usable. Discarded silently.
    class EmptyUtteranceError : public std::runtime_error {
    public:
        EmptyUtteranceError() : std::runtime_error("empty utterance") {}
    };
}

#endif
