#ifndef JANUS_TEXT_SENTENCE_SEGMENTER_HPP
#define JANUS_TEXT_SENTENCE_SEGMENTER_HPP

#include <optional>
#include <string>
#include <vector>

namespace text {
    using SentenceUnit = std::string;

    // Buffers streamed text tokens and hands out whole sentences so the
    // synthesizer can start on the first sentence before the rest arrives.
    // A packet may carry no punctuation at all, so the receiver must call
    // flush() at the end of every packet.
    class SentenceSegmenter {
    public:
        std::optional<SentenceUnit> add_token(const std::string& token);
        std::optional<SentenceUnit> flush();

        bool empty() const { return buffer_.empty(); }

    private:
        std::string buffer_;
    };

    // UTF-8 code points, one token each.
    std::vector<std::string> tokenize(const std::string& text);

    // Runs a whole text through a fresh segmenter, end-of-text flush included.
    std::vector<SentenceUnit> segment(const std::string& text);
}

#endif
