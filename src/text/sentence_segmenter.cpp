#include "text/sentence_segmenter.hpp"
#include <algorithm>
#include <cctype>

namespace text {

namespace {

bool ends_sentence(const std::string& token) {
    if (token.empty()) {
        return false;
    }
    const char last = token.back();
    return last == '.' || last == '?' || last == '!' || last == '\n';
}

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

// Non-ASCII bytes count as word characters; punctuation-only runs do not.
bool has_word_character(const std::string& value) {
    return std::any_of(value.begin(), value.end(), [](char c) {
        const auto byte = static_cast<unsigned char>(c);
        return byte >= 0x80 || std::isalnum(byte);
    });
}

}

std::optional<SentenceUnit> SentenceSegmenter::add_token(const std::string& token) {
    if (token.empty()) {
        return std::nullopt;
    }
    buffer_ += token;
    if (ends_sentence(token)) {
        return flush();
    }
    return std::nullopt;
}

std::optional<SentenceUnit> SentenceSegmenter::flush() {
    std::string sentence = trim(buffer_);
    buffer_.clear();
    if (sentence.empty() || !has_word_character(sentence)) {
        return std::nullopt;
    }
    return sentence;
}

std::vector<std::string> tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    tokens.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        size_t length = 1;
        if (lead >= 0xF0) {
            length = 4;
        } else if (lead >= 0xE0) {
            length = 3;
        } else if (lead >= 0xC0) {
            length = 2;
        }
        length = std::min(length, text.size() - i);
        tokens.emplace_back(text, i, length);
        i += length;
    }
    return tokens;
}

std::vector<SentenceUnit> segment(const std::string& text) {
    std::vector<SentenceUnit> sentences;
    SentenceSegmenter segmenter;
    for (const auto& token : tokenize(text)) {
        if (auto sentence = segmenter.add_token(token)) {
            sentences.push_back(std::move(*sentence));
        }
    }
    if (auto tail = segmenter.flush()) {
        sentences.push_back(std::move(*tail));
    }
    return sentences;
}

}
