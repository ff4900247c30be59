#include "text/utf8.hpp"

namespace text {

namespace {

const char REPLACEMENT[] = "\xEF\xBF\xBD";

bool continuation(unsigned char byte) {
    return (byte & 0xC0) == 0x80;
}

// Length of the well-formed sequence starting at i, or 0.
size_t sequence_length(const std::string& text, size_t i) {
    const auto lead = static_cast<unsigned char>(text[i]);
    const size_t left = text.size() - i;
    auto at = [&text, i](size_t k) { return static_cast<unsigned char>(text[i + k]); };

    if (lead < 0x80) {
        return 1;
    }
    if (lead >= 0xC2 && lead <= 0xDF) {
        return left >= 2 && continuation(at(1)) ? 2 : 0;
    }
    if (lead >= 0xE0 && lead <= 0xEF) {
        if (left < 3 || !continuation(at(1)) || !continuation(at(2))) {
            return 0;
        }
        if (lead == 0xE0 && at(1) < 0xA0) return 0;   // overlong
        if (lead == 0xED && at(1) > 0x9F) return 0;   // surrogate
        return 3;
    }
    if (lead >= 0xF0 && lead <= 0xF4) {
        if (left < 4 || !continuation(at(1)) || !continuation(at(2)) || !continuation(at(3))) {
            return 0;
        }
        if (lead == 0xF0 && at(1) < 0x90) return 0;   // overlong
        if (lead == 0xF4 && at(1) > 0x8F) return 0;   // past U+10FFFF
        return 4;
    }
    return 0;
}

}

bool is_valid_utf8(const std::string& text) {
    size_t i = 0;
    while (i < text.size()) {
        const size_t length = sequence_length(text, i);
        if (length == 0) {
            return false;
        }
        i += length;
    }
    return true;
}

std::string repair_utf8(const std::string& text) {
    std::string repaired;
    repaired.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        const size_t length = sequence_length(text, i);
        if (length == 0) {
            repaired += REPLACEMENT;
            ++i;
            continue;
        }
        repaired.append(text, i, length);
        i += length;
    }
    return repaired;
}

}
