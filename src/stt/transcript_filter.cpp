#include "stt/transcript_filter.hpp"
#include <cctype>

namespace stt {

std::string strip_non_speech(const std::string& transcript) {
    std::string kept;
    kept.reserve(transcript.size());

    char closing = 0;
    for (char c : transcript) {
        if (closing) {
            if (c == closing) {
                closing = 0;
            }
            continue;
        }
        if (c == '[') {
            closing = ']';
            continue;
        }
        if (c == '(') {
            closing = ')';
            continue;
        }
        kept += c;
    }

    std::string result;
    result.reserve(kept.size());
    bool pending_space = false;
    for (char c : kept) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !result.empty();
            continue;
        }
        if (pending_space) {
            result += ' ';
            pending_space = false;
        }
        result += c;
    }
    return result;
}

}
