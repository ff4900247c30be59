#ifndef JANUS_STT_TRANSCRIPT_FILTER_HPP
#define JANUS_STT_TRANSCRIPT_FILTER_HPP

#include <string>

namespace stt {
    // Drops bracketed non-speech markers ("[BLANK_AUDIO]", "(music)") and
    // collapses the whitespace left behind.
    std::string strip_non_speech(const std::string& transcript);
}

#endif
