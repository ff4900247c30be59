#ifndef JANUS_TEXT_UTF8_HPP
#define JANUS_TEXT_UTF8_HPP

#include <string>

namespace text {
    // Well-formed UTF-8: no overlong forms, surrogates or code points past U+10FFFF.
    bool is_valid_utf8(const std::string& text);

    // Each byte that does not start a well-formed sequence becomes U+FFFD.
    std::string repair_utf8(const std::string& text);
}

#endif
