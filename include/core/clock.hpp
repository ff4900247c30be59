#ifndef JANUS_CORE_CLOCK_HPP
#define JANUS_CORE_CLOCK_HPP

#include <chrono>
#include <cstdint>

namespace core {
    inline int64_t now_ms() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
}

#endif
