#ifndef JANUS_CONTROL_CONTROL_STATE_HPP
#define JANUS_CONTROL_CONTROL_STATE_HPP

#include "core/non_copyable.hpp"
#include "protocol/janus_packet.hpp"
#include <cstdint>
#include <mutex>
#include <optional>

namespace control {
    struct ControlSnapshot {
        protocol::Mode mode = protocol::Mode::Semantic;
        bool is_streaming = false;
        bool is_recording = false;
        protocol::EmotionOverride emotion_override = protocol::EmotionOverride::Auto;
        uint64_t revision = 0;

        bool capture_active() const { return is_streaming || is_recording; }
    };

    // Only the fields that are set change; the rest keep their value.
    struct ControlUpdate {
        std::optional<protocol::Mode> mode;
        std::optional<bool> is_streaming;
        std::optional<bool> is_recording;
        std::optional<protocol::EmotionOverride> emotion_override;

        bool empty() const {
            return !mode && !is_streaming && !is_recording && !emotion_override;
        }
    };

    // Operating mode and capture flags shared by the control input and the
    // engines. A reader always sees one whole snapshot: all fields of one
    // apply() land together.
    class ControlState : private core::NonCopyable {
    public:
        ControlState() = default;
        explicit ControlState(const ControlSnapshot& initial);

        ControlSnapshot get() const;
        ControlSnapshot apply(const ControlUpdate& update);

    private:
        mutable std::mutex mutex_;
        ControlSnapshot state_;
    };
}

#endif
