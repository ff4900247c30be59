#ifndef JANUS_CONTROL_CONTROL_MESSAGE_HPP
#define JANUS_CONTROL_CONTROL_MESSAGE_HPP

#include "control/control_state.hpp"
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>

namespace control {
    std::optional<protocol::EmotionOverride> emotion_from_name(const std::string& name);
    const char* emotion_name(protocol::EmotionOverride emotion);

    // {"type":"control", "is_streaming"?, "is_recording"?, "mode"?, "emotion_override"?}
    // Absent or null fields mean "no change". Throws std::invalid_argument.
    ControlUpdate parse_control_message(const nlohmann::json& message);

    // Operator console: "record on", "stream off", "mode morse", "emotion relaxed",
    // or a JSON control message. Empty result for blank lines.
    // Throws std::invalid_argument for anything else.
    std::optional<ControlUpdate> parse_console_command(const std::string& line);

    nlohmann::json snapshot_to_json(const ControlSnapshot& snapshot);
}

#endif
