#include "control/control_message.hpp"
#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace control {

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::optional<bool> read_flag(const json& message, const char* key) {
    auto it = message.find(key);
    if (it == message.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_boolean()) {
        throw std::invalid_argument(std::string("'") + key + "' must be a boolean");
    }
    return it->get<bool>();
}

bool parse_switch(const std::string& word) {
    if (word == "on" || word == "start" || word == "true" || word == "1") return true;
    if (word == "off" || word == "stop" || word == "false" || word == "0") return false;
    throw std::invalid_argument("expected on/off, got '" + word + "'");
}

}

std::optional<protocol::EmotionOverride> emotion_from_name(const std::string& name) {
    const std::string value = lowercase(name);
    if (value == "auto") return protocol::EmotionOverride::Auto;
    // calm/urgent are the labels older UI builds send.
    if (value == "relaxed" || value == "calm") return protocol::EmotionOverride::Relaxed;
    if (value == "panicked" || value == "urgent") return protocol::EmotionOverride::Panicked;
    return std::nullopt;
}

const char* emotion_name(protocol::EmotionOverride emotion) {
    switch (emotion) {
        case protocol::EmotionOverride::Auto:     return "auto";
        case protocol::EmotionOverride::Relaxed:  return "relaxed";
        case protocol::EmotionOverride::Panicked: return "panicked";
    }
    return "auto";
}

ControlUpdate parse_control_message(const json& message) {
    if (!message.is_object()) {
        throw std::invalid_argument("control message must be a JSON object");
    }
    auto type = message.find("type");
    if (type != message.end() && !(type->is_string() && type->get<std::string>() == "control")) {
        throw std::invalid_argument("not a control message");
    }

    ControlUpdate update;
    update.is_streaming = read_flag(message, "is_streaming");
    update.is_recording = read_flag(message, "is_recording");

    auto mode = message.find("mode");
    if (mode != message.end() && !mode->is_null()) {
        if (!mode->is_string()) {
            throw std::invalid_argument("'mode' must be a string");
        }
        update.mode = protocol::mode_from_name(lowercase(mode->get<std::string>()));
        if (!update.mode) {
            throw std::invalid_argument("unknown mode '" + mode->get<std::string>() + "'");
        }
    }

    auto emotion = message.find("emotion_override");
    if (emotion != message.end() && !emotion->is_null()) {
        if (!emotion->is_string()) {
            throw std::invalid_argument("'emotion_override' must be a string");
        }
        update.emotion_override = emotion_from_name(emotion->get<std::string>());
        if (!update.emotion_override) {
            throw std::invalid_argument("unknown emotion '" + emotion->get<std::string>() + "'");
        }
    }

    return update;
}

std::optional<ControlUpdate> parse_console_command(const std::string& line) {
    const auto first = line.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return std::nullopt;
    }

    if (line[first] == '{') {
        json message;
        try {
            message = json::parse(line.begin() + static_cast<std::ptrdiff_t>(first), line.end());
        } catch (const json::parse_error& e) {
            throw std::invalid_argument(std::string("invalid JSON: ") + e.what());
        }
        return parse_control_message(message);
    }

    std::istringstream words(lowercase(line));
    std::string command;
    std::string argument;
    words >> command >> argument;
    if (argument.empty()) {
        throw std::invalid_argument("'" + command + "' needs an argument");
    }

    ControlUpdate update;
    if (command == "record" || command == "hold") {
        update.is_recording = parse_switch(argument);
    } else if (command == "stream") {
        update.is_streaming = parse_switch(argument);
    } else if (command == "mode") {
        update.mode = protocol::mode_from_name(argument);
        if (!update.mode) {
            throw std::invalid_argument("unknown mode '" + argument + "'");
        }
    } else if (command == "emotion") {
        update.emotion_override = emotion_from_name(argument);
        if (!update.emotion_override) {
            throw std::invalid_argument("unknown emotion '" + argument + "'");
        }
    } else {
        throw std::invalid_argument("unknown command '" + command + "'");
    }
    return update;
}

json snapshot_to_json(const ControlSnapshot& snapshot) {
    return {
        {"type", "control_state"},
        {"mode", protocol::mode_name(snapshot.mode)},
        {"is_streaming", snapshot.is_streaming},
        {"is_recording", snapshot.is_recording},
        {"emotion_override", emotion_name(snapshot.emotion_override)}
    };
}

}
