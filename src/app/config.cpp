#include "app/config.hpp"
#include "control/control_message.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace app {

namespace {
    using json = nlohmann::json;

    bool same_kind(const json& value, const json& def) {
        if (def.is_number()) {
            return value.is_number();
        }
        return value.type() == def.type();
    }

    // Patches missing keys from the defaults and rejects wrong-typed ones.
    void merge_defaults(json& cfg, const json& defs, const std::string& prefix) {
        for (auto& item : defs.items()) {
            const std::string& key = item.key();
            const json& def = item.value();
            const std::string path = prefix.empty() ? key : prefix + "." + key;

            if (!cfg.contains(key) || cfg[key].is_null()) {
                cfg[key] = def;
            } else if (!same_kind(cfg[key], def)) {
                throw std::invalid_argument("config key '" + path + "' must be " + def.type_name());
            } else if (def.is_object()) {
                merge_defaults(cfg[key], def, path);
            }
        }
        for (auto& item : cfg.items()) {
            if (!defs.contains(item.key())) {
                const std::string path = prefix.empty() ? item.key() : prefix + "." + item.key();
                std::cerr << "WARNING: unknown config key '" << path << "' ignored" << std::endl;
            }
        }
    }

    int64_t positive(const json& cfg, const char* section, const char* key) {
        const json& value = cfg.at(section).at(key);
        if (!value.is_number_integer() || value.get<int64_t>() <= 0) {
            throw std::invalid_argument(std::string("config key '") + section + "." + key +
                                        "' must be a positive integer");
        }
        return value.get<int64_t>();
    }

    float non_negative(const json& cfg, const char* section, const char* key) {
        const float value = cfg.at(section).at(key).get<float>();
        if (value < 0.0f) {
            throw std::invalid_argument(std::string("config key '") + section + "." + key +
                                        "' must not be negative");
        }
        return value;
    }
}

json default_config_json() {
    return {
        {"link", {
            {"transport", "udp"},
            {"bitrate_bps", 300}
        }},
        {"trigger", {
            {"silence_chunks", 16},
            {"max_utterance_ms", 30000}
        }},
        {"vad", {
            {"energy_threshold", 0.01},
            {"zero_crossing_threshold", 0.3},
            {"hangover_chunks", 2}
        }},
        {"whisper", {
            {"model_path", "models/ggml-base.en.bin"},
            {"language", "en"},
            {"threads", 4},
            {"min_confidence", 0.4}
        }},
        {"tts", {
            {"command", "piper --model models/en_US-lessac-medium.onnx --output-raw --sentence-silence 0.1 <<< {text}"}
        }},
        {"queues", {
            {"capture_chunks", 64},
            {"backlog_chunks", 1024},
            {"playback_chunks", 32},
            {"events", 256}
        }},
        {"control", {
            {"mode", "semantic"},
            {"emotion_override", "auto"}
        }}
    };
}

EngineConfig default_config() {
    return parse_config(json::object());
}

EngineConfig parse_config(const json& user) {
    if (!user.is_object()) {
        throw std::invalid_argument("config root must be an object");
    }
    json cfg = user;
    merge_defaults(cfg, default_config_json(), "");

    EngineConfig config;

    const std::string transport = cfg["link"]["transport"].get<std::string>();
    if (transport == "udp") {
        config.transport = network::TransportKind::Udp;
    } else if (transport == "tcp") {
        config.transport = network::TransportKind::Tcp;
    } else {
        throw std::invalid_argument("config key 'link.transport' must be \"udp\" or \"tcp\"");
    }
    config.bitrate_bps = static_cast<uint32_t>(positive(cfg, "link", "bitrate_bps"));

    config.trigger.silence_chunks = static_cast<int>(positive(cfg, "trigger", "silence_chunks"));
    config.trigger.max_utterance_ms = static_cast<int>(positive(cfg, "trigger", "max_utterance_ms"));

    config.vad.energy_threshold = non_negative(cfg, "vad", "energy_threshold");
    config.vad.zero_crossing_threshold = non_negative(cfg, "vad", "zero_crossing_threshold");
    config.vad.hangover_chunks = static_cast<int>(non_negative(cfg, "vad", "hangover_chunks"));

    config.whisper.model_path = cfg["whisper"]["model_path"].get<std::string>();
    config.whisper.language = cfg["whisper"]["language"].get<std::string>();
    config.whisper.threads = static_cast<int>(positive(cfg, "whisper", "threads"));
    config.whisper.min_confidence = non_negative(cfg, "whisper", "min_confidence");

    config.tts_command = cfg["tts"]["command"].get<std::string>();
    if (config.tts_command.empty()) {
        throw std::invalid_argument("config key 'tts.command' must not be empty");
    }

    config.capture_queue_chunks = static_cast<size_t>(positive(cfg, "queues", "capture_chunks"));
    config.sender_backlog_chunks = static_cast<size_t>(positive(cfg, "queues", "backlog_chunks"));
    config.playback_queue_chunks = static_cast<size_t>(positive(cfg, "queues", "playback_chunks"));
    config.event_queue_capacity = static_cast<size_t>(positive(cfg, "queues", "events"));

    auto mode = protocol::mode_from_name(cfg["control"]["mode"].get<std::string>());
    if (!mode) {
        throw std::invalid_argument("config key 'control.mode' must be semantic, text_only or morse");
    }
    config.initial_mode = *mode;

    auto emotion = control::emotion_from_name(cfg["control"]["emotion_override"].get<std::string>());
    if (!emotion) {
        throw std::invalid_argument("config key 'control.emotion_override' must be auto, relaxed or panicked");
    }
    config.initial_emotion = *emotion;

    return config;
}

EngineConfig load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("cannot open config file: " + path);
    }
    json user;
    try {
        in >> user;
    } catch (const json::parse_error& e) {
        throw std::invalid_argument("config file " + path + " is not valid JSON: " + e.what());
    }
    EngineConfig config = parse_config(user);
    std::cout << "✓ Configuration loaded from " << path << std::endl;
    return config;
}

}
