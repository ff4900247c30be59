#ifndef JANUS_APP_CONFIG_HPP
#define JANUS_APP_CONFIG_HPP

#include "engine/capture_trigger.hpp"
#include "network/transport.hpp"
#include "processing/energy_vad.hpp"
#include "protocol/janus_packet.hpp"
#include "stt/whisper_transcriber.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace app {
    struct EngineConfig {
        // Filled from the command line, not the file.
        std::string target_ip = "127.0.0.1";
        int send_port = 9001;
        int listen_port = 9002;

        network::TransportKind transport = network::TransportKind::Udp;
        uint32_t bitrate_bps = 300;

        engine::TriggerConfig trigger;
        processing::EnergyVadConfig vad;
        stt::WhisperConfig whisper;
        std::string tts_command;

        size_t capture_queue_chunks = 64;
        size_t sender_backlog_chunks = 1024;
        size_t playback_queue_chunks = 32;
        size_t event_queue_capacity = 256;

        protocol::Mode initial_mode = protocol::Mode::Semantic;
        protocol::EmotionOverride initial_emotion = protocol::EmotionOverride::Auto;
    };

    // Canonical defaults; every key a config file may set appears here.
    nlohmann::json default_config_json();

    EngineConfig default_config();

    // Missing keys fall back to defaults. Wrong-typed keys and out-of-range
    // values throw std::invalid_argument naming the key.
    EngineConfig parse_config(const nlohmann::json& user);

    // Throws std::runtime_error when the file cannot be read.
    EngineConfig load_config(const std::string& path);
}

#endif
