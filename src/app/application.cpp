#include "app/application.hpp"
#include "control/control_message.hpp"
#include "network/tcp_transport.hpp"
#include "network/udp_transport.hpp"
#include <chrono>
#include <iostream>
#include <poll.h>
#include <unistd.h>

namespace app {

namespace {
    control::ControlSnapshot initial_snapshot(const EngineConfig& config) {
        control::ControlSnapshot snapshot;
        snapshot.mode = config.initial_mode;
        snapshot.emotion_override = config.initial_emotion;
        return snapshot;
    }

    bool stdin_ready(std::chrono::milliseconds timeout) {
        pollfd fd{};
        fd.fd = STDIN_FILENO;
        fd.events = POLLIN;
        return poll(&fd, 1, static_cast<int>(timeout.count())) > 0;
    }
}

Application::Application(EngineConfig config)
    : config_(std::move(config)),
      events_(config_.event_queue_capacity),
      control_(initial_snapshot(config_)),
      playback_queue_(config_.playback_queue_chunks) {
    try {
        const auto send_port = static_cast<uint16_t>(config_.send_port);
        const auto listen_port = static_cast<uint16_t>(config_.listen_port);

        // Binding the listen port is fatal at startup, so it comes first.
        if (config_.transport == network::TransportKind::Tcp) {
            frame_receiver_ = std::make_unique<network::TcpFrameReceiver>(listen_port);
            transport_ = std::make_unique<network::TcpTransport>(config_.target_ip, send_port);
        } else {
            frame_receiver_ = std::make_unique<network::UdpFrameReceiver>(listen_port);
            transport_ = std::make_unique<network::UdpTransport>(config_.target_ip, send_port);
        }
        link_ = std::make_unique<network::LinkSimulator>(*transport_, config_.bitrate_bps);

        audio_manager_ = std::make_unique<audio::AudioManager>(config_.capture_queue_chunks);
        vad_           = std::make_unique<processing::EnergyVad>(config_.vad);
        prosody_       = std::make_unique<processing::ProsodyAnalyzer>();
        transcriber_   = std::make_unique<stt::WhisperTranscriber>(config_.whisper);
        synthesizer_   = std::make_unique<synthesis::ProcessSynthesizer>(config_.tts_command);

        engine::SenderConfig sender_config;
        sender_config.trigger = config_.trigger;
        sender_config.capture_queue_capacity = config_.sender_backlog_chunks;

        receiver_ = std::make_unique<engine::ReceiverEngine>(*frame_receiver_, *synthesizer_,
                                                             playback_queue_, events_);
        playback_ = std::make_unique<engine::PlaybackWorker>(*audio_manager_, playback_queue_);
        sender_   = std::make_unique<engine::SenderEngine>(control_, *vad_, *transcriber_, *prosody_,
                                                           *link_, events_, sender_config);

        std::cout << "All components created." << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "ERROR: application startup failed: " << e.what() << std::endl;
        throw;
    }
}

Application::~Application() {
    stop();
    std::cout << "Application shut down." << std::endl;
}

void Application::start() {
    receiver_->start();
    audio_manager_->start();
    playback_->start();
    sender_->start(*audio_manager_);

    printing_ = true;
    event_printer_ = std::thread([this] { print_events(); });
}

void Application::stop() {
    if (sender_) {
        sender_->stop();
    }
    if (playback_) {
        playback_->stop();
    }
    if (audio_manager_) {
        audio_manager_->stop();
    }
    if (receiver_) {
        receiver_->stop();
    }
    printing_ = false;
    events_.close();
    if (event_printer_.joinable()) {
        event_printer_.join();
    }
}

void Application::run(const std::atomic<bool>& shutdown) {
    start();

    const char* transport = config_.transport == network::TransportKind::Tcp ? "tcp" : "udp";
    std::cout << "\n=== Janus node active ===" << std::endl;
    std::cout << "Target: " << config_.target_ip << ":" << config_.send_port << " (" << transport
              << ", " << config_.bitrate_bps << " bps)" << std::endl;
    std::cout << "Listening: port " << frame_receiver_->port() << std::endl;
    std::cout << "Audio: " << audio::SAMPLE_RATE << " Hz, " << audio::NUM_CHANNELS << " channel, "
              << audio::FRAMES_PER_CHUNK << " frames per chunk" << std::endl;
    std::cout << "\nCommands: record on|off, stream on|off, mode semantic|text_only|morse,"
              << " emotion auto|relaxed|panicked, status, quit" << std::endl;
    std::cout << "JSON control messages are accepted too.\n" << std::endl;

    while (!shutdown) {
        if (!stdin_ready(std::chrono::milliseconds(200))) {
            continue;
        }
        std::string line;
        if (!std::getline(std::cin, line)) {
            break;
        }
        if (!handle_console_line(line)) {
            break;
        }
    }

    std::cout << "\nShutting down..." << std::endl;
    stop();
    std::cout << "✓ All components stopped cleanly." << std::endl;
}

bool Application::handle_console_line(const std::string& line) {
    if (line == "quit" || line == "exit") {
        return false;
    }
    if (line == "status") {
        std::cout << control::snapshot_to_json(control_.get()).dump() << std::endl;
        return true;
    }
    try {
        auto update = control::parse_console_command(line);
        if (update && !update->empty()) {
            const auto snapshot = control_.apply(*update);
            std::cout << control::snapshot_to_json(snapshot).dump() << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
    }
    return true;
}

void Application::print_events() {
    while (printing_) {
        try {
            auto event = events_.next(std::chrono::milliseconds(200));
            if (event) {
                std::cout << events::to_json_line(*event) << std::endl;
            }
        } catch (const std::exception& e) {
            std::cerr << "ERROR: event printer: " << e.what() << std::endl;
        }
    }
}

}
