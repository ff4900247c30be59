#ifndef JANUS_APP_APPLICATION_HPP
#define JANUS_APP_APPLICATION_HPP

#include "app/config.hpp"
#include "audio/audio_manager.hpp"
#include "control/control_state.hpp"
#include "core/non_copyable.hpp"
#include "engine/playback_worker.hpp"
#include "engine/receiver_engine.hpp"
#include "engine/sender_engine.hpp"
#include "events/event_channel.hpp"
#include "network/link_simulator.hpp"
#include "network/transport.hpp"
#include "processing/energy_vad.hpp"
#include "processing/prosody_analyzer.hpp"
#include "stt/whisper_transcriber.hpp"
#include "synthesis/process_synthesizer.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <thread>

namespace app {
    // One full-duplex node: sends what the operator says, speaks what the
    // peer sends.
    class Application : private core::NonCopyable {
    public:
        explicit Application(EngineConfig config);
        ~Application();

        // Blocks until "quit", end of input, or shutdown becomes true.
        void run(const std::atomic<bool>& shutdown);

    private:
        void start();
        void stop();
        void print_events();
        // False when the operator asked to quit.
        bool handle_console_line(const std::string& line);

        EngineConfig config_;

        events::EventChannel events_;
        control::ControlState control_;

        std::unique_ptr<network::Transport> transport_;
        std::unique_ptr<network::FrameReceiver> frame_receiver_;
        std::unique_ptr<network::LinkSimulator> link_;

        std::unique_ptr<audio::AudioManager> audio_manager_;
        std::unique_ptr<processing::EnergyVad> vad_;
        std::unique_ptr<processing::ProsodyAnalyzer> prosody_;
        std::unique_ptr<stt::WhisperTranscriber> transcriber_;
        std::unique_ptr<synthesis::ProcessSynthesizer> synthesizer_;

        engine::PlaybackQueue playback_queue_;
        std::unique_ptr<engine::ReceiverEngine> receiver_;
        std::unique_ptr<engine::PlaybackWorker> playback_;
        std::unique_ptr<engine::SenderEngine> sender_;

        std::atomic<bool> printing_{false};
        std::thread event_printer_;
    };
}

#endif
