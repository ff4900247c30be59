#include "engine/playback_worker.hpp"
#include <iostream>

namespace engine {

PlaybackWorker::PlaybackWorker(audio::AudioSink& sink, PlaybackQueue& queue)
    : sink_(sink), queue_(queue) {}

PlaybackWorker::~PlaybackWorker() {
    stop();
}

void PlaybackWorker::start() {
    if (running_) {
        return;
    }
    running_ = true;
    thread_ = std::thread([this] { run(); });
    std::cout << "✓ Playback worker started" << std::endl;
}

void PlaybackWorker::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool PlaybackWorker::play_next(std::chrono::milliseconds timeout) {
    auto chunk = queue_.pop(timeout);
    if (!chunk || chunk->empty()) {
        return false;
    }
    try {
        sink_.write_chunk(*chunk);
        ++chunks_played_;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "ERROR: playback: " << e.what() << std::endl;
        return false;
    }
}

void PlaybackWorker::run() {
    while (running_) {
        play_next(std::chrono::milliseconds(100));
    }
}

}
