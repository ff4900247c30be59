#include "audio/audio_manager.hpp"
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>

namespace audio {

// Initialises PortAudio once for the process and terminates it at exit.
class PortAudioInitializer {
public:
    PortAudioInitializer() {
        err_ = Pa_Initialize();
        if (err_ != paNoError) {
            std::cerr << "ERROR: PortAudio Pa_Initialize() - " << Pa_GetErrorText(err_) << std::endl;
        }
    }
    ~PortAudioInitializer() {
        if (err_ == paNoError) {
            Pa_Terminate();
        }
    }
    PaError get_error() const { return err_; }
private:
    PaError err_;
};

static PortAudioInitializer pa_initializer;

AudioManager::AudioManager(size_t capture_chunks, size_t max_output_ms)
    : captured_(capture_chunks),
      max_output_samples_(max_output_ms * SAMPLE_RATE / 1000) {
    if (pa_initializer.get_error() != paNoError) {
        throw std::runtime_error("PortAudio could not be initialised");
    }
}

AudioManager::~AudioManager() {
    stop();
}

void AudioManager::start() {
    if (is_active_) {
        return;
    }

    PaStreamParameters input_parameters;
    input_parameters.device = Pa_GetDefaultInputDevice();
    if (input_parameters.device == paNoDevice) {
        throw std::runtime_error("no default input device");
    }
    input_parameters.channelCount = NUM_CHANNELS;
    input_parameters.sampleFormat = FORMAT;
    input_parameters.suggestedLatency = Pa_GetDeviceInfo(input_parameters.device)->defaultLowInputLatency;
    input_parameters.hostApiSpecificStreamInfo = nullptr;

    PaStreamParameters output_parameters;
    output_parameters.device = Pa_GetDefaultOutputDevice();
    if (output_parameters.device == paNoDevice) {
        throw std::runtime_error("no default output device");
    }
    output_parameters.channelCount = NUM_CHANNELS;
    output_parameters.sampleFormat = FORMAT;
    output_parameters.suggestedLatency = Pa_GetDeviceInfo(output_parameters.device)->defaultLowOutputLatency;
    output_parameters.hostApiSpecificStreamInfo = nullptr;

    PaError err = Pa_OpenStream(
        &stream_,
        &input_parameters,
        &output_parameters,
        SAMPLE_RATE,
        FRAMES_PER_CHUNK,
        paClipOff,
        &AudioManager::pa_callback,
        this
    );
    if (err != paNoError) {
        stream_ = nullptr;
        throw std::runtime_error(std::string("Pa_OpenStream() - ") + Pa_GetErrorText(err));
    }

    err = Pa_StartStream(stream_);
    if (err != paNoError) {
        Pa_CloseStream(stream_);
        stream_ = nullptr;
        throw std::runtime_error(std::string("Pa_StartStream() - ") + Pa_GetErrorText(err));
    }

    is_active_ = true;
    std::cout << "✓ Full-duplex audio stream started (" << SAMPLE_RATE << " Hz, "
              << FRAMES_PER_CHUNK << " frames per chunk)" << std::endl;
}

void AudioManager::stop() {
    if (!is_active_ || !stream_) {
        return;
    }
    is_active_ = false;
    Pa_StopStream(stream_);
    Pa_CloseStream(stream_);
    stream_ = nullptr;
    output_drained_.notify_all();
    std::cout << "Audio stream stopped." << std::endl;
}

bool AudioManager::is_active() const {
    return is_active_;
}

Samples AudioManager::read_chunk() {
    auto chunk = captured_.pop(std::chrono::milliseconds(100));
    if (!chunk) {
        return {};
    }
    return to_float(*chunk);
}

void AudioManager::write_chunk(const Pcm& samples) {
    std::unique_lock<std::mutex> lock(output_mutex_);
    output_drained_.wait(lock, [this] {
        return !is_active_ || output_.size() <= max_output_samples_;
    });
    if (!is_active_) {
        return;
    }
    output_.insert(output_.end(), samples.begin(), samples.end());
}

int AudioManager::pa_callback(const void* input, void* output, unsigned long frame_count,
                              const PaStreamCallbackTimeInfo*, PaStreamCallbackFlags, void* user_data) {
    return static_cast<AudioManager*>(user_data)->process(
        static_cast<const int16_t*>(input),
        static_cast<int16_t*>(output),
        frame_count
    );
}

int AudioManager::process(const int16_t* input_buffer, int16_t* output_buffer, unsigned long frame_count) {
    const size_t samples = frame_count * NUM_CHANNELS;

    if (input_buffer) {
        captured_.push(Pcm(input_buffer, input_buffer + samples));
    }

    size_t played = 0;
    {
        std::lock_guard<std::mutex> lock(output_mutex_);
        while (played < samples && !output_.empty()) {
            output_buffer[played++] = output_.front();
            output_.pop_front();
        }
    }
    for (size_t i = played; i < samples; ++i) {
        output_buffer[i] = 0;
    }
    if (played > 0) {
        output_drained_.notify_all();
    }

    return paContinue;
}

}
