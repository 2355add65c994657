#include "audio/audio_input.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

static void pa_check(PaError e, const char* msg) {
    if (e != paNoError) {
        throw std::runtime_error(std::string(msg) + " (" + std::to_string((int)e) + "): " + Pa_GetErrorText(e));
    }
}

// Constructor
AudioInput::AudioInput(Config config, FrameQueue& queue) : config_(config), queue_(queue) {}

// Destructor
AudioInput::~AudioInput() { stop(); }

// Runs on PortAudio's thread; copies the buffer and never blocks on the consumer
int AudioInput::streamCallback(const void* input, void*, unsigned long frameCount,
                               const PaStreamCallbackTimeInfo*, PaStreamCallbackFlags statusFlags,
                               void* userData) {
    auto* self = static_cast<AudioInput*>(userData);

    if (statusFlags & paInputOverflow) ++self->overflows_;
    if (!input) return paContinue;

    const auto* samples = static_cast<const int16_t*>(input);
    self->queue_.push(Frame(samples, samples + frameCount * self->config_.channels));
    return paContinue;
}

// Opens and starts the capture stream
void AudioInput::start() {
    if (stream_) {
        std::cout << "[Audio Input] Already running." << std::endl;
        return;
    }

    pa_check(Pa_Initialize(), "Pa_Initialize");
    paInitialized_ = true;

    try {
        PaStreamParameters inParams{};
        inParams.device = config_.device >= 0 ? (PaDeviceIndex)config_.device : Pa_GetDefaultInputDevice();
        if (inParams.device == paNoDevice || inParams.device >= Pa_GetDeviceCount()) {
            throw std::runtime_error("No usable input device (index " + std::to_string(config_.device) + ")");
        }

        const PaDeviceInfo* info = Pa_GetDeviceInfo(inParams.device);
        std::cout << "[Audio Input] Input device: " << (info ? info->name : "(unknown)") << std::endl;

        inParams.channelCount = config_.channels;
        inParams.sampleFormat = paInt16;
        inParams.suggestedLatency = info ? info->defaultLowInputLatency : 0.05;
        inParams.hostApiSpecificStreamInfo = nullptr;

        overflows_ = 0;
        pa_check(
            Pa_OpenStream(&stream_, &inParams, nullptr,
                          config_.sampleRate, config_.framesPerBuffer,
                          paNoFlag, &AudioInput::streamCallback, this),
            "Pa_OpenStream"
        );

        pa_check(Pa_StartStream(stream_), "Pa_StartStream");
    } catch (...) {
        if (stream_) {
            Pa_CloseStream(stream_);
            stream_ = nullptr;
        }
        Pa_Terminate();
        paInitialized_ = false;
        throw;
    }

    std::cout << "[Audio Input] Stream started (" << config_.sampleRate << " Hz, "
              << config_.framesPerBuffer << " samples per frame)" << std::endl;
}

// Stops and closes the capture stream
void AudioInput::stop() {
    if (stream_) {
        PaError e = Pa_StopStream(stream_);
        if (e != paNoError) std::cerr << "[Audio Input] [WARN] Pa_StopStream: " << Pa_GetErrorText(e) << std::endl;

        e = Pa_CloseStream(stream_);
        if (e != paNoError) std::cerr << "[Audio Input] [WARN] Pa_CloseStream: " << Pa_GetErrorText(e) << std::endl;
        stream_ = nullptr;

        if (overflows_.load() > 0) {
            std::cerr << "[Audio Input] [WARN] " << overflows_.load() << " input overflows during capture" << std::endl;
        }
        std::cout << "[Audio Input] Stream stopped and closed." << std::endl;
    }

    if (paInitialized_) {
        Pa_Terminate();
        paInitialized_ = false;
    }
}

// Prints every device with input channels
void AudioInput::listDevices() {
    pa_check(Pa_Initialize(), "Pa_Initialize");

    const PaDeviceIndex count = Pa_GetDeviceCount();
    const PaDeviceIndex def = Pa_GetDefaultInputDevice();
    std::cout << "Input devices:" << std::endl;
    for (PaDeviceIndex i = 0; i < count; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info || info->maxInputChannels <= 0) continue;

        std::cout << (i == def ? "* " : "  ") << i << ": " << info->name << " (" << info->maxInputChannels
                  << " ch, " << info->defaultSampleRate << " Hz)" << std::endl;
    }

    Pa_Terminate();
}
