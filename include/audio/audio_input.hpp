#ifndef AUDIO_INPUT_HPP
#define AUDIO_INPUT_HPP

#include "audio/frame_queue.hpp"

#include <atomic>
#include <cstddef>
#include <portaudio.h>

// PortAudio capture stream that pushes one Frame per callback onto the queue.
class AudioInput {
public:
    struct Config {
        int sampleRate = 16000;
        int channels = 1;
        int framesPerBuffer = 480;
        int device = -1;  // -1 = default input
    };

    AudioInput(Config config, FrameQueue& queue);
    ~AudioInput();

    AudioInput(const AudioInput&) = delete;
    AudioInput& operator=(const AudioInput&) = delete;

    void start();
    void stop();

    bool isRunning() const { return stream_ != nullptr; }
    std::size_t overflowCount() const { return overflows_.load(); }

    static void listDevices();

private:
    static int streamCallback(const void* input, void* output, unsigned long frameCount,
                              const PaStreamCallbackTimeInfo* timeInfo, PaStreamCallbackFlags statusFlags,
                              void* userData);

    Config config_;
    FrameQueue& queue_;

    PaStream* stream_ = nullptr;
    bool paInitialized_ = false;
    std::atomic<std::size_t> overflows_{0};
};

#endif
