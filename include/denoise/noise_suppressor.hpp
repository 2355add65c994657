#ifndef NOISE_SUPPRESSOR_HPP
#define NOISE_SUPPRESSOR_HPP

#include "audio/frame.hpp"
#include "denoise/denoiser.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <vector>

class FrameQueue;

// Holds the noise profile learned once before processing starts and applies
// the denoiser to each frame. Without a profile suppress() is a pass-through.
class NoiseSuppressor {
public:
    NoiseSuppressor(int sampleRate, std::unique_ptr<Denoiser> denoiser);

    NoiseSuppressor(const NoiseSuppressor&) = delete;
    NoiseSuppressor& operator=(const NoiseSuppressor&) = delete;

    // Must be called before the consumer starts.
    bool learnProfile(const std::vector<Frame>& frames);

    Frame suppress(const Frame& frame);

    bool hasProfile() const { return !profile_.empty(); }
    const std::vector<float>& profile() const { return profile_; }

    void clearProfile() { profile_.clear(); }

private:
    int sampleRate_;
    std::unique_ptr<Denoiser> denoiser_;
    std::vector<float> profile_;
};

// Pulls up to `count` frames from the queue, giving up once a single wait
// exceeds `timeout`.
std::vector<Frame> collectFrames(FrameQueue& queue, std::size_t count, std::chrono::milliseconds timeout);

#endif
