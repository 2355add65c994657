#include "denoise/noise_suppressor.hpp"
#include "audio/frame_queue.hpp"
#include "audio/pcm.hpp"

#include <exception>
#include <iostream>
#include <utility>

// Constructor
NoiseSuppressor::NoiseSuppressor(int sampleRate, std::unique_ptr<Denoiser> denoiser)
    : sampleRate_(sampleRate), denoiser_(std::move(denoiser)) {}

// Concatenates the silence capture into the normalized profile
bool NoiseSuppressor::learnProfile(const std::vector<Frame>& frames) {
    std::vector<float> profile;
    for (const auto& frame : frames) {
        const auto f = toFloat(frame);
        profile.insert(profile.end(), f.begin(), f.end());
    }

    if (profile.empty()) {
        std::cerr << "[Noise] [WARN] No audio captured for the noise profile; suppression disabled" << std::endl;
        return false;
    }

    profile_ = std::move(profile);
    std::cout << "[Noise] Learned noise profile from " << frames.size() << " frames ("
              << profile_.size() * 1000 / sampleRate_ << " ms)" << std::endl;
    return true;
}

// Best-effort: any failure hands back the untouched frame
Frame NoiseSuppressor::suppress(const Frame& frame) {
    if (profile_.empty() || !denoiser_ || frame.empty()) return frame;

    try {
        const auto cleaned = denoiser_->denoise(toFloat(frame), sampleRate_, profile_);
        if (cleaned.size() != frame.size()) {
            std::cerr << "[Noise] [WARN] Denoiser returned " << cleaned.size() << " samples for a "
                      << frame.size() << " sample frame; passing through" << std::endl;
            return frame;
        }
        return toPcm16(cleaned);
    } catch (const std::exception& e) {
        std::cerr << "[Noise] [ERROR] Suppression failed: " << e.what() << std::endl;
        return frame;
    }
}

std::vector<Frame> collectFrames(FrameQueue& queue, std::size_t count, std::chrono::milliseconds timeout) {
    std::vector<Frame> frames;
    frames.reserve(count);

    Frame frame;
    while (frames.size() < count) {
        if (!queue.pop(frame, timeout)) break;
        frames.push_back(std::move(frame));
    }
    return frames;
}
