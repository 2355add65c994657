#ifndef SPECTRAL_GATE_HPP
#define SPECTRAL_GATE_HPP

#include "denoise/denoiser.hpp"

#include <complex>
#include <cstddef>
#include <vector>

// Stationary spectral gating: bins of a frame whose level stays below the
// noise profile's mean + nStdThreshold * std (in dB) are attenuated.
class SpectralGate : public Denoiser {
public:
    struct Config {
        float nStdThreshold = 1.5f;
        float propDecrease = 1.0f;   // 1.0 removes gated bins entirely
    };

    SpectralGate();
    explicit SpectralGate(Config config);

    std::vector<float> denoise(const std::vector<float>& frame,
                               int sampleRate,
                               const std::vector<float>& noiseProfile) override;

private:
    Config config_;

    std::size_t fftSize_ = 0;
    std::vector<float> cachedProfile_;
    std::vector<float> thresholdDb_;

    void learnThresholds(const std::vector<float>& noiseProfile, std::size_t fftSize);
};

#endif
