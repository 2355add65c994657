#ifndef DENOISER_HPP
#define DENOISER_HPP

#include <vector>

// Noise-reduction transform applied to one frame at a time.
// Implementations return a vector of the same length as `frame` and may
// throw on failure.
class Denoiser {
public:
    virtual ~Denoiser() = default;

    virtual std::vector<float> denoise(const std::vector<float>& frame,
                                       int sampleRate,
                                       const std::vector<float>& noiseProfile) = 0;
};

#endif
