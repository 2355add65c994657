#include "audio/pcm.hpp"

#include <algorithm>
#include <cmath>

std::vector<float> toFloat(const Frame& frame) {
    std::vector<float> out(frame.size());
    for (size_t i = 0; i < frame.size(); ++i) out[i] = (float)frame[i] / 32768.0f;
    return out;
}

Frame toPcm16(const std::vector<float>& samples) {
    Frame out(samples.size());
    for (size_t i = 0; i < samples.size(); ++i) {
        const float v = std::clamp(samples[i], -1.0f, 1.0f);
        out[i] = (int16_t)std::clamp(std::lround(v * 32768.0f), -32768L, 32767L);
    }
    return out;
}
