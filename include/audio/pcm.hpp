#ifndef PCM_HPP
#define PCM_HPP

#include "audio/frame.hpp"

#include <vector>

// PCM16 -> [-1, 1) floats
std::vector<float> toFloat(const Frame& frame);

// [-1, 1] floats -> PCM16, clamped
Frame toPcm16(const std::vector<float>& samples);

#endif
