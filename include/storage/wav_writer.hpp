#ifndef WAV_WRITER_HPP
#define WAV_WRITER_HPP

#include "audio/frame.hpp"

#include <cstdint>
#include <vector>

// Serializes PCM16 frames as a complete RIFF/WAVE file image.
std::vector<uint8_t> encodeWav(const std::vector<Frame>& frames, int sampleRate, int channels = 1);

#endif
