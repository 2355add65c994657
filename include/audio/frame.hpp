#ifndef FRAME_HPP
#define FRAME_HPP

#include <vector>
#include <cstdint>

// One fixed-duration slice of mono PCM16 audio.
using Frame = std::vector<int16_t>;

#endif
