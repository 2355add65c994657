#include "storage/wav_writer.hpp"

#include <cstddef>

namespace {

void putU16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back((uint8_t)(v & 0xff));
    out.push_back((uint8_t)((v >> 8) & 0xff));
}

void putU32(std::vector<uint8_t>& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back((uint8_t)((v >> (8 * i)) & 0xff));
}

void putTag(std::vector<uint8_t>& out, const char* tag) {
    out.insert(out.end(), tag, tag + 4);
}

} // namespace

std::vector<uint8_t> encodeWav(const std::vector<Frame>& frames, int sampleRate, int channels) {
    std::size_t samples = 0;
    for (const auto& f : frames) samples += f.size();

    const uint16_t bitsPerSample = 16;
    const uint16_t blockAlign = (uint16_t)(channels * bitsPerSample / 8);
    const uint32_t dataBytes = (uint32_t)(samples * sizeof(int16_t));

    std::vector<uint8_t> out;
    out.reserve(44 + dataBytes);

    putTag(out, "RIFF");
    putU32(out, 36 + dataBytes);
    putTag(out, "WAVE");

    putTag(out, "fmt ");
    putU32(out, 16);
    putU16(out, 1);  // PCM
    putU16(out, (uint16_t)channels);
    putU32(out, (uint32_t)sampleRate);
    putU32(out, (uint32_t)sampleRate * blockAlign);
    putU16(out, blockAlign);
    putU16(out, bitsPerSample);

    putTag(out, "data");
    putU32(out, dataBytes);

    for (const auto& f : frames) {
        for (int16_t s : f) putU16(out, (uint16_t)s);
    }
    return out;
}
