#ifndef SEGMENT_STORE_HPP
#define SEGMENT_STORE_HPP

#include "pipeline/segment.hpp"

#include <cstdint>
#include <string>
#include <vector>

// Writes each segment as <start>_to_<end>.wav[.gz] under outputDir.
// persist() never throws.
class SegmentStore : public SegmentSink {
public:
    struct Config {
        std::string outputDir = "recordings";
        int sampleRate = 16000;
        int channels = 1;
        bool compress = true;
    };

    explicit SegmentStore(Config config);

    bool persist(const Segment& segment) override;

    // File name (without directory) for a segment.
    std::string fileNameFor(const Segment& segment) const;

    const std::string& lastPath() const { return lastPath_; }

private:
    Config config_;
    std::string lastPath_;

    bool writeFile(const std::string& path, const std::vector<uint8_t>& bytes) const;
};

#endif
