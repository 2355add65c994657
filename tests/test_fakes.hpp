#ifndef TEST_FAKES_HPP
#define TEST_FAKES_HPP

#include "pipeline/segment.hpp"
#include "vad/speech_classifier.hpp"

#include <cstddef>
#include <stdexcept>
#include <vector>

inline Frame makeFrame(int16_t value, std::size_t samples = 480) {
    return Frame(samples, value);
}

// Speech frames are non-zero; silence is all zeros. A value of -1 throws.
class ScriptedClassifier : public SpeechClassifier {
public:
    bool isSpeech(const Frame& frame, int) override {
        ++calls;
        if (!frame.empty() && frame[0] == -1) throw std::runtime_error("bad frame");
        return !frame.empty() && frame[0] != 0;
    }

    int calls = 0;
};

class RecordingSink : public SegmentSink {
public:
    bool persist(const Segment& segment) override {
        ++attempts;
        if (throwOnPersist) throw std::runtime_error("disk full");
        if (failPersist) return false;
        segments.push_back(segment);
        return true;
    }

    std::vector<Segment> segments;
    int attempts = 0;
    bool failPersist = false;
    bool throwOnPersist = false;
};

#endif
