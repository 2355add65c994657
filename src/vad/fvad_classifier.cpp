#include "vad/fvad_classifier.hpp"

#include <fvad.h>
#include <stdexcept>
#include <string>

// Constructor
FvadClassifier::FvadClassifier(int sampleRate, int aggressiveness) : sampleRate_(sampleRate) {
    vad_ = fvad_new();
    if (!vad_) throw std::runtime_error("fvad_new failed");

    if (fvad_set_mode(vad_, aggressiveness) < 0) {
        fvad_free(vad_);
        throw std::invalid_argument("Invalid VAD aggressiveness: " + std::to_string(aggressiveness));
    }
    if (fvad_set_sample_rate(vad_, sampleRate) < 0) {
        fvad_free(vad_);
        throw std::invalid_argument("Invalid VAD sample rate: " + std::to_string(sampleRate));
    }
}

// Destructor
FvadClassifier::~FvadClassifier() {
    if (vad_) fvad_free(vad_);
}

bool FvadClassifier::isSpeech(const Frame& frame, int sampleRate) {
    if (sampleRate != sampleRate_) {
        throw std::invalid_argument("Frame sample rate " + std::to_string(sampleRate) +
                                    " does not match VAD rate " + std::to_string(sampleRate_));
    }

    const int rc = fvad_process(vad_, frame.data(), frame.size());
    if (rc < 0) {
        throw std::runtime_error("fvad_process rejected a frame of " + std::to_string(frame.size()) + " samples");
    }
    return rc == 1;
}
