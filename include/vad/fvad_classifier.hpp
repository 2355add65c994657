#ifndef FVAD_CLASSIFIER_HPP
#define FVAD_CLASSIFIER_HPP

#include "vad/speech_classifier.hpp"

struct Fvad;

// WebRTC VAD through libfvad. Only 8/16/32/48 kHz and 10/20/30 ms frames.
class FvadClassifier : public SpeechClassifier {
public:
    FvadClassifier(int sampleRate, int aggressiveness);
    ~FvadClassifier() override;

    FvadClassifier(const FvadClassifier&) = delete;
    FvadClassifier& operator=(const FvadClassifier&) = delete;

    bool isSpeech(const Frame& frame, int sampleRate) override;

private:
    Fvad* vad_ = nullptr;
    int sampleRate_;
};

#endif
