#ifndef SPEECH_CLASSIFIER_HPP
#define SPEECH_CLASSIFIER_HPP

#include "audio/frame.hpp"

// Binary speech/non-speech decision for one frame. May throw when the frame
// cannot be classified.
class SpeechClassifier {
public:
    virtual ~SpeechClassifier() = default;

    virtual bool isSpeech(const Frame& frame, int sampleRate) = 0;
};

#endif
