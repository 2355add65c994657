#ifndef SPEECH_SEGMENTER_HPP
#define SPEECH_SEGMENTER_HPP

#include "pipeline/pre_roll_buffer.hpp"
#include "pipeline/segment.hpp"
#include "vad/speech_classifier.hpp"

#include <chrono>
#include <cstddef>
#include <vector>

// Splits the frame stream at speech boundaries.
//
// Idle: frames go to the pre-roll ring. The first speech frame opens a
// segment seeded with the pre-roll contents followed by that frame.
// Triggered: frames go to the segment; consecutive silent frames are
// counted and the segment closes once the count exceeds maxSilentChunks.
class SpeechSegmenter : public FrameProcessor {
public:
    enum class State { Idle, Triggered };

    struct Config {
        int sampleRate = 16000;
        int frameMs = 30;

        int maxSilentChunks = 66;
        std::size_t preRollFrames = 10;

        // Force-close when no frame arrives for this long while triggered.
        std::chrono::milliseconds stallTimeout{4000};
    };

    SpeechSegmenter(Config config, SpeechClassifier& classifier, SegmentSink& sink);

    void reset() override;
    void onFrame(const Frame& frame, Clock::time_point now) override;
    void onIdle(Clock::time_point now) override;
    void flush(Clock::time_point now) override;

    State state() const { return state_; }
    bool isTriggered() const { return state_ == State::Triggered; }
    int silentChunks() const { return silentChunks_; }

    const PreRollBuffer& preRoll() const { return preRoll_; }
    const std::vector<Frame>& currentFrames() const { return segment_.frames; }
    Clock::time_point startTime() const { return segment_.startTime; }

    std::size_t segmentsClosed() const { return segmentsClosed_; }

private:
    Config config_;
    SpeechClassifier& classifier_;
    SegmentSink& sink_;

    State state_ = State::Idle;
    int silentChunks_ = 0;
    PreRollBuffer preRoll_;
    Segment segment_;

    Clock::time_point lastFrameAt_{};
    std::size_t segmentsClosed_ = 0;

    std::chrono::milliseconds frames(long long count) const;
    void trigger(const Frame& frame, Clock::time_point now);
    void close(Clock::time_point endTime);
};

#endif
