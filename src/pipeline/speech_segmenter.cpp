#include "pipeline/speech_segmenter.hpp"

#include <exception>
#include <iostream>
#include <utility>

// Constructor
SpeechSegmenter::SpeechSegmenter(Config config, SpeechClassifier& classifier, SegmentSink& sink)
    : config_(config), classifier_(classifier), sink_(sink), preRoll_(config.preRollFrames) {}

// Resets recording variables, including the pre-roll ring
void SpeechSegmenter::reset() {
    state_ = State::Idle;
    silentChunks_ = 0;
    preRoll_.clear();
    segment_ = Segment{};
    lastFrameAt_ = Clock::time_point{};
}

std::chrono::milliseconds SpeechSegmenter::frames(long long count) const {
    return std::chrono::milliseconds(count * config_.frameMs);
}

void SpeechSegmenter::onFrame(const Frame& frame, Clock::time_point now) {
    bool speech = false;
    try {
        speech = classifier_.isSpeech(frame, config_.sampleRate);
    } catch (const std::exception& e) {
        std::cerr << "[Segmenter] [ERROR] Classification failed, skipping frame: " << e.what() << std::endl;
        return;
    }

    lastFrameAt_ = now;

    if (state_ == State::Idle) {
        if (speech) {
            trigger(frame, now);
        } else {
            preRoll_.push(frame);
        }
        return;
    }

    segment_.frames.push_back(frame);

    if (speech) {
        silentChunks_ = 0;
        return;
    }

    ++silentChunks_;
    if (silentChunks_ > config_.maxSilentChunks) {
        // back-date past the hysteresis tail
        const auto endTime = now - frames(silentChunks_);
        std::cout << "[Segmenter] Speech ended around " << formatTime(endTime, "%Y-%m-%d %H:%M:%S")
                  << ", saving " << segment_.frames.size() << " frames" << std::endl;
        close(endTime);
    }
}

// Seeds the segment from the pre-roll, then the triggering frame
void SpeechSegmenter::trigger(const Frame& frame, Clock::time_point now) {
    state_ = State::Triggered;
    silentChunks_ = 0;

    segment_.frames = preRoll_.frames();
    segment_.startTime = now - frames((long long)segment_.frames.size());
    segment_.frames.push_back(frame);
    // the ring stays empty while triggered and refills from live audio after close
    preRoll_.clear();

    std::cout << "[Segmenter] Speech started around " << formatTime(segment_.startTime, "%Y-%m-%d %H:%M:%S")
              << std::endl;
}

// Capture appears to have stopped mid-segment
void SpeechSegmenter::onIdle(Clock::time_point now) {
    if (state_ != State::Triggered) return;
    if (now - lastFrameAt_ <= config_.stallTimeout) return;

    std::cerr << "[Segmenter] [WARN] No audio for "
              << std::chrono::duration_cast<std::chrono::milliseconds>(now - lastFrameAt_).count()
              << " ms during speech; saving segment" << std::endl;
    close(lastFrameAt_);
}

void SpeechSegmenter::flush(Clock::time_point now) {
    if (state_ != State::Triggered) return;

    std::cout << "[Segmenter] Saving final segment (" << segment_.frames.size() << " frames)" << std::endl;
    close(now);
}

void SpeechSegmenter::close(Clock::time_point endTime) {
    Segment done = std::move(segment_);
    segment_ = Segment{};
    state_ = State::Idle;
    silentChunks_ = 0;

    if (endTime <= done.startTime) endTime = done.startTime + frames(1);
    done.endTime = endTime;

    if (persistSegment(sink_, done, "Segmenter")) ++segmentsClosed_;
}
