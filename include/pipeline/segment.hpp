#ifndef SEGMENT_HPP
#define SEGMENT_HPP

#include "audio/frame.hpp"

#include <chrono>
#include <string>
#include <vector>

using Clock = std::chrono::system_clock;

// A closed span of audio on its way to storage.
struct Segment {
    std::vector<Frame> frames;
    Clock::time_point startTime;
    Clock::time_point endTime;
};

// Persists closed segments. Reports failure through the return value.
class SegmentSink {
public:
    virtual ~SegmentSink() = default;

    virtual bool persist(const Segment& segment) = 0;
};

// Hands the segment to the sink; a throwing or failing sink is logged
// under `tag` and reported as false.
bool persistSegment(SegmentSink& sink, const Segment& segment, const char* tag);

// Local-time strftime formatting of a time point.
std::string formatTime(Clock::time_point t, const char* format);

// Consumer-side handling of the frame stream. All calls come from the
// single consumer thread.
class FrameProcessor {
public:
    virtual ~FrameProcessor() = default;

    // Clears all state before a (re)start.
    virtual void reset() = 0;

    virtual void onFrame(const Frame& frame, Clock::time_point now) = 0;

    // Called when a poll returned no frame.
    virtual void onIdle(Clock::time_point now) = 0;

    // Closes and persists whatever is in progress.
    virtual void flush(Clock::time_point now) = 0;
};

#endif
