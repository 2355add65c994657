#ifndef DURATION_CHUNKER_HPP
#define DURATION_CHUNKER_HPP

#include "pipeline/segment.hpp"

#include <cstddef>

// Fixed-size batching: every targetFrames frames become one segment,
// regardless of content. flush() stores a shorter final chunk.
class DurationChunker : public FrameProcessor {
public:
    struct Config {
        std::size_t targetFrames = 10000;
        int frameMs = 30;
    };

    DurationChunker(Config config, SegmentSink& sink);

    void reset() override;
    void onFrame(const Frame& frame, Clock::time_point now) override;
    void onIdle(Clock::time_point) override {}
    void flush(Clock::time_point now) override;

    std::size_t targetFrames() const { return config_.targetFrames; }
    std::size_t bufferedFrames() const { return chunk_.frames.size(); }
    std::size_t chunksClosed() const { return chunksClosed_; }

private:
    Config config_;
    SegmentSink& sink_;

    Segment chunk_;
    std::size_t chunksClosed_ = 0;

    void close(Clock::time_point endTime);
};

#endif
