#include "pipeline/duration_chunker.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <utility>

// Constructor
DurationChunker::DurationChunker(Config config, SegmentSink& sink) : config_(config), sink_(sink) {
    config_.targetFrames = std::max<std::size_t>(1, config_.targetFrames);
    chunk_.frames.reserve(config_.targetFrames);
}

void DurationChunker::reset() {
    chunk_ = Segment{};
    chunk_.frames.reserve(config_.targetFrames);
}

void DurationChunker::onFrame(const Frame& frame, Clock::time_point now) {
    if (chunk_.frames.empty()) {
        chunk_.startTime = now;
        std::cout << "[Chunker] Starting new chunk at " << formatTime(now, "%Y-%m-%d %H:%M:%S") << std::endl;
    }

    chunk_.frames.push_back(frame);

    if (chunk_.frames.size() >= config_.targetFrames) {
        std::cout << "[Chunker] Chunk complete at " << formatTime(now, "%Y-%m-%d %H:%M:%S") << std::endl;
        close(now);
    }
}

void DurationChunker::flush(Clock::time_point now) {
    if (chunk_.frames.empty()) return;

    std::cout << "[Chunker] Saving final partial chunk (" << chunk_.frames.size() << " frames)" << std::endl;
    close(now);
}

void DurationChunker::close(Clock::time_point endTime) {
    Segment done = std::move(chunk_);
    reset();

    if (endTime <= done.startTime) {
        endTime = done.startTime + std::chrono::milliseconds((long long)done.frames.size() * config_.frameMs);
    }
    done.endTime = endTime;
    if (persistSegment(sink_, done, "Chunker")) ++chunksClosed_;
}
