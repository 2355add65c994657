#ifndef FRAME_QUEUE_HPP
#define FRAME_QUEUE_HPP

#include "audio/frame.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

// Unbounded FIFO between the capture callback and the single consumer.
// push() never blocks on the consumer; pop() waits at most `timeout`.
class FrameQueue {
public:
    FrameQueue() = default;

    FrameQueue(const FrameQueue&) = delete;
    FrameQueue& operator=(const FrameQueue&) = delete;

    void push(Frame frame);
    bool pop(Frame& frame, std::chrono::milliseconds timeout);

    std::size_t size() const;
    std::size_t highWaterMark() const;

    void clear();

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Frame> frames_;
    std::size_t highWater_ = 0;
};

#endif
