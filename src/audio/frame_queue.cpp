#include "audio/frame_queue.hpp"

#include <utility>

// Appends a frame; wakes the consumer if it is waiting
void FrameQueue::push(Frame frame) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        frames_.push_back(std::move(frame));
        if (frames_.size() > highWater_) highWater_ = frames_.size();
    }
    cv_.notify_one();
}

// Takes the oldest frame, or returns false if none arrived within timeout
bool FrameQueue::pop(Frame& frame, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !frames_.empty(); })) {
        return false;
    }

    frame = std::move(frames_.front());
    frames_.pop_front();
    return true;
}

std::size_t FrameQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_.size();
}

std::size_t FrameQueue::highWaterMark() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return highWater_;
}

// Drops everything still queued
void FrameQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    frames_.clear();
}
