#ifndef PRE_ROLL_BUFFER_HPP
#define PRE_ROLL_BUFFER_HPP

#include "audio/frame.hpp"

#include <cstddef>
#include <deque>
#include <vector>

// Fixed-capacity ring of the most recent frames seen while idle.
class PreRollBuffer {
public:
    explicit PreRollBuffer(std::size_t capacity) : capacity_(capacity) {}

    void push(const Frame& frame);

    // Copy of the buffered frames, oldest first.
    std::vector<Frame> frames() const { return std::vector<Frame>(frames_.begin(), frames_.end()); }

    std::size_t size() const { return frames_.size(); }
    std::size_t capacity() const { return capacity_; }
    bool empty() const { return frames_.empty(); }

    void clear() { frames_.clear(); }

private:
    std::size_t capacity_;
    std::deque<Frame> frames_;
};

#endif
