#include "pipeline/pre_roll_buffer.hpp"

// Appends a frame, evicting the oldest once at capacity
void PreRollBuffer::push(const Frame& frame) {
    if (capacity_ == 0) return;

    if (frames_.size() == capacity_) frames_.pop_front();
    frames_.push_back(frame);
}
