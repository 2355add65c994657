#include "pipeline/segment.hpp"

#include <ctime>
#include <exception>
#include <iostream>

bool persistSegment(SegmentSink& sink, const Segment& segment, const char* tag) {
    if (segment.frames.empty()) {
        std::cout << "[" << tag << "] Nothing recorded; skipping save" << std::endl;
        return false;
    }

    try {
        if (sink.persist(segment)) return true;
        std::cerr << "[" << tag << "] [ERROR] Segment of " << segment.frames.size()
                  << " frames could not be stored" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[" << tag << "] [ERROR] Storage threw: " << e.what() << std::endl;
    }
    return false;
}

std::string formatTime(Clock::time_point t, const char* format) {
    const std::time_t tt = Clock::to_time_t(t);
    std::tm tm{};
    localtime_r(&tt, &tm);

    char buff[64];
    const std::size_t n = std::strftime(buff, sizeof(buff), format, &tm);
    return std::string(buff, n);
}
