#ifndef PROCESSING_SERVICE_HPP
#define PROCESSING_SERVICE_HPP

#include "pipeline/segment.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <future>
#include <string>
#include <thread>

class FrameQueue;
class NoiseSuppressor;

// Runs one FrameProcessor on its own thread: pops frames from the queue,
// applies noise suppression and hands them on in arrival order.
class ProcessingService {
public:
    struct Config {
        std::string name = "Processing";
        std::size_t frameSamples = 480;

        std::chrono::milliseconds pollTimeout{100};
        std::chrono::milliseconds shutdownTimeout{2000};

        // Log when the backlog reaches this many frames (0 = never).
        std::size_t queueWarnFrames = 100;
    };

    ProcessingService(Config config, FrameQueue& queue, NoiseSuppressor& suppressor, FrameProcessor& processor);
    ~ProcessingService();

    ProcessingService(const ProcessingService&) = delete;
    ProcessingService& operator=(const ProcessingService&) = delete;

    bool start();

    // Returns once the worker has exited or shutdownTimeout has passed.
    // After a timeout the worker is still live and timedOut() is true; the
    // destructor then blocks until it finishes.
    void stop();

    bool isRunning() const { return running_.load(); }
    bool timedOut() const { return timedOut_.load(); }

    std::size_t framesProcessed() const { return framesProcessed_.load(); }
    std::size_t framesDropped() const { return framesDropped_.load(); }

private:
    void run();
    void checkBacklog();

    Config config_;
    FrameQueue& queue_;
    NoiseSuppressor& suppressor_;
    FrameProcessor& processor_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> timedOut_{false};
    std::promise<void> exited_;
    std::future<void> exitedFuture_;

    std::atomic<std::size_t> framesProcessed_{0};
    std::atomic<std::size_t> framesDropped_{0};
    std::size_t nextBacklogWarn_ = 0;
};

#endif
