#include "pipeline/processing_service.hpp"
#include "audio/frame_queue.hpp"
#include "denoise/noise_suppressor.hpp"

#include <exception>
#include <iostream>
#include <utility>

// Constructor
ProcessingService::ProcessingService(Config config, FrameQueue& queue, NoiseSuppressor& suppressor,
                                     FrameProcessor& processor)
    : config_(std::move(config)), queue_(queue), suppressor_(suppressor), processor_(processor) {}

// Destructor
ProcessingService::~ProcessingService() {
    stop();
    // a worker that missed the shutdown timeout still references this object
    if (thread_.joinable()) thread_.join();
}

// Starts the processing thread
bool ProcessingService::start() {
    if (running_.load()) {
        std::cout << "[" << config_.name << "] Already running." << std::endl;
        return false;
    }
    if (exitedFuture_.valid() &&
        exitedFuture_.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready) {
        std::cerr << "[" << config_.name << "] [WARN] Previous processing thread is still exiting." << std::endl;
        return false;
    }
    if (thread_.joinable()) thread_.join();

    std::cout << "[" << config_.name << "] Starting..." << std::endl;
    processor_.reset();
    framesProcessed_ = 0;
    framesDropped_ = 0;
    timedOut_ = false;
    nextBacklogWarn_ = config_.queueWarnFrames;

    exited_ = std::promise<void>();
    exitedFuture_ = exited_.get_future();

    running_ = true;
    thread_ = std::thread(&ProcessingService::run, this);
    return true;
}

// Stops the processing thread, waiting at most shutdownTimeout for it
void ProcessingService::stop() {
    if (!running_.exchange(false)) return;

    std::cout << "[" << config_.name << "] Stopping..." << std::endl;
    if (exitedFuture_.wait_for(config_.shutdownTimeout) == std::future_status::ready) {
        if (thread_.joinable()) thread_.join();
        std::cout << "[" << config_.name << "] Stopped (" << framesProcessed_.load() << " frames processed)"
                  << std::endl;
        return;
    }

    std::cerr << "[" << config_.name << "] [WARN] Processing thread did not stop within "
              << config_.shutdownTimeout.count() << " ms; continuing shutdown" << std::endl;
    timedOut_ = true;
}

// Warns each time the backlog doubles past the threshold
void ProcessingService::checkBacklog() {
    if (config_.queueWarnFrames == 0) return;

    const std::size_t backlog = queue_.size();
    if (backlog >= nextBacklogWarn_) {
        std::cerr << "[" << config_.name << "] [WARN] Falling behind capture: " << backlog
                  << " frames queued" << std::endl;
        nextBacklogWarn_ = backlog * 2;
    } else if (backlog < config_.queueWarnFrames) {
        nextBacklogWarn_ = config_.queueWarnFrames;
    }
}

// Thread function: one frame per poll, in arrival order
void ProcessingService::run() {
    std::cout << "[" << config_.name << "] Processing thread started." << std::endl;

    Frame frame;
    while (running_.load()) {
        if (!queue_.pop(frame, config_.pollTimeout)) {
            try {
                processor_.onIdle(Clock::now());
            } catch (const std::exception& e) {
                std::cerr << "[" << config_.name << "] [ERROR] " << e.what() << std::endl;
            }
            continue;
        }

        checkBacklog();

        if (frame.size() != config_.frameSamples) {
            ++framesDropped_;
            std::cerr << "[" << config_.name << "] [WARN] Dropping frame of " << frame.size()
                      << " samples (expected " << config_.frameSamples << ")" << std::endl;
            continue;
        }

        try {
            processor_.onFrame(suppressor_.suppress(frame), Clock::now());
            ++framesProcessed_;
        } catch (const std::exception& e) {
            std::cerr << "[" << config_.name << "] [ERROR] Frame processing failed: " << e.what() << std::endl;
        }
    }

    try {
        processor_.flush(Clock::now());
    } catch (const std::exception& e) {
        std::cerr << "[" << config_.name << "] [ERROR] Final flush failed: " << e.what() << std::endl;
    }

    std::cout << "[" << config_.name << "] Processing thread stopped." << std::endl;
    exited_.set_value();
}
