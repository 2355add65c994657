#include "audio/audio_input.hpp"
#include "audio/frame_queue.hpp"
#include "config/settings.hpp"
#include "denoise/noise_suppressor.hpp"
#include "denoise/spectral_gate.hpp"
#include "pipeline/duration_chunker.hpp"
#include "pipeline/processing_service.hpp"
#include "pipeline/speech_segmenter.hpp"
#include "storage/segment_store.hpp"
#include "vad/fvad_classifier.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {
std::atomic<bool> g_running{true};

void handle_signal(int) {
    g_running = false;
}
} // namespace

int main(int argc, char** argv) {
    if (argc > 1 && std::string(argv[1]) == "--list-devices") {
        try {
            AudioInput::listDevices();
        } catch (const std::exception& e) {
            std::cerr << "[Audio Input] [ERROR] " << e.what() << std::endl;
            return 1;
        }
        return 0;
    }

    Settings settings;
    try {
        settings = loadSettings();
        validateSettings(settings);
    } catch (const std::exception& e) {
        std::cerr << "[Config] [ERROR] " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Configuration: Sample Rate=" << settings.sampleRate << ", Chunk=" << settings.frameDurationMs
              << "ms, Mode=" << modeName(settings.mode) << ", Output='" << settings.outputDir << "'" << std::endl;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    FrameQueue queue;
    NoiseSuppressor suppressor(settings.sampleRate, std::make_unique<SpectralGate>());

    SegmentStore::Config storeConfig;
    storeConfig.outputDir = settings.outputDir;
    storeConfig.sampleRate = settings.sampleRate;
    storeConfig.channels = settings.channels;
    storeConfig.compress = settings.compress;
    SegmentStore store(storeConfig);

    std::unique_ptr<SpeechClassifier> classifier;
    std::unique_ptr<FrameProcessor> processor;
    try {
        if (settings.mode == Settings::Mode::Speech) {
            classifier = std::make_unique<FvadClassifier>(settings.sampleRate, settings.vadAggressiveness);

            SpeechSegmenter::Config config;
            config.sampleRate = settings.sampleRate;
            config.frameMs = settings.frameDurationMs;
            config.maxSilentChunks = settings.maxSilentChunks();
            config.preRollFrames = settings.preRollFrames();
            config.stallTimeout = settings.stallTimeout();
            processor = std::make_unique<SpeechSegmenter>(config, *classifier, store);
        } else {
            DurationChunker::Config config;
            config.targetFrames = settings.targetFramesPerFile();
            config.frameMs = settings.frameDurationMs;
            processor = std::make_unique<DurationChunker>(config, store);
        }
    } catch (const std::exception& e) {
        std::cerr << "[Config] [ERROR] " << e.what() << std::endl;
        return 1;
    }

    AudioInput::Config inputConfig;
    inputConfig.sampleRate = settings.sampleRate;
    inputConfig.channels = settings.channels;
    inputConfig.framesPerBuffer = (int)settings.frameSamples();
    inputConfig.device = settings.inputDevice;
    AudioInput input(inputConfig, queue);

    try {
        input.start();
    } catch (const std::exception& e) {
        std::cerr << "[Audio Input] [ERROR] Failed to start audio capture: " << e.what() << std::endl;
        return 1;
    }

    if (settings.noiseReduction) {
        std::cout << "[Noise] Capturing " << settings.noiseProfileMs << " ms of background noise; stay quiet..."
                  << std::endl;
        const auto frames = collectFrames(queue, settings.noiseProfileFrames(), std::chrono::milliseconds(1000));
        suppressor.learnProfile(frames);
    }

    ProcessingService::Config serviceConfig;
    serviceConfig.name = settings.mode == Settings::Mode::Speech ? "Segmenter Service" : "Chunker Service";
    serviceConfig.frameSamples = settings.frameSamples();
    serviceConfig.shutdownTimeout = std::chrono::milliseconds(settings.shutdownTimeoutMs);
    serviceConfig.queueWarnFrames = (std::size_t)settings.queueWarnFrames;
    ProcessingService service(serviceConfig, queue, suppressor, *processor);
    if (!service.start()) {
        input.stop();
        return 1;
    }

    std::cout << "\nListening... Press Ctrl+C to stop." << std::endl;
    while (g_running.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "\nShutting down..." << std::endl;
    service.stop();
    input.stop();
    std::cout << "Queue peak: " << queue.highWaterMark() << " frames, " << input.overflowCount()
              << " input overflows, " << queue.size() << " frames discarded" << std::endl;
    queue.clear();

    if (service.timedOut()) {
        // the worker still uses the pipeline objects; leave without destroying them
        std::cerr << "[Main] [WARN] Exiting with the processing thread still running" << std::endl;
        std::cout.flush();
        std::_Exit(0);
    }

    std::cout << "Shutdown complete." << std::endl;
    return 0;
}
