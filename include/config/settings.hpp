#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include <chrono>
#include <cstddef>
#include <string>

// Process configuration, read once at start-up from the environment and an
// optional .env file (environment wins).
struct Settings {
    enum class Mode { Speech, Duration };

    // Audio
    int sampleRate = 16000;
    int frameDurationMs = 30;
    int channels = 1;
    int inputDevice = -1;  // PortAudio index, -1 = default input

    // Speech segmentation
    int vadAggressiveness = 0;
    int silenceThresholdMs = 2000;
    int preRollMs = 300;

    // Duration chunking
    Mode mode = Mode::Speech;
    int chunkDurationMinutes = 5;

    // Noise suppression
    bool noiseReduction = false;
    int noiseProfileMs = 2000;

    // Output
    std::string outputDir = "recordings";
    bool compress = true;

    // Runtime
    int queueWarnFrames = 100;
    int shutdownTimeoutMs = 2000;

    std::size_t frameSamples() const { return (std::size_t)sampleRate * frameDurationMs / 1000; }
    int maxSilentChunks() const { return silenceThresholdMs / frameDurationMs; }
    std::size_t preRollFrames() const { return (std::size_t)(preRollMs / frameDurationMs); }
    std::size_t targetFramesPerFile() const;
    std::size_t noiseProfileFrames() const { return (std::size_t)(noiseProfileMs / frameDurationMs); }
    std::chrono::milliseconds stallTimeout() const { return std::chrono::milliseconds(2LL * silenceThresholdMs); }
};

const char* modeName(Settings::Mode mode);

// Reads KEY=VALUE pairs from envFile (missing file is fine), then applies
// process environment overrides. Throws std::invalid_argument on a
// malformed value.
Settings loadSettings(const std::string& envFile = ".env");

// Throws std::invalid_argument describing the first invalid setting.
void validateSettings(const Settings& settings);

#endif
