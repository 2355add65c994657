#include "config/settings.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <map>
#include <stdexcept>
#include <utility>

namespace {

std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

std::map<std::string, std::string> readEnvFile(const std::string& path) {
    std::map<std::string, std::string> values;
    std::ifstream in(path);
    if (!in) return values;

    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        if (line.rfind("export ", 0) == 0) line = trim(line.substr(7));

        const auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }
        values[key] = value;
    }
    return values;
}

class Source {
public:
    explicit Source(std::map<std::string, std::string> file) : file_(std::move(file)) {}

    bool get(const char* key, std::string& out) const {
        if (const char* env = std::getenv(key)) {
            out = env;
            return true;
        }
        const auto it = file_.find(key);
        if (it == file_.end()) return false;
        out = it->second;
        return true;
    }

    void readInt(const char* key, int& target) const {
        std::string raw;
        if (!get(key, raw)) return;

        const std::string bad = std::string(key) + " must be an integer, got '" + raw + "'";
        size_t pos = 0;
        int v = 0;
        try {
            v = std::stoi(raw, &pos);
        } catch (const std::exception&) {
            throw std::invalid_argument(bad);
        }
        if (!trim(raw.substr(pos)).empty()) throw std::invalid_argument(bad);
        target = v;
    }

    void readBool(const char* key, bool& target) const {
        std::string raw;
        if (!get(key, raw)) return;
        const std::string v = lower(trim(raw));
        if (v == "1" || v == "true" || v == "yes" || v == "on") target = true;
        else if (v == "0" || v == "false" || v == "no" || v == "off") target = false;
        else throw std::invalid_argument(std::string(key) + " must be a boolean, got '" + raw + "'");
    }

    void readString(const char* key, std::string& target) const {
        std::string raw;
        if (get(key, raw)) target = raw;
    }

private:
    std::map<std::string, std::string> file_;
};

} // namespace

std::size_t Settings::targetFramesPerFile() const {
    const long long targetMs = 60000LL * chunkDurationMinutes;
    return (std::size_t)((targetMs + frameDurationMs - 1) / frameDurationMs);
}

const char* modeName(Settings::Mode mode) {
    return mode == Settings::Mode::Speech ? "speech" : "duration";
}

Settings loadSettings(const std::string& envFile) {
    Settings s;
    const Source src(readEnvFile(envFile));

    src.readInt("SAMPLE_RATE", s.sampleRate);
    src.readInt("CHUNK_DURATION_MS", s.frameDurationMs);
    src.readInt("CHANNELS", s.channels);
    src.readInt("INPUT_DEVICE", s.inputDevice);

    src.readInt("VAD_AGGRESSIVENESS", s.vadAggressiveness);
    src.readInt("SILENCE_THRESHOLD_MS", s.silenceThresholdMs);
    src.readInt("PRE_BUFFER_DURATION_MS", s.preRollMs);

    std::string mode;
    if (src.get("SEGMENT_MODE", mode)) {
        mode = lower(trim(mode));
        if (mode == "speech" || mode == "vad") s.mode = Settings::Mode::Speech;
        else if (mode == "duration" || mode == "chunk") s.mode = Settings::Mode::Duration;
        else throw std::invalid_argument("SEGMENT_MODE must be 'speech' or 'duration', got '" + mode + "'");
    }
    src.readInt("CHUNK_DURATION_MINUTES", s.chunkDurationMinutes);

    src.readBool("NOISE_REDUCTION", s.noiseReduction);
    src.readInt("NOISE_PROFILE_MS", s.noiseProfileMs);

    src.readString("OUTPUT_DIR", s.outputDir);
    src.readBool("COMPRESS_OUTPUT", s.compress);

    src.readInt("QUEUE_WARN_FRAMES", s.queueWarnFrames);
    src.readInt("SHUTDOWN_TIMEOUT_MS", s.shutdownTimeoutMs);

    return s;
}

void validateSettings(const Settings& s) {
    const int rates[] = {8000, 16000, 32000, 48000};
    if (std::find(std::begin(rates), std::end(rates), s.sampleRate) == std::end(rates)) {
        throw std::invalid_argument("SAMPLE_RATE must be one of 8000, 16000, 32000, 48000");
    }
    if (s.frameDurationMs != 10 && s.frameDurationMs != 20 && s.frameDurationMs != 30) {
        throw std::invalid_argument("CHUNK_DURATION_MS must be one of 10, 20, 30");
    }
    if (s.channels != 1) {
        throw std::invalid_argument("CHANNELS must be 1; segmentation is mono only");
    }
    if (s.vadAggressiveness < 0 || s.vadAggressiveness > 3) {
        throw std::invalid_argument("VAD_AGGRESSIVENESS must be between 0 and 3");
    }
    if (s.silenceThresholdMs <= 0) {
        throw std::invalid_argument("SILENCE_THRESHOLD_MS must be positive");
    }
    if (s.preRollMs < 0) {
        throw std::invalid_argument("PRE_BUFFER_DURATION_MS must not be negative");
    }
    if (s.chunkDurationMinutes <= 0) {
        throw std::invalid_argument("CHUNK_DURATION_MINUTES must be positive");
    }
    if (s.noiseProfileMs <= 0) {
        throw std::invalid_argument("NOISE_PROFILE_MS must be positive");
    }
    if (s.outputDir.empty()) {
        throw std::invalid_argument("OUTPUT_DIR must not be empty");
    }
    if (s.queueWarnFrames < 0) {
        throw std::invalid_argument("QUEUE_WARN_FRAMES must not be negative");
    }
    if (s.shutdownTimeoutMs <= 0) {
        throw std::invalid_argument("SHUTDOWN_TIMEOUT_MS must be positive");
    }
}
