#include "storage/segment_store.hpp"
#include "storage/wav_writer.hpp"

#include <zlib.h>

#include <cstdio>
#include <exception>
#include <filesystem>
#include <iostream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

// Constructor
SegmentStore::SegmentStore(Config config) : config_(std::move(config)) {
    std::error_code ec;
    fs::create_directories(config_.outputDir, ec);
    if (ec) {
        std::cerr << "[Storage] [ERROR] Cannot create output directory '" << config_.outputDir
                  << "': " << ec.message() << std::endl;
    }
}

std::string SegmentStore::fileNameFor(const Segment& segment) const {
    std::string name = formatTime(segment.startTime, "%Y%m%d_%H%M%S") + "_to_" +
                       formatTime(segment.endTime, "%H%M%S") + ".wav";
    if (config_.compress) name += ".gz";
    return name;
}

// Writes to a temporary name first so readers never see a partial file
bool SegmentStore::writeFile(const std::string& path, const std::vector<uint8_t>& bytes) const {
    const std::string tmp = path + ".part";

    if (config_.compress) {
        gzFile gz = gzopen(tmp.c_str(), "wb");
        if (!gz) {
            std::cerr << "[Storage] [ERROR] gzopen failed for " << tmp << std::endl;
            return false;
        }
        const int written = bytes.empty() ? 0 : gzwrite(gz, bytes.data(), (unsigned)bytes.size());
        const int rc = gzclose(gz);
        if (written != (int)bytes.size() || rc != Z_OK) {
            std::cerr << "[Storage] [ERROR] gzip write failed for " << tmp << std::endl;
            std::remove(tmp.c_str());
            return false;
        }
    } else {
        std::FILE* f = std::fopen(tmp.c_str(), "wb");
        if (!f) {
            std::cerr << "[Storage] [ERROR] Cannot open " << tmp << std::endl;
            return false;
        }
        const size_t written = std::fwrite(bytes.data(), 1, bytes.size(), f);
        const int rc = std::fclose(f);
        if (written != bytes.size() || rc != 0) {
            std::cerr << "[Storage] [ERROR] Short write to " << tmp << std::endl;
            std::remove(tmp.c_str());
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        std::cerr << "[Storage] [ERROR] Cannot move " << tmp << " into place: " << ec.message() << std::endl;
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

bool SegmentStore::persist(const Segment& segment) {
    if (segment.frames.empty()) {
        std::cout << "[Storage] No recording data to save." << std::endl;
        return false;
    }

    try {
        std::error_code ec;
        fs::create_directories(config_.outputDir, ec);
        if (ec) {
            std::cerr << "[Storage] [ERROR] Cannot create output directory '" << config_.outputDir
                      << "': " << ec.message() << std::endl;
            return false;
        }

        // never overwrite an earlier segment with the same second-resolution name
        const std::string base = fileNameFor(segment);
        fs::path path = fs::path(config_.outputDir) / base;
        for (int n = 1; fs::exists(path); ++n) {
            const std::string ext = config_.compress ? ".wav.gz" : ".wav";
            const std::string stem = base.substr(0, base.size() - ext.size());
            path = fs::path(config_.outputDir) / (stem + "_" + std::to_string(n) + ext);
        }

        const auto bytes = encodeWav(segment.frames, config_.sampleRate, config_.channels);
        if (!writeFile(path.string(), bytes)) return false;

        lastPath_ = path.string();
        std::cout << "[Storage] Saved: " << lastPath_ << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[Storage] [ERROR] Error saving segment: " << e.what() << std::endl;
        return false;
    }
}
