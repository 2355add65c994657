#include "denoise/spectral_gate.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace {

using cfloat = std::complex<float>;

constexpr float kPi = 3.14159265358979323846f;

std::size_t nextPow2(std::size_t n) {
    std::size_t p = 1;
    while (p < n) p <<= 1;
    return p;
}

// In-place iterative radix-2 FFT; size must be a power of two
void fft(std::vector<cfloat>& a, bool inverse) {
    const std::size_t n = a.size();

    for (std::size_t i = 1, j = 0; i < n; ++i) {
        std::size_t bit = n >> 1;
        for (; j & bit; bit >>= 1) j ^= bit;
        j ^= bit;
        if (i < j) std::swap(a[i], a[j]);
    }

    for (std::size_t len = 2; len <= n; len <<= 1) {
        const float ang = 2.0f * kPi / (float)len * (inverse ? 1.0f : -1.0f);
        const cfloat wlen(std::cos(ang), std::sin(ang));
        for (std::size_t i = 0; i < n; i += len) {
            cfloat w(1.0f, 0.0f);
            for (std::size_t k = 0; k < len / 2; ++k) {
                const cfloat u = a[i + k];
                const cfloat v = a[i + k + len / 2] * w;
                a[i + k] = u + v;
                a[i + k + len / 2] = u - v;
                w *= wlen;
            }
        }
    }

    if (inverse) {
        for (auto& x : a) x /= (float)n;
    }
}

float toDb(float magnitude) {
    return 20.0f * std::log10(magnitude + 1e-10f);
}

} // namespace

SpectralGate::SpectralGate() : SpectralGate(Config{}) {}

SpectralGate::SpectralGate(Config config) : config_(config) {}

// Per-bin mean/std of the profile's spectrum, in dB
void SpectralGate::learnThresholds(const std::vector<float>& noiseProfile, std::size_t fftSize) {
    const std::size_t bins = fftSize / 2 + 1;
    const std::size_t blocks = std::max<std::size_t>(1, noiseProfile.size() / fftSize);

    std::vector<double> sum(bins, 0.0);
    std::vector<double> sumSq(bins, 0.0);
    std::vector<cfloat> buf(fftSize);

    for (std::size_t b = 0; b < blocks; ++b) {
        std::fill(buf.begin(), buf.end(), cfloat(0.0f, 0.0f));
        const std::size_t offset = b * fftSize;
        const std::size_t n = std::min(fftSize, noiseProfile.size() - offset);
        for (std::size_t i = 0; i < n; ++i) buf[i] = cfloat(noiseProfile[offset + i], 0.0f);

        fft(buf, false);

        for (std::size_t k = 0; k < bins; ++k) {
            const double db = toDb(std::abs(buf[k]));
            sum[k] += db;
            sumSq[k] += db * db;
        }
    }

    thresholdDb_.assign(bins, 0.0f);
    for (std::size_t k = 0; k < bins; ++k) {
        const double mean = sum[k] / (double)blocks;
        const double var = std::max(0.0, sumSq[k] / (double)blocks - mean * mean);
        thresholdDb_[k] = (float)(mean + config_.nStdThreshold * std::sqrt(var));
    }

    cachedProfile_ = noiseProfile;
    fftSize_ = fftSize;
}

std::vector<float> SpectralGate::denoise(const std::vector<float>& frame,
                                         int sampleRate,
                                         const std::vector<float>& noiseProfile) {
    if (sampleRate <= 0) throw std::invalid_argument("SpectralGate: invalid sample rate");
    if (noiseProfile.empty()) throw std::invalid_argument("SpectralGate: empty noise profile");
    if (frame.empty()) return frame;

    const std::size_t fftSize = nextPow2(frame.size());
    if (fftSize != fftSize_ || noiseProfile != cachedProfile_) {
        learnThresholds(noiseProfile, fftSize);
    }

    std::vector<cfloat> spectrum(fftSize, cfloat(0.0f, 0.0f));
    for (std::size_t i = 0; i < frame.size(); ++i) spectrum[i] = cfloat(frame[i], 0.0f);

    fft(spectrum, false);

    const std::size_t bins = fftSize / 2 + 1;
    const float gatedGain = 1.0f - std::clamp(config_.propDecrease, 0.0f, 1.0f);
    for (std::size_t k = 0; k < bins; ++k) {
        if (toDb(std::abs(spectrum[k])) >= thresholdDb_[k]) continue;

        spectrum[k] *= gatedGain;
        // keep the spectrum conjugate-symmetric
        if (k != 0 && k != fftSize / 2) spectrum[fftSize - k] *= gatedGain;
    }

    fft(spectrum, true);

    std::vector<float> out(frame.size());
    for (std::size_t i = 0; i < frame.size(); ++i) out[i] = spectrum[i].real();
    return out;
}
