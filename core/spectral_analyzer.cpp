#include "spectral_analyzer.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace constellation {

const char* window_type_name(WindowType type) {
    switch (type) {
        case WindowType::Hann: return "hann";
        case WindowType::Hamming: return "hamming";
        case WindowType::Blackman: return "blackman";
        case WindowType::Rectangular: return "rectangular";
    }
    return "hann";
}

bool parse_window_type(const std::string& name, WindowType& out) {
    if (name == "hann") { out = WindowType::Hann; return true; }
    if (name == "hamming") { out = WindowType::Hamming; return true; }
    if (name == "blackman") { out = WindowType::Blackman; return true; }
    if (name == "rectangular") { out = WindowType::Rectangular; return true; }
    return false;
}

std::vector<float> make_window(WindowType type, int length) {
    std::vector<float> w(std::max(0, length), 1.0f);
    if (length <= 1 || type == WindowType::Rectangular) return w;
    const double two_pi = 6.28318530717958647692;
    const double denom = static_cast<double>(length - 1);
    for (int k = 0; k < length; ++k) {
        const double phase = two_pi * static_cast<double>(k) / denom;
        double v = 1.0;
        switch (type) {
            case WindowType::Hann:
                v = 0.5 * (1.0 - std::cos(phase));
                break;
            case WindowType::Hamming:
                v = 0.54 - 0.46 * std::cos(phase);
                break;
            case WindowType::Blackman:
                v = 0.42 - 0.5 * std::cos(phase) + 0.08 * std::cos(2.0 * phase);
                break;
            case WindowType::Rectangular:
                break;
        }
        w[k] = static_cast<float>(v);
    }
    return w;
}

FrequencyMap::FrequencyMap(double sample_rate, int frame_length)
    : sample_rate_(sample_rate), frame_length_(frame_length) {
    if (!(sample_rate > 0.0) || !std::isfinite(sample_rate)) {
        throw std::invalid_argument("sample rate must be positive and finite");
    }
    if (!fft::is_power_of_two(frame_length)) {
        throw std::invalid_argument("frame length must be a power of two, got " + std::to_string(frame_length));
    }
}

double FrequencyMap::bin_to_frequency(int bin) const {
    return static_cast<double>(bin) * sample_rate_ / static_cast<double>(frame_length_);
}

int FrequencyMap::frequency_to_bin(double frequency_hz) const {
    const double exact = frequency_hz * static_cast<double>(frame_length_) / sample_rate_;
    // Tolerance so bin_to_frequency(i) maps back to i for non-integral rates
    return static_cast<int>(std::floor(exact + 1e-9));
}

SpectralAnalyzer::SpectralAnalyzer(const AnalyzerConfig& config)
    : config_(config),
      map_(config.sample_rate, config.frame_length),
      window_(make_window(config.window, config.frame_length)),
      amplitude_scale_(1.0f),
      floor_magnitude_(0.0f),
      fft_(config.frame_length) {
    if (!std::isfinite(config.floor_db)) {
        throw std::invalid_argument("floor_db must be finite");
    }
    double sum = 0.0;
    for (float v : window_) sum += v;
    amplitude_scale_ = sum > 0.0 ? static_cast<float>(2.0 / sum) : 1.0f;
    floor_magnitude_ = std::pow(10.0f, config_.floor_db / 20.0f);
    windowed_.assign(config_.frame_length, 0.0f);
    bins_.assign(num_bins(), std::complex<float>(0.0f, 0.0f));
}

Spectrum SpectralAnalyzer::analyze(const AudioFrame& frame) {
    return analyze(frame.data(), static_cast<int>(frame.size()));
}

Spectrum SpectralAnalyzer::analyze(const float* samples, int count) {
    Spectrum out;
    analyze(samples, count, out);
    return out;
}

void SpectralAnalyzer::analyze(const float* samples, int count, Spectrum& out) {
    if (count != config_.frame_length || !samples) {
        throw std::invalid_argument("frame length " + std::to_string(count) +
                                    " does not match configured " + std::to_string(config_.frame_length));
    }

    const int n = config_.frame_length;
    for (int i = 0; i < n; ++i) windowed_[i] = samples[i] * window_[i];

    fft_.forward(windowed_.data(), bins_);

    const int m = num_bins();
    out.resize(m);
    for (int k = 0; k < m; ++k) {
        const float mag = std::abs(bins_[k]) * amplitude_scale_;
        if (!(mag > floor_magnitude_)) {
            // Also catches NaN from non-finite input
            out[k] = config_.floor_db;
            continue;
        }
        out[k] = std::max(config_.floor_db, 20.0f * std::log10(mag));
    }
}

} // namespace constellation
