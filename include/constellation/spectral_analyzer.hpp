#pragma once

#include <complex>
#include <string>
#include <vector>

#include "fft/fft_utils.hpp"

namespace constellation {

using AudioFrame = std::vector<float>;
using Spectrum = std::vector<float>;   // dB per bin, length frame_length / 2

enum class WindowType {
    Hann,
    Hamming,
    Blackman,
    Rectangular
};

const char* window_type_name(WindowType type);
// Accepts the names produced by window_type_name(); false for anything else.
bool parse_window_type(const std::string& name, WindowType& out);

struct AnalyzerConfig {
    double sample_rate = 48000.0;
    int frame_length = 4096;              // power of two
    WindowType window = WindowType::Hann;
    float floor_db = -100.0f;             // clamp for silent / exact-zero bins
};

// Bin <-> frequency mapping for one (sample rate, frame length) pair.
// Throws std::invalid_argument on a non-positive rate or a frame length
// that is not a power of two.
class FrequencyMap {
public:
    FrequencyMap(double sample_rate, int frame_length);

    double bin_to_frequency(int bin) const;
    // Inverse of bin_to_frequency, floor-rounded.
    int frequency_to_bin(double frequency_hz) const;

    double sample_rate() const { return sample_rate_; }
    int frame_length() const { return frame_length_; }
    double bin_width_hz() const { return sample_rate_ / frame_length_; }

private:
    double sample_rate_;
    int frame_length_;
};

// Windowed real FFT -> log-magnitude spectrum. Not thread safe: scratch
// buffers are owned by the instance, one analyzer per producer thread.
class SpectralAnalyzer {
public:
    explicit SpectralAnalyzer(const AnalyzerConfig& config);

    // Frame length must equal config().frame_length, otherwise
    // std::invalid_argument is thrown.
    Spectrum analyze(const AudioFrame& frame);
    Spectrum analyze(const float* samples, int count);
    void analyze(const float* samples, int count, Spectrum& out);

    double bin_to_frequency(int bin) const { return map_.bin_to_frequency(bin); }
    int frequency_to_bin(double frequency_hz) const { return map_.frequency_to_bin(frequency_hz); }

    const FrequencyMap& frequency_map() const { return map_; }
    const AnalyzerConfig& config() const { return config_; }
    const std::vector<float>& window() const { return window_; }
    int num_bins() const { return config_.frame_length / 2; }

private:
    AnalyzerConfig config_;
    FrequencyMap map_;
    std::vector<float> window_;
    float amplitude_scale_;     // 2 / sum(window): full-scale sine -> ~0 dB
    float floor_magnitude_;

    fft::RealFft fft_;
    std::vector<float> windowed_;
    std::vector<std::complex<float>> bins_;
};

std::vector<float> make_window(WindowType type, int length);

} // namespace constellation
