#include "peak_detector.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace constellation {

const char* detection_mode_name(DetectionMode mode) {
    return mode == DetectionMode::Adaptive ? "adaptive" : "fixed";
}

bool parse_detection_mode(const std::string& name, DetectionMode& out) {
    if (name == "fixed") { out = DetectionMode::Fixed; return true; }
    if (name == "adaptive") { out = DetectionMode::Adaptive; return true; }
    return false;
}

namespace {

// True when spectrum[i] is strictly above every other bin within +/-distance.
// Neighbors outside the spectrum are ignored.
bool is_strict_local_max(const Spectrum& spectrum, int i, int distance) {
    const int n = static_cast<int>(spectrum.size());
    const float v = spectrum[i];
    const int lo = std::max(0, i - distance);
    const int hi = std::min(n - 1, i + distance);
    for (int j = lo; j <= hi; ++j) {
        if (j != i && spectrum[j] >= v) return false;
    }
    return true;
}

class FixedThresholdStrategy : public IPeakStrategy {
public:
    FixedThresholdStrategy(float min_height, int distance)
        : min_height_(min_height), distance_(distance) {}

    std::vector<PeakCandidate> find_candidates(const Spectrum& spectrum) const override {
        std::vector<PeakCandidate> out;
        const int n = static_cast<int>(spectrum.size());
        if (n <= 2 * distance_) return out;
        for (int i = distance_; i < n - distance_; ++i) {
            const float v = spectrum[i];
            if (!(v > min_height_)) continue;
            if (is_strict_local_max(spectrum, i, distance_)) out.push_back({i, v});
        }
        return out;
    }

    DetectionMode mode() const override { return DetectionMode::Fixed; }

private:
    float min_height_;
    int distance_;
};

class AdaptiveThresholdStrategy : public IPeakStrategy {
public:
    AdaptiveThresholdStrategy(int window_size, float offset_db, int distance)
        : window_size_(window_size), offset_db_(offset_db), distance_(distance) {}

    std::vector<PeakCandidate> find_candidates(const Spectrum& spectrum) const override {
        std::vector<PeakCandidate> out;
        const int n = static_cast<int>(spectrum.size());
        if (n <= 2 * window_size_) return out;

        std::vector<float> local(2 * window_size_);
        for (int i = window_size_; i < n - window_size_; ++i) {
            const float v = spectrum[i];
            // Cheap rejection before the median: must beat its neighbors anyway
            if (!is_strict_local_max(spectrum, i, distance_)) continue;

            std::copy(spectrum.begin() + (i - window_size_),
                      spectrum.begin() + (i + window_size_),
                      local.begin());
            auto mid = local.begin() + local.size() / 2;
            std::nth_element(local.begin(), mid, local.end());
            const float threshold = *mid + offset_db_;
            if (v > threshold) out.push_back({i, v});
        }
        return out;
    }

    DetectionMode mode() const override { return DetectionMode::Adaptive; }

private:
    int window_size_;
    float offset_db_;
    int distance_;
};

void validate(const PeakDetectorConfig& config) {
    if (config.min_peak_distance < 1) {
        throw std::invalid_argument("min_peak_distance must be at least 1");
    }
    if (config.max_peaks_per_frame < 1) {
        throw std::invalid_argument("max_peaks_per_frame must be at least 1");
    }
    if (!std::isfinite(config.min_peak_height)) {
        throw std::invalid_argument("min_peak_height must be finite");
    }
    if (config.mode == DetectionMode::Adaptive) {
        if (config.adaptive_window_size < 1) {
            throw std::invalid_argument("adaptive_window_size must be at least 1");
        }
        if (!std::isfinite(config.adaptive_offset_db)) {
            throw std::invalid_argument("adaptive_offset_db must be finite");
        }
    }
}

} // namespace

std::unique_ptr<IPeakStrategy> make_peak_strategy(const PeakDetectorConfig& config) {
    validate(config);
    if (config.mode == DetectionMode::Adaptive) {
        return std::make_unique<AdaptiveThresholdStrategy>(config.adaptive_window_size,
                                                           config.adaptive_offset_db,
                                                           config.min_peak_distance);
    }
    return std::make_unique<FixedThresholdStrategy>(config.min_peak_height, config.min_peak_distance);
}

PeakDetector::PeakDetector(const PeakDetectorConfig& config, FrequencyMap frequency_map)
    : config_(config), map_(std::move(frequency_map)), strategy_(make_peak_strategy(config)) {}

PeakList PeakDetector::detect(const Spectrum& spectrum, double timestamp) const {
    std::vector<PeakCandidate> candidates = strategy_->find_candidates(spectrum);

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const PeakCandidate& a, const PeakCandidate& b) { return a.magnitude > b.magnitude; });
    if (static_cast<int>(candidates.size()) > config_.max_peaks_per_frame) {
        candidates.resize(config_.max_peaks_per_frame);
    }

    PeakList peaks;
    peaks.reserve(candidates.size());
    for (const auto& c : candidates) {
        Peak p;
        p.frequency = map_.bin_to_frequency(c.bin);
        p.magnitude = c.magnitude;
        p.timestamp = timestamp;
        p.bin = c.bin;
        peaks.push_back(p);
    }
    return peaks;
}

} // namespace constellation
