#pragma once

#include <memory>
#include <string>
#include <vector>

#include "peak.hpp"
#include "spectral_analyzer.hpp"

namespace constellation {

enum class DetectionMode {
    Fixed,      // global minimum height
    Adaptive    // local median noise floor + offset
};

const char* detection_mode_name(DetectionMode mode);
bool parse_detection_mode(const std::string& name, DetectionMode& out);

struct PeakDetectorConfig {
    DetectionMode mode = DetectionMode::Fixed;
    float min_peak_height = -60.0f;   // dB, fixed mode threshold
    int min_peak_distance = 5;        // bins each side that must be strictly lower
    int max_peaks_per_frame = 10;
    int adaptive_window_size = 50;    // bins each side for the median window
    float adaptive_offset_db = 10.0f; // dB above the local median
};

// A candidate before ranking: bin and its dB value.
struct PeakCandidate {
    int bin;
    float magnitude;
};

// Local-maximum search over one spectrum. Implementations are stateless.
class IPeakStrategy {
public:
    virtual ~IPeakStrategy() = default;

    // Candidates in ascending bin order.
    virtual std::vector<PeakCandidate> find_candidates(const Spectrum& spectrum) const = 0;
    virtual DetectionMode mode() const = 0;
};

// Throws std::invalid_argument on invalid configuration.
std::unique_ptr<IPeakStrategy> make_peak_strategy(const PeakDetectorConfig& config);

class PeakDetector {
public:
    // The frequency map is the analyzer's (or one built from the configured
    // sample rate and frame length); it is never defaulted here.
    PeakDetector(const PeakDetectorConfig& config, FrequencyMap frequency_map);

    // At most max_peaks_per_frame peaks, strongest first; equal magnitudes
    // keep ascending bin order. Empty for spectra too short to search.
    PeakList detect(const Spectrum& spectrum, double timestamp) const;

    const PeakDetectorConfig& config() const { return config_; }
    const FrequencyMap& frequency_map() const { return map_; }
    DetectionMode mode() const { return strategy_->mode(); }

private:
    PeakDetectorConfig config_;
    FrequencyMap map_;
    std::unique_ptr<IPeakStrategy> strategy_;
};

} // namespace constellation
