#include "constellation_settings.hpp"

#include <stdexcept>

namespace constellation {

AnalyzerConfig to_analyzer_config(const ConstellationSettings& st) {
    AnalyzerConfig cfg;
    cfg.sample_rate = st.sample_rate;
    cfg.frame_length = st.frame_length;
    cfg.floor_db = st.floor_db;
    WindowType w;
    if (parse_window_type(st.window_type, w)) cfg.window = w;
    return cfg;
}

PeakDetectorConfig to_detector_config(const ConstellationSettings& st) {
    PeakDetectorConfig cfg;
    DetectionMode m;
    if (parse_detection_mode(st.detection_mode, m)) cfg.mode = m;
    cfg.min_peak_height = st.min_peak_height;
    cfg.min_peak_distance = st.min_peak_distance;
    cfg.max_peaks_per_frame = st.max_peaks_per_frame;
    cfg.adaptive_window_size = st.adaptive_window_size;
    cfg.adaptive_offset_db = st.adaptive_offset_db;
    return cfg;
}

StoreConfig to_store_config(const ConstellationSettings& st) {
    StoreConfig cfg;
    cfg.fade_horizon = st.fade_horizon;
    cfg.max_history = st.max_history;
    cfg.min_fade = st.min_fade;
    cfg.fingerprint_min_db = st.fingerprint_min_db;
    cfg.fingerprint_min_freq = st.fingerprint_min_freq;
    cfg.fingerprint_max_freq = st.fingerprint_max_freq;
    return cfg;
}

NormalizationConfig to_normalization_config(const ConstellationSettings& st) {
    NormalizationConfig cfg;
    cfg.min_freq = st.norm_min_freq;
    cfg.max_freq = st.norm_max_freq;
    cfg.log_weight = st.norm_log_weight;
    cfg.min_db = st.norm_min_db;
    cfg.max_db = st.norm_max_db;
    cfg.magnitude_exponent = st.norm_magnitude_exponent;
    cfg.color_bands = st.color_bands;
    return cfg;
}

bool validate_settings(const ConstellationSettings& st, std::string& error) {
    WindowType w;
    if (!parse_window_type(st.window_type, w)) {
        error = "unknown window_type '" + st.window_type + "'";
        return false;
    }
    DetectionMode m;
    if (!parse_detection_mode(st.detection_mode, m)) {
        error = "unknown detection_mode '" + st.detection_mode + "'";
        return false;
    }
    if (st.hop_length < 1 || st.hop_length > st.frame_length) {
        error = "hop_length must be within [1, frame_length]";
        return false;
    }
    if (st.period_size < 1) {
        error = "period_size must be positive";
        return false;
    }
    if (st.max_peaks_per_frame > st.max_history) {
        error = "max_peaks_per_frame must not exceed max_history";
        return false;
    }

    // The components own their invariants; build each once to check them
    try {
        SpectralAnalyzer analyzer(to_analyzer_config(st));
        PeakDetector detector(to_detector_config(st), analyzer.frequency_map());
        ConstellationStore store(to_store_config(st));
        Normalizer normalizer(to_normalization_config(st));
    } catch (const std::invalid_argument& e) {
        error = e.what();
        return false;
    }
    error.clear();
    return true;
}

} // namespace constellation
