#pragma once

#include <string>

#include "constellation_store.hpp"
#include "normalization.hpp"
#include "peak_detector.hpp"
#include "spectral_analyzer.hpp"

namespace constellation {

struct ConstellationSettings {
    // Analysis
    double sample_rate = 48000.0;
    int frame_length = 4096;
    int hop_length = 4096;          // samples between frame starts; == frame_length means no overlap
    std::string window_type = "hann";
    float floor_db = -100.0f;

    // Detection (one strategy per session)
    std::string detection_mode = "fixed";
    float min_peak_height = -60.0f;
    int min_peak_distance = 5;
    int max_peaks_per_frame = 10;
    int adaptive_window_size = 50;
    float adaptive_offset_db = 10.0f;

    // Constellation history
    double fade_horizon = 3.0;
    int max_history = 200;
    float min_fade = 0.1f;
    float fingerprint_min_db = -40.0f;
    double fingerprint_min_freq = 300.0;
    double fingerprint_max_freq = 8000.0;

    // Normalization
    double norm_min_freq = 80.0;
    double norm_max_freq = 12000.0;
    float norm_log_weight = 0.8f;
    float norm_min_db = -60.0f;
    float norm_max_db = -10.0f;
    float norm_magnitude_exponent = 0.7f;
    int color_bands = 5;

    // Capture
    std::string audio_device = "default";
    int period_size = 1024;
};

// Checks every field the components would reject, so a bad file is reported
// before anything starts. error receives a readable reason.
bool validate_settings(const ConstellationSettings& st, std::string& error);

// Conversions; string fields fall back to the defaults when unknown, so
// call validate_settings() first to catch those.
AnalyzerConfig to_analyzer_config(const ConstellationSettings& st);
PeakDetectorConfig to_detector_config(const ConstellationSettings& st);
StoreConfig to_store_config(const ConstellationSettings& st);
NormalizationConfig to_normalization_config(const ConstellationSettings& st);

} // namespace constellation
