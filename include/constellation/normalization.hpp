#pragma once

#include <vector>

#include "peak.hpp"

namespace constellation {

struct NormalizationConfig {
    double min_freq = 80.0;          // Hz, left edge of the x axis
    double max_freq = 12000.0;       // Hz, right edge
    float log_weight = 0.8f;         // x = w*log + (1-w)*linear
    float min_db = -60.0f;           // bottom of the y axis
    float max_db = -10.0f;           // top of the y axis
    float magnitude_exponent = 0.7f; // y = rescaled^exponent, renderer tuning knob
    int color_bands = 5;             // number of discrete color keys
};

struct NormalizedPosition {
    float x = 0.0f;   // frequency axis, [0,1]
    float y = 0.0f;   // magnitude axis, [0,1]
};

// Everything a renderer needs to draw one point.
struct ConstellationPoint {
    float x = 0.0f;
    float y = 0.0f;
    float intensity = 1.0f;   // fade factor
    float color_key = 0.0f;   // continuous key in [0,1]
    int band = 0;             // discrete key in [0, color_bands)
    float size = 0.0f;        // relative size in [0,1]
    double frequency = 0.0;
    float magnitude = 0.0f;
};

struct DistributionStats {
    float x_min = 0.0f, x_max = 0.0f;
    float y_min = 0.0f, y_max = 0.0f;
    int quadrant[4] = {0, 0, 0, 0};   // around (0.5, 0.5): +x+y, -x+y, -x-y, +x-y
    int count = 0;
};

// Stateless mapping from (frequency, magnitude, fade) into [0,1] space.
// Inputs outside the configured ranges are clamped.
class Normalizer {
public:
    // Throws std::invalid_argument on empty or inverted ranges, a weight
    // outside [0,1], a non-positive exponent or fewer than one color band.
    explicit Normalizer(const NormalizationConfig& config = NormalizationConfig{});

    NormalizedPosition normalize(const Peak& peak) const;
    float frequency_position(double frequency_hz) const;
    float magnitude_position(float magnitude_db) const;

    ConstellationPoint project(const FadedPeak& faded) const;
    std::vector<ConstellationPoint> project_all(const std::vector<FadedPeak>& snapshot) const;

    const NormalizationConfig& config() const { return config_; }

private:
    NormalizationConfig config_;
    double log_span_;
};

DistributionStats compute_distribution(const std::vector<ConstellationPoint>& points);

} // namespace constellation
