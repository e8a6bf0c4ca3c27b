#include "normalization.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace constellation {

static float clamp01(float v) { return v < 0.0f ? 0.0f : (v > 1.0f ? 1.0f : v); }

Normalizer::Normalizer(const NormalizationConfig& config) : config_(config), log_span_(1.0) {
    if (!(config_.min_freq > 0.0) || !(config_.max_freq > config_.min_freq)) {
        throw std::invalid_argument("frequency range must satisfy 0 < min_freq < max_freq");
    }
    if (!(config_.max_db > config_.min_db)) {
        throw std::invalid_argument("magnitude range must satisfy min_db < max_db");
    }
    if (!(config_.log_weight >= 0.0f && config_.log_weight <= 1.0f)) {
        throw std::invalid_argument("log_weight must be within [0, 1]");
    }
    if (!(config_.magnitude_exponent > 0.0f) || !std::isfinite(config_.magnitude_exponent)) {
        throw std::invalid_argument("magnitude_exponent must be positive");
    }
    if (config_.color_bands < 1) {
        throw std::invalid_argument("color_bands must be at least 1");
    }
    log_span_ = std::log10(config_.max_freq / config_.min_freq);
}

float Normalizer::frequency_position(double frequency_hz) const {
    // NaN compares false everywhere; send it to the low edge
    double f = std::isnan(frequency_hz) ? config_.min_freq : frequency_hz;
    f = std::clamp(f, config_.min_freq, config_.max_freq);
    const double log_pos = std::log10(f / config_.min_freq) / log_span_;
    const double lin_pos = (f - config_.min_freq) / (config_.max_freq - config_.min_freq);
    const double w = config_.log_weight;
    return clamp01(static_cast<float>(w * log_pos + (1.0 - w) * lin_pos));
}

float Normalizer::magnitude_position(float magnitude_db) const {
    float m = std::isnan(magnitude_db) ? config_.min_db : magnitude_db;
    m = std::clamp(m, config_.min_db, config_.max_db);
    const float linear = (m - config_.min_db) / (config_.max_db - config_.min_db);
    return clamp01(std::pow(linear, config_.magnitude_exponent));
}

NormalizedPosition Normalizer::normalize(const Peak& peak) const {
    NormalizedPosition pos;
    pos.x = frequency_position(peak.frequency);
    pos.y = magnitude_position(peak.magnitude);
    return pos;
}

ConstellationPoint Normalizer::project(const FadedPeak& faded) const {
    const NormalizedPosition pos = normalize(faded.peak);
    ConstellationPoint pt;
    pt.x = pos.x;
    pt.y = pos.y;
    pt.intensity = clamp01(faded.fade);
    pt.color_key = pos.x;
    pt.band = std::min(static_cast<int>(pos.x * static_cast<float>(config_.color_bands)), config_.color_bands - 1);
    pt.size = pos.y;
    pt.frequency = faded.peak.frequency;
    pt.magnitude = faded.peak.magnitude;
    return pt;
}

std::vector<ConstellationPoint> Normalizer::project_all(const std::vector<FadedPeak>& snapshot) const {
    std::vector<ConstellationPoint> out;
    out.reserve(snapshot.size());
    for (const auto& fp : snapshot) out.push_back(project(fp));
    return out;
}

DistributionStats compute_distribution(const std::vector<ConstellationPoint>& points) {
    DistributionStats st;
    if (points.empty()) return st;
    st.x_min = st.y_min = 1.0f;
    st.x_max = st.y_max = 0.0f;
    for (const auto& p : points) {
        st.x_min = std::min(st.x_min, p.x);
        st.x_max = std::max(st.x_max, p.x);
        st.y_min = std::min(st.y_min, p.y);
        st.y_max = std::max(st.y_max, p.y);
        const bool right = p.x >= 0.5f;
        const bool top = p.y >= 0.5f;
        if (right && top) st.quadrant[0]++;
        else if (!right && top) st.quadrant[1]++;
        else if (!right && !top) st.quadrant[2]++;
        else st.quadrant[3]++;
    }
    st.count = static_cast<int>(points.size());
    return st;
}

} // namespace constellation
