#include "constellation_store.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <stdexcept>

namespace constellation {

ConstellationStore::ConstellationStore(const StoreConfig& config) : config_(config) {
    if (!(config_.fade_horizon > 0.0) || !std::isfinite(config_.fade_horizon)) {
        throw std::invalid_argument("fade_horizon must be positive");
    }
    if (config_.max_history < 1) {
        throw std::invalid_argument("max_history must be at least 1");
    }
    if (!(config_.min_fade >= 0.0f && config_.min_fade <= 1.0f)) {
        throw std::invalid_argument("min_fade must be within [0, 1]");
    }
}

void ConstellationStore::admit(const PeakList& peaks, double timestamp) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& p : peaks) entries_.push_back({p, timestamp});
    stats_.admitted += peaks.size();
    current_ = peaks;
    prune_locked(timestamp);
}

void ConstellationStore::prune(double now) {
    std::lock_guard<std::mutex> lock(mutex_);
    prune_locked(now);
}

void ConstellationStore::prune_locked(double now) {
    // Entries may be out of timestamp order; test each one
    const double horizon = config_.fade_horizon;
    const size_t before = entries_.size();
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [now, horizon](const Entry& e) { return now - e.timestamp > horizon; }),
                   entries_.end());
    stats_.evicted_by_age += before - entries_.size();

    const size_t cap = static_cast<size_t>(config_.max_history);
    if (entries_.size() > cap) {
        const size_t excess = entries_.size() - cap;
        entries_.erase(entries_.begin(), entries_.begin() + static_cast<std::ptrdiff_t>(excess));
        stats_.evicted_by_capacity += excess;
    }
}

std::vector<ConstellationStore::Entry> ConstellationStore::copy_entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<Entry>(entries_.begin(), entries_.end());
}

float ConstellationStore::fade_for_age(double age) const {
    const double linear = 1.0 - age / config_.fade_horizon;
    const double clamped = std::clamp(linear, static_cast<double>(config_.min_fade), 1.0);
    return static_cast<float>(clamped);
}

std::vector<FadedPeak> ConstellationStore::snapshot(double now) const {
    const std::vector<Entry> entries = copy_entries();

    std::vector<FadedPeak> out;
    out.reserve(entries.size());
    for (const auto& e : entries) {
        const double age = now - e.timestamp;
        if (age > config_.fade_horizon) continue;
        out.push_back({e.peak, fade_for_age(age)});
    }
    return out;
}

PeakList ConstellationStore::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

PeakList ConstellationStore::fingerprint_peaks(double now) const {
    const std::vector<Entry> entries = copy_entries();
    PeakList out;
    for (const auto& e : entries) {
        if (now - e.timestamp > config_.fade_horizon) continue;
        const Peak& p = e.peak;
        if (p.magnitude > config_.fingerprint_min_db &&
            p.frequency > config_.fingerprint_min_freq &&
            p.frequency < config_.fingerprint_max_freq) {
            out.push_back(p);
        }
    }
    return out;
}

size_t ConstellationStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

ConstellationStore::Stats ConstellationStore::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

} // namespace constellation
