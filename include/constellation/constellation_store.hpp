#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>

#include "peak.hpp"

namespace constellation {

struct StoreConfig {
    double fade_horizon = 3.0;   // seconds an entry stays live
    int max_history = 200;       // hard cap on retained entries
    float min_fade = 0.1f;       // lowest fade reported for a live entry

    // Filter for fingerprint-quality peaks (strong, speech/music band)
    float fingerprint_min_db = -40.0f;
    double fingerprint_min_freq = 300.0;
    double fingerprint_max_freq = 8000.0;
};

// Time-bounded peak history shared between the audio producer and the
// display consumer. Every method takes the lock for a bounded copy, append
// or erase only; readers always get independent copies.
class ConstellationStore {
public:
    struct Stats {
        std::uint64_t admitted = 0;
        std::uint64_t evicted_by_age = 0;
        std::uint64_t evicted_by_capacity = 0;
    };

    // Throws std::invalid_argument on a non-positive horizon, zero capacity
    // or min_fade outside [0, 1].
    explicit ConstellationStore(const StoreConfig& config = StoreConfig{});

    // Appends every peak stamped with timestamp, replaces current(), then
    // prunes against timestamp.
    void admit(const PeakList& peaks, double timestamp);

    // Age eviction first, then oldest-inserted eviction down to max_history.
    void prune(double now);

    // Live entries (age <= fade_horizon) in insertion order with their fade.
    std::vector<FadedPeak> snapshot(double now) const;

    // Most recent admitted batch, not merged with earlier ones.
    PeakList current() const;

    // Live peaks passing the fingerprint filter.
    PeakList fingerprint_peaks(double now) const;

    size_t size() const;
    Stats stats() const;
    const StoreConfig& config() const { return config_; }

    float fade_for_age(double age) const;

private:
    struct Entry {
        Peak peak;
        double timestamp;
    };

    void prune_locked(double now);
    std::vector<Entry> copy_entries() const;

    StoreConfig config_;
    mutable std::mutex mutex_;
    std::deque<Entry> entries_;
    PeakList current_;
    Stats stats_;
};

} // namespace constellation
