#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

#include "constellation_settings.hpp"
#include "constellation_store.hpp"
#include "peak_detector.hpp"
#include "spectral_analyzer.hpp"

namespace constellation::dsp {

// Latest analyzed frame, copied out for the display thread.
struct SpectrumSnapshot {
    std::vector<float> spectrum;   // dB per bin
    double timestamp = 0.0;
    int peak_count = 0;
    bool valid = false;
};

// Producer side of the pipeline. The audio thread pushes arbitrary-sized
// blocks; every completed frame runs analyze -> detect -> admit. The display
// thread reads through snapshot()/try_get_spectrum() and keeps pruning.
class ConstellationProcessor {
public:
    // Seconds on the stream clock. Producer and consumer must share it.
    using Clock = std::function<double()>;

    // Throws std::invalid_argument if the settings are rejected by any stage
    // or hop_length is outside [1, frame_length]. An empty clock means
    // steady_clock seconds since construction.
    explicit ConstellationProcessor(const ConstellationSettings& settings, Clock clock = Clock());

    // Audio thread
    void push_samples(const float* input, int count);
    // Drops a partially assembled frame; the constellation itself is kept.
    void reset_frame();

    // Display thread
    std::vector<FadedPeak> snapshot(double now) const { return store_.snapshot(now); }
    void prune(double now) { store_.prune(now); }
    bool try_get_spectrum(SpectrumSnapshot& out);
    PeakList current_peaks() const { return store_.current(); }

    double now() const;
    const ConstellationStore& store() const { return store_; }
    const FrequencyMap& frequency_map() const { return analyzer_.frequency_map(); }
    const PeakDetector& detector() const { return detector_; }
    std::uint64_t frames_processed() const { return frames_processed_.load(); }
    int frame_length() const { return frame_length_; }
    int hop_length() const { return hop_length_; }

private:
    void process_frame();

    Clock clock_;
    std::chrono::steady_clock::time_point start_;

    SpectralAnalyzer analyzer_;
    PeakDetector detector_;
    ConstellationStore store_;

    // Audio thread only
    int frame_length_;
    int hop_length_;
    std::vector<float> frame_;
    int fill_ = 0;
    std::vector<float> spectrum_;

    // Handoff to the display thread
    std::mutex spectrum_mutex_;
    SpectrumSnapshot published_;
    std::atomic<bool> spectrum_ready_{false};
    std::atomic<std::uint64_t> frames_processed_{0};
};

} // namespace constellation::dsp
