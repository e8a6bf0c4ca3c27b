#include "constellation_processor.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace constellation::dsp {

static int checked_hop(const ConstellationSettings& st) {
    if (st.hop_length < 1 || st.hop_length > st.frame_length) {
        throw std::invalid_argument("hop_length must be within [1, frame_length]");
    }
    return st.hop_length;
}

ConstellationProcessor::ConstellationProcessor(const ConstellationSettings& settings, Clock clock)
    : clock_(std::move(clock)),
      start_(std::chrono::steady_clock::now()),
      analyzer_(to_analyzer_config(settings)),
      detector_(to_detector_config(settings), analyzer_.frequency_map()),
      store_(to_store_config(settings)),
      frame_length_(settings.frame_length),
      hop_length_(checked_hop(settings)) {
    frame_.assign(frame_length_, 0.0f);
    spectrum_.reserve(analyzer_.num_bins());
}

double ConstellationProcessor::now() const {
    if (clock_) return clock_();
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
}

void ConstellationProcessor::push_samples(const float* input, int count) {
    if (!input || count <= 0) return;
    int consumed = 0;
    while (consumed < count) {
        const int take = std::min(count - consumed, frame_length_ - fill_);
        std::copy(input + consumed, input + consumed + take, frame_.begin() + fill_);
        fill_ += take;
        consumed += take;
        if (fill_ == frame_length_) {
            process_frame();
            // Keep the overlap for the next frame
            const int keep = frame_length_ - hop_length_;
            if (keep > 0) std::copy(frame_.begin() + hop_length_, frame_.end(), frame_.begin());
            fill_ = keep;
        }
    }
}

void ConstellationProcessor::reset_frame() {
    fill_ = 0;
}

void ConstellationProcessor::process_frame() {
    const double timestamp = now();
    analyzer_.analyze(frame_.data(), frame_length_, spectrum_);
    PeakList peaks = detector_.detect(spectrum_, timestamp);
    store_.admit(peaks, timestamp);
    frames_processed_.fetch_add(1);

    std::lock_guard<std::mutex> lock(spectrum_mutex_);
    published_.spectrum.assign(spectrum_.begin(), spectrum_.end());
    published_.timestamp = timestamp;
    published_.peak_count = static_cast<int>(peaks.size());
    published_.valid = true;
    spectrum_ready_.store(true);
}

bool ConstellationProcessor::try_get_spectrum(SpectrumSnapshot& out) {
    if (!spectrum_ready_.exchange(false)) return false;
    std::lock_guard<std::mutex> lock(spectrum_mutex_);
    out = published_;
    return true;
}

} // namespace constellation::dsp
