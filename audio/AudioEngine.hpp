#pragma once

#include "audio_input.hpp"
#include <atomic>
#include <cstdint>
#include <memory>

namespace constellation::audio {

// Owns the platform capture backend. Stopping only stops the callbacks;
// whatever the callback feeds keeps its state.
class AudioEngine {
public:
    using ProcessCallback = IAudioInput::ProcessCallback;

    explicit AudioEngine(const AudioConfig& requested);
    ~AudioEngine();

    // Opens the device once to learn the rate and period it grants, then
    // closes it. Size the analysis from get_config() afterwards.
    bool negotiate();

    bool start();
    void stop();
    bool is_running() const;

    // Only while stopped
    void set_process_callback(ProcessCallback cb);

    // Negotiated values once negotiate() or start() succeeded
    const AudioConfig& get_config() const;
    unsigned int sample_rate() const { return get_config().sample_rate; }
    bool negotiated() const { return negotiated_; }

    // Since the last start()
    std::uint64_t samples_captured() const { return samples_captured_.load(); }
    IAudioInput::LatencyStats get_latency_stats() const;

private:
    void deliver(const float* input, int num_samples);

    std::unique_ptr<IAudioInput> backend_;
    ProcessCallback callback_{};
    bool negotiated_ = false;
    std::atomic<std::uint64_t> samples_captured_{0};
};

} // namespace constellation::audio
