#include "AudioEngine.hpp"
#include <iostream>
#include <utility>

namespace constellation::audio {

AudioEngine::AudioEngine(const AudioConfig& requested)
    : backend_(createAudioInput(requested)) {
    backend_->set_process_callback([this](const float* input, int num_samples) {
        deliver(input, num_samples);
    });
}

AudioEngine::~AudioEngine() {
    stop();
}

void AudioEngine::deliver(const float* input, int num_samples) {
    samples_captured_.fetch_add(static_cast<std::uint64_t>(num_samples));
    if (callback_) callback_(input, num_samples);
}

bool AudioEngine::negotiate() {
    if (backend_->is_running()) return negotiated_ = true;
    // Nothing is forwarded while probing
    ProcessCallback saved = std::move(callback_);
    callback_ = nullptr;
    const bool ok = backend_->start();
    backend_->stop();
    callback_ = std::move(saved);
    if (!ok) {
        std::cerr << "Audio device negotiation failed\n";
        return false;
    }
    negotiated_ = true;
    return true;
}

bool AudioEngine::start() {
    samples_captured_ = 0;
    if (!backend_->start()) return false;
    negotiated_ = true;
    return true;
}

void AudioEngine::stop() {
    backend_->stop();
}

bool AudioEngine::is_running() const {
    return backend_->is_running();
}

void AudioEngine::set_process_callback(ProcessCallback cb) {
    callback_ = std::move(cb);
}

const AudioConfig& AudioEngine::get_config() const {
    return backend_->get_config();
}

IAudioInput::LatencyStats AudioEngine::get_latency_stats() const {
    return backend_->get_latency_stats();
}

} // namespace constellation::audio
