#include "fft/fft_utils.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace constellation::fft {

static std::vector<int> build_bitrev(int n) {
    int bits = 0; while ((1 << bits) < n) ++bits;
    std::vector<int> br(n);
    for (int i = 0; i < n; ++i) {
        unsigned int v = static_cast<unsigned int>(i);
        unsigned int r = 0;
        for (int b = 0; b < bits; ++b) { r = (r << 1) | (v & 1u); v >>= 1; }
        br[i] = static_cast<int>(r);
    }
    return br;
}

static std::vector<std::vector<std::complex<float>>> build_twiddles(int n) {
    const double two_pi = 6.28318530717958647692;
    std::vector<std::vector<std::complex<float>>> stages;
    for (int len = 2; len <= n; len <<= 1) {
        const int half = len / 2;
        std::vector<std::complex<float>> stage(half);
        // Direct evaluation per k keeps large stages free of accumulated drift
        for (int k = 0; k < half; ++k) {
            const double angle = -two_pi * static_cast<double>(k) / static_cast<double>(len);
            stage[k] = std::complex<float>(static_cast<float>(std::cos(angle)),
                                           static_cast<float>(std::sin(angle)));
        }
        stages.push_back(std::move(stage));
    }
    return stages;
}

FftPlan::FftPlan(int n) : n_(n) {
    if (!is_power_of_two(n)) {
        throw std::invalid_argument("FFT size must be a power of two, got " + std::to_string(n));
    }
    bitrev_ = build_bitrev(n);
    stages_ = build_twiddles(n);
}

void FftPlan::forward(std::vector<std::complex<float>>& data) const {
    if (static_cast<int>(data.size()) != n_) {
        throw std::invalid_argument("FFT input length " + std::to_string(data.size()) +
                                    " does not match plan size " + std::to_string(n_));
    }
    if (n_ <= 1) return;

    // Bit-reversal permutation, in place
    for (int i = 0; i < n_; ++i) {
        const int j = bitrev_[i];
        if (i < j) std::swap(data[i], data[j]);
    }

    int stageIndex = 0;
    for (int len = 2; len <= n_; len <<= 1, ++stageIndex) {
        const auto& W = stages_[stageIndex];
        const int half = len / 2;
        for (int i = 0; i < n_; i += len) {
            for (int k = 0; k < half; ++k) {
                const auto u = data[i + k];
                const auto v = data[i + k + half] * W[k];
                data[i + k] = u + v;
                data[i + k + half] = u - v;
            }
        }
    }
}

static int checked_half(int n) {
    if (!is_power_of_two(n) || n < 4) {
        throw std::invalid_argument("real FFT size must be a power of two >= 4, got " + std::to_string(n));
    }
    return n / 2;
}

RealFft::RealFft(int n) : n_(n), half_(checked_half(n)) {
    const int m = n_ / 2;
    packed_.assign(m, std::complex<float>(0.0f, 0.0f));
    post_twiddles_.resize(m);
    const double two_pi = 6.28318530717958647692;
    for (int k = 0; k < m; ++k) {
        const double angle = -two_pi * static_cast<double>(k) / static_cast<double>(n_);
        post_twiddles_[k] = std::complex<float>(static_cast<float>(std::cos(angle)),
                                                static_cast<float>(std::sin(angle)));
    }
}

void RealFft::forward(const float* input, std::vector<std::complex<float>>& out) {
    const int m = n_ / 2;
    // Even samples in the real part, odd samples in the imaginary part
    for (int i = 0; i < m; ++i) {
        packed_[i] = std::complex<float>(input[2 * i], input[2 * i + 1]);
    }
    half_.forward(packed_);

    // Split the half-length result into the even/odd spectra and recombine
    out.resize(m);
    const std::complex<float> minus_half_i(0.0f, -0.5f);
    for (int k = 0; k < m; ++k) {
        const std::complex<float> zk = packed_[k];
        const std::complex<float> zc = std::conj(packed_[(m - k) % m]);
        const std::complex<float> even = 0.5f * (zk + zc);
        const std::complex<float> odd = minus_half_i * (zk - zc);
        out[k] = even + post_twiddles_[k] * odd;
    }
}

} // namespace constellation::fft
