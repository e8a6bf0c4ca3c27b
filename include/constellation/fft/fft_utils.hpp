#pragma once

#include <vector>
#include <complex>

namespace constellation::fft {

inline bool is_power_of_two(int n) { return n > 0 && (n & (n - 1)) == 0; }

// Iterative radix-2 FFT with bit-reversal and per-stage twiddles built once
// at construction. Size must be a power of two.
class FftPlan {
public:
    explicit FftPlan(int n);

    int size() const { return n_; }

    // In-place forward transform; data.size() must equal size().
    void forward(std::vector<std::complex<float>>& data) const;

private:
    int n_;
    std::vector<int> bitrev_;
    std::vector<std::vector<std::complex<float>>> stages_;
};

// Real-input transform of length n computed with an n/2 complex FFT.
// Produces bins 0..n/2-1 (Nyquist is dropped).
class RealFft {
public:
    explicit RealFft(int n);

    int size() const { return n_; }
    int num_bins() const { return n_ / 2; }

    // Reads exactly size() samples. out is resized to num_bins().
    void forward(const float* input, std::vector<std::complex<float>>& out);

private:
    int n_;
    FftPlan half_;
    std::vector<std::complex<float>> packed_;
    std::vector<std::complex<float>> post_twiddles_;
};

} // namespace constellation::fft
