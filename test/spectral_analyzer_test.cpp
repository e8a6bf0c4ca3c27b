#include "spectral_analyzer.hpp"
#include "fft/fft_utils.hpp"
#include <iostream>
#include <iomanip>
#include <algorithm>
#include <cmath>
#include <complex>
#include <stdexcept>
#include <vector>

using namespace constellation;

static int g_failures = 0;

#define CHECK(cond) do { \
    if (!(cond)) { \
        std::cout << "  FAIL " << __LINE__ << ": " #cond "\n"; \
        ++g_failures; \
    } \
} while (0)

static const double kTwoPi = 6.28318530717958647692;

static std::vector<float> make_sine(int n, double freq, double sample_rate, float amplitude) {
    std::vector<float> x(n);
    for (int i = 0; i < n; ++i) {
        x[i] = amplitude * static_cast<float>(std::sin(kTwoPi * freq * i / sample_rate));
    }
    return x;
}

static int argmax(const Spectrum& s) {
    int best = 0;
    for (int i = 1; i < static_cast<int>(s.size()); ++i) if (s[i] > s[best]) best = i;
    return best;
}

static void test_frequency_map() {
    std::cout << "frequency map\n";
    FrequencyMap map(48000.0, 4096);
    CHECK(map.bin_to_frequency(0) == 0.0);
    CHECK(std::fabs(map.bin_to_frequency(2048) - 24000.0) < 1e-9);
    CHECK(std::fabs(map.bin_width_hz() - 11.71875) < 1e-9);

    // Every bin maps back to itself
    bool round_trip = true;
    for (int i = 0; i <= 2048; ++i) {
        if (map.frequency_to_bin(map.bin_to_frequency(i)) != i) round_trip = false;
    }
    CHECK(round_trip);

    FrequencyMap odd(44100.0, 1024);
    round_trip = true;
    for (int i = 0; i <= 512; ++i) {
        if (odd.frequency_to_bin(odd.bin_to_frequency(i)) != i) round_trip = false;
    }
    CHECK(round_trip);

    // Floor rounding between bins
    CHECK(map.frequency_to_bin(11.0) == 0);
    CHECK(map.frequency_to_bin(12.0) == 1);

    bool threw = false;
    try { FrequencyMap bad(0.0, 4096); } catch (const std::invalid_argument&) { threw = true; }
    CHECK(threw);
    threw = false;
    try { FrequencyMap bad(48000.0, 1000); } catch (const std::invalid_argument&) { threw = true; }
    CHECK(threw);
}

static void test_silence_hits_floor() {
    std::cout << "silence\n";
    AnalyzerConfig cfg;
    SpectralAnalyzer analyzer(cfg);
    CHECK(analyzer.num_bins() == 2048);

    AudioFrame zeros(4096, 0.0f);
    Spectrum s = analyzer.analyze(zeros);
    CHECK(static_cast<int>(s.size()) == 2048);
    bool all_floor = true;
    for (float v : s) if (v != cfg.floor_db) all_floor = false;
    CHECK(all_floor);

    cfg.floor_db = -80.0f;
    SpectralAnalyzer analyzer80(cfg);
    s = analyzer80.analyze(zeros);
    all_floor = true;
    for (float v : s) if (v != -80.0f) all_floor = false;
    CHECK(all_floor);
}

static void test_sine_peak() {
    std::cout << "sine peak\n";
    AnalyzerConfig cfg;
    SpectralAnalyzer analyzer(cfg);
    const int bin = 100;
    const double freq = analyzer.bin_to_frequency(bin);

    Spectrum s = analyzer.analyze(make_sine(4096, freq, cfg.sample_rate, 1.0f));
    CHECK(argmax(s) == bin);
    std::cout << "  full scale: " << std::fixed << std::setprecision(2) << s[bin] << " dB\n";
    CHECK(std::fabs(s[bin]) < 0.5f);
    // Far bins sit well below the tone
    CHECK(s[bin + 200] < s[bin] - 60.0f);

    Spectrum half = analyzer.analyze(make_sine(4096, freq, cfg.sample_rate, 0.5f));
    CHECK(argmax(half) == bin);
    CHECK(std::fabs((s[bin] - half[bin]) - 6.02f) < 0.1f);

    // Pointer and out-parameter overloads agree
    std::vector<float> x = make_sine(4096, 1000.0, cfg.sample_rate, 0.25f);
    Spectrum a = analyzer.analyze(x);
    Spectrum b;
    analyzer.analyze(x.data(), static_cast<int>(x.size()), b);
    CHECK(a == b);
}

static void test_windows() {
    std::cout << "windows\n";
    std::vector<float> hann = make_window(WindowType::Hann, 9);
    CHECK(std::fabs(hann[0]) < 1e-6f && std::fabs(hann[8]) < 1e-6f);
    CHECK(std::fabs(hann[4] - 1.0f) < 1e-6f);

    std::vector<float> hamming = make_window(WindowType::Hamming, 9);
    CHECK(std::fabs(hamming[0] - 0.08f) < 1e-5f);

    std::vector<float> blackman = make_window(WindowType::Blackman, 9);
    CHECK(std::fabs(blackman[0]) < 1e-5f);
    CHECK(std::fabs(blackman[4] - 1.0f) < 1e-5f);

    std::vector<float> rect = make_window(WindowType::Rectangular, 9);
    bool ones = true;
    for (float v : rect) if (v != 1.0f) ones = false;
    CHECK(ones);

    const WindowType all[] = {WindowType::Hann, WindowType::Hamming, WindowType::Blackman, WindowType::Rectangular};
    for (WindowType t : all) {
        WindowType parsed = WindowType::Hann;
        CHECK(parse_window_type(window_type_name(t), parsed) && parsed == t);

        // Each window still finds the tone
        AnalyzerConfig cfg;
        cfg.window = t;
        SpectralAnalyzer analyzer(cfg);
        Spectrum s = analyzer.analyze(make_sine(4096, analyzer.bin_to_frequency(300), cfg.sample_rate, 0.5f));
        CHECK(argmax(s) == 300);
    }
    WindowType unused;
    CHECK(!parse_window_type("kaiser", unused));
}

static void test_fft_matches_dft() {
    std::cout << "fft vs dft\n";
    const int n = 64;
    std::vector<float> x(n);
    for (int i = 0; i < n; ++i) x[i] = static_cast<float>(std::sin(0.37 * i) + 0.5 * std::cos(1.3 * i) + 0.1 * (i % 7));

    fft::RealFft rfft(n);
    std::vector<std::complex<float>> out;
    rfft.forward(x.data(), out);
    CHECK(static_cast<int>(out.size()) == n / 2);

    double max_err = 0.0;
    for (int k = 0; k < n / 2; ++k) {
        std::complex<double> acc(0.0, 0.0);
        for (int t = 0; t < n; ++t) {
            const double ph = -kTwoPi * k * t / n;
            acc += static_cast<double>(x[t]) * std::complex<double>(std::cos(ph), std::sin(ph));
        }
        const std::complex<double> got(out[k].real(), out[k].imag());
        max_err = std::max(max_err, std::abs(got - acc));
    }
    std::cout << "  max error: " << std::scientific << max_err << std::fixed << "\n";
    CHECK(max_err < 1e-3);

    bool threw = false;
    try { fft::FftPlan plan(48); } catch (const std::invalid_argument&) { threw = true; }
    CHECK(threw);
}

static void test_invalid_input() {
    std::cout << "invalid input\n";
    AnalyzerConfig cfg;
    cfg.frame_length = 3000;
    bool threw = false;
    try { SpectralAnalyzer a(cfg); } catch (const std::invalid_argument&) { threw = true; }
    CHECK(threw);

    cfg.frame_length = 1024;
    cfg.sample_rate = -1.0;
    threw = false;
    try { SpectralAnalyzer a(cfg); } catch (const std::invalid_argument&) { threw = true; }
    CHECK(threw);

    cfg.sample_rate = 48000.0;
    SpectralAnalyzer analyzer(cfg);
    threw = false;
    try { analyzer.analyze(AudioFrame(1000, 0.0f)); } catch (const std::invalid_argument&) { threw = true; }
    CHECK(threw);
    threw = false;
    try { analyzer.analyze(nullptr, 1024); } catch (const std::invalid_argument&) { threw = true; }
    CHECK(threw);
}

int main() {
    std::cout << "Spectral analyzer test\n";
    test_frequency_map();
    test_silence_hits_floor();
    test_sine_peak();
    test_windows();
    test_fft_matches_dft();
    test_invalid_input();

    if (g_failures) {
        std::cout << g_failures << " check(s) failed\n";
        return 1;
    }
    std::cout << "All checks passed\n";
    return 0;
}
