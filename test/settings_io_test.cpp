#include "constellation_settings.hpp"
#include "constellation_settings_io.hpp"
#include <iostream>
#include <cmath>
#include <cstdio>
#include <string>

using namespace constellation;

static int g_failures = 0;

#define CHECK(cond) do { \
    if (!(cond)) { \
        std::cout << "  FAIL " << __LINE__ << ": " #cond "\n"; \
        ++g_failures; \
    } \
} while (0)

static const char* kPath = "settings_io_test.json";

static void test_round_trip() {
    std::cout << "round trip\n";
    ConstellationSettings st;
    st.sample_rate = 44100.0;
    st.frame_length = 2048;
    st.hop_length = 512;
    st.window_type = "blackman";
    st.floor_db = -90.0f;
    st.detection_mode = "adaptive";
    st.min_peak_height = -55.5f;
    st.min_peak_distance = 3;
    st.max_peaks_per_frame = 12;
    st.adaptive_window_size = 32;
    st.adaptive_offset_db = 7.5f;
    st.fade_horizon = 2.25;
    st.max_history = 150;
    st.min_fade = 0.05f;
    st.fingerprint_min_db = -35.0f;
    st.fingerprint_min_freq = 250.0;
    st.fingerprint_max_freq = 6000.0;
    st.norm_min_freq = 60.0;
    st.norm_max_freq = 10000.0;
    st.norm_log_weight = 0.6f;
    st.norm_min_db = -70.0f;
    st.norm_max_db = -5.0f;
    st.norm_magnitude_exponent = 0.9f;
    st.color_bands = 7;
    st.audio_device = "plughw:1,0";
    st.period_size = 256;

    CHECK(save_settings(kPath, st));
    ConstellationSettings back;
    CHECK(load_settings(kPath, back));

    CHECK(back.sample_rate == 44100.0);
    CHECK(back.frame_length == 2048);
    CHECK(back.hop_length == 512);
    CHECK(back.window_type == "blackman");
    CHECK(back.floor_db == -90.0f);
    CHECK(back.detection_mode == "adaptive");
    CHECK(std::fabs(back.min_peak_height - -55.5f) < 1e-4f);
    CHECK(back.min_peak_distance == 3);
    CHECK(back.max_peaks_per_frame == 12);
    CHECK(back.adaptive_window_size == 32);
    CHECK(std::fabs(back.adaptive_offset_db - 7.5f) < 1e-4f);
    CHECK(std::fabs(back.fade_horizon - 2.25) < 1e-9);
    CHECK(back.max_history == 150);
    CHECK(std::fabs(back.min_fade - 0.05f) < 1e-6f);
    CHECK(std::fabs(back.fingerprint_min_db - -35.0f) < 1e-4f);
    CHECK(std::fabs(back.fingerprint_min_freq - 250.0) < 1e-6);
    CHECK(std::fabs(back.fingerprint_max_freq - 6000.0) < 1e-6);
    CHECK(std::fabs(back.norm_min_freq - 60.0) < 1e-6);
    CHECK(std::fabs(back.norm_max_freq - 10000.0) < 1e-6);
    CHECK(std::fabs(back.norm_log_weight - 0.6f) < 1e-6f);
    CHECK(std::fabs(back.norm_min_db - -70.0f) < 1e-4f);
    CHECK(std::fabs(back.norm_max_db - -5.0f) < 1e-4f);
    CHECK(std::fabs(back.norm_magnitude_exponent - 0.9f) < 1e-6f);
    CHECK(back.color_bands == 7);
    CHECK(back.audio_device == "plughw:1,0");
    CHECK(back.period_size == 256);

    std::string error;
    CHECK(validate_settings(back, error));
    std::remove(kPath);
}

static void test_partial_and_missing() {
    std::cout << "partial / missing file\n";
    ConstellationSettings st;
    CHECK(!load_settings("does/not/exist.json", st));
    CHECK(st.frame_length == 4096);

    FILE* f = std::fopen(kPath, "wb");
    CHECK(f != nullptr);
    if (f) {
        std::fputs("{\n  \"frame_length\": 1024,\n  \"detection_mode\": \"adaptive\"\n}\n", f);
        std::fclose(f);
    }
    CHECK(load_settings(kPath, st));
    CHECK(st.frame_length == 1024);
    CHECK(st.detection_mode == "adaptive");
    // Untouched keys keep their defaults
    CHECK(st.hop_length == 4096);
    CHECK(st.max_history == 200);
    std::remove(kPath);
}

static void test_validation() {
    std::cout << "validation\n";
    std::string error;
    ConstellationSettings st;
    CHECK(validate_settings(st, error));
    CHECK(error.empty());

    auto rejected = [](const ConstellationSettings& s) {
        std::string e;
        const bool ok = validate_settings(s, e);
        if (!ok) std::cout << "  rejected: " << e << "\n";
        return !ok && !e.empty();
    };

    st = ConstellationSettings(); st.window_type = "kaiser";           CHECK(rejected(st));
    st = ConstellationSettings(); st.detection_mode = "both";          CHECK(rejected(st));
    st = ConstellationSettings(); st.frame_length = 3000; st.hop_length = 3000; CHECK(rejected(st));
    st = ConstellationSettings(); st.hop_length = 0;                   CHECK(rejected(st));
    st = ConstellationSettings(); st.hop_length = 8192;                CHECK(rejected(st));
    st = ConstellationSettings(); st.sample_rate = 0.0;                CHECK(rejected(st));
    st = ConstellationSettings(); st.min_peak_distance = 0;            CHECK(rejected(st));
    st = ConstellationSettings(); st.fade_horizon = -1.0;              CHECK(rejected(st));
    st = ConstellationSettings(); st.max_history = 5;                  CHECK(rejected(st));
    st = ConstellationSettings(); st.norm_max_db = -80.0f;             CHECK(rejected(st));
    st = ConstellationSettings(); st.color_bands = 0;                  CHECK(rejected(st));
    st = ConstellationSettings(); st.period_size = 0;                  CHECK(rejected(st));
    st = ConstellationSettings(); st.detection_mode = "adaptive"; st.adaptive_window_size = 0; CHECK(rejected(st));

    st = ConstellationSettings();
    st.detection_mode = "adaptive";
    PeakDetectorConfig dc = to_detector_config(st);
    CHECK(dc.mode == DetectionMode::Adaptive);
    st.window_type = "hamming";
    CHECK(to_analyzer_config(st).window == WindowType::Hamming);
}

int main() {
    std::cout << "Settings IO test\n";
    test_round_trip();
    test_partial_and_missing();
    test_validation();

    if (g_failures) {
        std::cout << g_failures << " check(s) failed\n";
        return 1;
    }
    std::cout << "All checks passed\n";
    return 0;
}
