#include "constellation_settings.hpp"
#include "constellation_settings_io.hpp"
#include <string>
#include <cstdlib>
#include <cstdio>
#include <cstring>

namespace constellation {

// Minimal flat JSON (hand-rolled). Expects a well-formed file like the one we write.
static const char* find_value(const char* s, const char* key) {
    const char* p = std::strstr(s, key);
    if (!p) return nullptr;
    p = std::strchr(p + std::strlen(key), ':'); if (!p) return nullptr;
    return p + 1;
}
static bool parse_key_value(const char* s, const char* key, double& out) {
    const char* p = find_value(s, key);
    if (!p) return false;
    char* end = nullptr;
    double v = std::strtod(p, &end);
    if (end == p) return false;
    out = v;
    return true;
}
static bool parse_key_value(const char* s, const char* key, float& out) {
    double v = 0.0;
    if (!parse_key_value(s, key, v)) return false;
    out = static_cast<float>(v);
    return true;
}
static bool parse_key_value(const char* s, const char* key, int& out) {
    const char* p = find_value(s, key);
    if (!p) return false;
    char* end = nullptr;
    long v = std::strtol(p, &end, 10);
    if (end == p) return false;
    out = static_cast<int>(v);
    return true;
}
static bool parse_key_value(const char* s, const char* key, std::string& out) {
    const char* p = find_value(s, key);
    if (!p) return false;
    while (*p == ' ' || *p == '\t') ++p;
    if (*p != '"') return false;
    ++p;
    const char* start = p;
    while (*p && *p != '"' && *p != '\n' && *p != '\r') ++p;
    out.assign(start, p - start);
    return true;
}

bool load_settings(const char* path, ConstellationSettings& st) {
    FILE* f = std::fopen(path, "rb");
    if (!f) return false;
    std::fseek(f, 0, SEEK_END);
    long sz = std::ftell(f);
    std::fseek(f, 0, SEEK_SET);
    if (sz <= 0 || sz > 1<<20) { std::fclose(f); return false; }
    std::string buf; buf.resize((size_t)sz);
    size_t n = std::fread(&buf[0], 1, (size_t)sz, f);
    std::fclose(f);
    if (n != (size_t)sz) return false;
    if (buf.find('{') == std::string::npos) return false;

    const char* s = buf.c_str();
    parse_key_value(s, "\"sample_rate\"", st.sample_rate);
    parse_key_value(s, "\"frame_length\"", st.frame_length);
    parse_key_value(s, "\"hop_length\"", st.hop_length);
    parse_key_value(s, "\"window_type\"", st.window_type);
    parse_key_value(s, "\"floor_db\"", st.floor_db);
    parse_key_value(s, "\"detection_mode\"", st.detection_mode);
    parse_key_value(s, "\"min_peak_height\"", st.min_peak_height);
    parse_key_value(s, "\"min_peak_distance\"", st.min_peak_distance);
    parse_key_value(s, "\"max_peaks_per_frame\"", st.max_peaks_per_frame);
    parse_key_value(s, "\"adaptive_window_size\"", st.adaptive_window_size);
    parse_key_value(s, "\"adaptive_offset_db\"", st.adaptive_offset_db);
    parse_key_value(s, "\"fade_horizon\"", st.fade_horizon);
    parse_key_value(s, "\"max_history\"", st.max_history);
    parse_key_value(s, "\"min_fade\"", st.min_fade);
    parse_key_value(s, "\"fingerprint_min_db\"", st.fingerprint_min_db);
    parse_key_value(s, "\"fingerprint_min_freq\"", st.fingerprint_min_freq);
    parse_key_value(s, "\"fingerprint_max_freq\"", st.fingerprint_max_freq);
    parse_key_value(s, "\"norm_min_freq\"", st.norm_min_freq);
    parse_key_value(s, "\"norm_max_freq\"", st.norm_max_freq);
    parse_key_value(s, "\"norm_log_weight\"", st.norm_log_weight);
    parse_key_value(s, "\"norm_min_db\"", st.norm_min_db);
    parse_key_value(s, "\"norm_max_db\"", st.norm_max_db);
    parse_key_value(s, "\"norm_magnitude_exponent\"", st.norm_magnitude_exponent);
    parse_key_value(s, "\"color_bands\"", st.color_bands);
    parse_key_value(s, "\"audio_device\"", st.audio_device);
    parse_key_value(s, "\"period_size\"", st.period_size);
    return true;
}

bool save_settings(const char* path, const ConstellationSettings& st) {
    FILE* f = std::fopen(path, "wb");
    if (!f) return false;
    int written = std::fprintf(f,
        "{\n"
        "  \"sample_rate\": %.3f,\n"
        "  \"frame_length\": %d,\n"
        "  \"hop_length\": %d,\n"
        "  \"window_type\": \"%s\",\n"
        "  \"floor_db\": %.3f,\n"

        "  \"detection_mode\": \"%s\",\n"
        "  \"min_peak_height\": %.3f,\n"
        "  \"min_peak_distance\": %d,\n"
        "  \"max_peaks_per_frame\": %d,\n"
        "  \"adaptive_window_size\": %d,\n"
        "  \"adaptive_offset_db\": %.3f,\n"

        "  \"fade_horizon\": %.6f,\n"
        "  \"max_history\": %d,\n"
        "  \"min_fade\": %.6f,\n"
        "  \"fingerprint_min_db\": %.3f,\n"
        "  \"fingerprint_min_freq\": %.3f,\n"
        "  \"fingerprint_max_freq\": %.3f,\n"

        "  \"norm_min_freq\": %.3f,\n"
        "  \"norm_max_freq\": %.3f,\n"
        "  \"norm_log_weight\": %.6f,\n"
        "  \"norm_min_db\": %.3f,\n"
        "  \"norm_max_db\": %.3f,\n"
        "  \"norm_magnitude_exponent\": %.6f,\n"
        "  \"color_bands\": %d,\n"

        "  \"audio_device\": \"%s\",\n"
        "  \"period_size\": %d\n"
        "}\n",
        st.sample_rate,
        st.frame_length,
        st.hop_length,
        st.window_type.c_str(),
        st.floor_db,
        st.detection_mode.c_str(),
        st.min_peak_height,
        st.min_peak_distance,
        st.max_peaks_per_frame,
        st.adaptive_window_size,
        st.adaptive_offset_db,
        st.fade_horizon,
        st.max_history,
        st.min_fade,
        st.fingerprint_min_db,
        st.fingerprint_min_freq,
        st.fingerprint_max_freq,
        st.norm_min_freq,
        st.norm_max_freq,
        st.norm_log_weight,
        st.norm_min_db,
        st.norm_max_db,
        st.norm_magnitude_exponent,
        st.color_bands,
        st.audio_device.c_str(),
        st.period_size);
    const int closed = std::fclose(f);
    return written > 0 && closed == 0;
}

} // namespace constellation
