#include "constellation_store.hpp"
#include <iostream>
#include <cmath>
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

static Peak make_peak(double freq, float mag, double t, int bin = 0) {
    Peak p;
    p.frequency = freq;
    p.magnitude = mag;
    p.timestamp = t;
    p.bin = bin;
    return p;
}

static void test_fade_horizon() {
    std::cout << "fade horizon\n";
    StoreConfig cfg;
    cfg.fade_horizon = 3.0;
    cfg.min_fade = 0.1f;
    ConstellationStore store(cfg);
    store.admit({make_peak(1000.0, -30.0f, 0.0)}, 0.0);

    std::vector<FadedPeak> snap = store.snapshot(2.9);
    CHECK(snap.size() == 1);
    if (!snap.empty()) {
        // 1 - 2.9/3 = 0.033, raised to min_fade
        CHECK(std::fabs(snap[0].fade - 0.1f) < 1e-6f);
        CHECK(snap[0].peak.frequency == 1000.0);
    }

    CHECK(store.snapshot(3.1).empty());

    // With no floor the raw linear value comes through
    cfg.min_fade = 0.0f;
    ConstellationStore raw(cfg);
    raw.admit({make_peak(1000.0, -30.0f, 0.0)}, 0.0);
    snap = raw.snapshot(2.9);
    CHECK(snap.size() == 1);
    if (!snap.empty()) CHECK(std::fabs(snap[0].fade - 0.0333333f) < 1e-4f);
}

static void test_fade_monotonic() {
    std::cout << "fade monotonic\n";
    ConstellationStore store;
    CHECK(store.fade_for_age(0.0) == 1.0f);
    CHECK(store.fade_for_age(-1.0) == 1.0f);
    float prev = 1.0f;
    bool monotonic = true;
    for (int i = 0; i <= 300; ++i) {
        const float f = store.fade_for_age(i * 0.01);
        if (f > prev || f < store.config().min_fade || f > 1.0f) monotonic = false;
        prev = f;
    }
    CHECK(monotonic);
    CHECK(std::fabs(store.fade_for_age(1.5) - 0.5f) < 1e-6f);
}

static void test_age_eviction() {
    std::cout << "age eviction\n";
    ConstellationStore store;
    store.admit({make_peak(500.0, -20.0f, 0.0), make_peak(600.0, -25.0f, 0.0)}, 0.0);
    store.admit({make_peak(700.0, -20.0f, 2.0)}, 2.0);
    CHECK(store.size() == 3);

    store.prune(3.5);
    CHECK(store.size() == 1);
    std::vector<FadedPeak> snap = store.snapshot(3.5);
    CHECK(snap.size() == 1 && snap[0].peak.frequency == 700.0);

    // Boundary: age exactly at the horizon is still live
    store.prune(5.0);
    CHECK(store.size() == 1);
    store.prune(5.0001);
    CHECK(store.size() == 0);

    // Pruning twice at the same time changes nothing
    store.admit({make_peak(800.0, -20.0f, 10.0)}, 10.0);
    store.prune(11.0);
    const size_t once = store.size();
    store.prune(11.0);
    CHECK(store.size() == once);

    ConstellationStore::Stats st = store.stats();
    CHECK(st.admitted == 4);
    CHECK(st.evicted_by_age == 3);
    CHECK(st.evicted_by_capacity == 0);
}

static void test_capacity_eviction() {
    std::cout << "capacity eviction\n";
    StoreConfig cfg;
    cfg.max_history = 5;
    ConstellationStore store(cfg);
    for (int i = 0; i < 8; ++i) {
        store.admit({make_peak(100.0 * (i + 1), -20.0f, 0.01 * i, i)}, 0.01 * i);
        CHECK(store.size() <= 5);
    }
    CHECK(store.size() == 5);

    // Oldest inserted go first
    std::vector<FadedPeak> snap = store.snapshot(0.1);
    CHECK(snap.size() == 5);
    if (snap.size() == 5) {
        CHECK(snap.front().peak.bin == 3);
        CHECK(snap.back().peak.bin == 7);
    }
    CHECK(store.stats().evicted_by_capacity == 3);

    // One batch bigger than the cap keeps its tail
    store.admit({make_peak(1.0, -1.0f, 1.0, 10), make_peak(2.0, -1.0f, 1.0, 11),
                 make_peak(3.0, -1.0f, 1.0, 12), make_peak(4.0, -1.0f, 1.0, 13),
                 make_peak(5.0, -1.0f, 1.0, 14), make_peak(6.0, -1.0f, 1.0, 15)}, 1.0);
    snap = store.snapshot(1.0);
    CHECK(snap.size() == 5);
    if (!snap.empty()) CHECK(snap.front().peak.bin == 11);
}

static void test_out_of_order() {
    std::cout << "out of order timestamps\n";
    ConstellationStore store;
    store.admit({make_peak(100.0, -20.0f, 5.0)}, 5.0);
    store.admit({make_peak(200.0, -20.0f, 1.0)}, 1.0);   // late arrival
    store.admit({make_peak(300.0, -20.0f, 4.0)}, 4.0);

    // 1.0 is past the horizon at 5.0 even though it is not at the front
    store.prune(5.0);
    std::vector<FadedPeak> snap = store.snapshot(5.0);
    CHECK(snap.size() == 2);
    for (const auto& fp : snap) CHECK(fp.peak.frequency != 200.0);
}

static void test_current_and_fingerprint() {
    std::cout << "current / fingerprint\n";
    ConstellationStore store;
    store.admit({make_peak(440.0, -20.0f, 0.0), make_peak(880.0, -30.0f, 0.0)}, 0.0);
    store.admit({make_peak(1000.0, -35.0f, 0.5)}, 0.5);

    PeakList cur = store.current();
    CHECK(cur.size() == 1 && cur[0].frequency == 1000.0);

    store.admit({}, 0.6);
    CHECK(store.current().empty());
    CHECK(store.size() == 3);

    store.admit({make_peak(100.0, -10.0f, 0.7),     // too low
                 make_peak(9000.0, -10.0f, 0.7),    // too high
                 make_peak(2000.0, -45.0f, 0.7),    // too quiet
                 make_peak(3000.0, -15.0f, 0.7)}, 0.7);
    PeakList fp = store.fingerprint_peaks(0.7);
    int in_band = 0;
    for (const auto& p : fp) {
        CHECK(p.magnitude > -40.0f && p.frequency > 300.0 && p.frequency < 8000.0);
        ++in_band;
    }
    // 440, 880, 1000 and 3000
    CHECK(in_band == 4);
    CHECK(store.fingerprint_peaks(10.0).empty());
}

static void test_snapshot_independent() {
    std::cout << "snapshot independence\n";
    ConstellationStore store;
    store.admit({make_peak(440.0, -20.0f, 0.0)}, 0.0);
    std::vector<FadedPeak> snap = store.snapshot(0.0);
    store.admit({make_peak(880.0, -20.0f, 0.1)}, 0.1);
    store.prune(100.0);
    CHECK(snap.size() == 1 && snap[0].peak.frequency == 440.0);
    CHECK(store.size() == 0);
}

static void test_invalid_config() {
    std::cout << "invalid config\n";
    auto throws = [](const StoreConfig& cfg) {
        try { ConstellationStore s(cfg); } catch (const std::invalid_argument&) { return true; }
        return false;
    };
    StoreConfig cfg;
    cfg.fade_horizon = 0.0;
    CHECK(throws(cfg));
    cfg = StoreConfig();
    cfg.max_history = 0;
    CHECK(throws(cfg));
    cfg = StoreConfig();
    cfg.min_fade = 1.5f;
    CHECK(throws(cfg));
    CHECK(!throws(StoreConfig()));
}

int main() {
    std::cout << "Constellation store test\n";
    test_fade_horizon();
    test_fade_monotonic();
    test_age_eviction();
    test_capacity_eviction();
    test_out_of_order();
    test_current_and_fingerprint();
    test_snapshot_independent();
    test_invalid_config();

    if (g_failures) {
        std::cout << g_failures << " check(s) failed\n";
        return 1;
    }
    std::cout << "All checks passed\n";
    return 0;
}
