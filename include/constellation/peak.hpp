#pragma once

#include <vector>

namespace constellation {

// One detected spectral peak. Immutable once created.
struct Peak {
    double frequency = 0.0;   // Hz, from the analyzer's bin mapping
    float magnitude = 0.0f;   // dB
    double timestamp = 0.0;   // seconds, stream clock
    int bin = 0;              // index into the spectrum that produced it
};

// A snapshot element: peak plus its age-derived fade in [min_fade, 1].
struct FadedPeak {
    Peak peak;
    float fade = 1.0f;
};

using PeakList = std::vector<Peak>;

} // namespace constellation
