// Constellation star-field renderer for ImGui
#pragma once

#include <imgui.h>
#include <vector>

#include "normalization.hpp"

namespace gui {

class ConstellationView {
public:
    // Options
    bool show_grid = true;
    bool show_glow = true;
    bool highlight_current = true;
    float min_star_px = 2.0f;
    float max_star_px = 7.0f;
    ImU32 background = IM_COL32(8, 8, 22, 255);

    ConstellationView();

    // Draw points within the given canvas. current marks the latest frame.
    void draw(ImDrawList* dl,
              const ImVec2& canvas_pos,
              float width,
              float height,
              const std::vector<constellation::ConstellationPoint>& points,
              const std::vector<constellation::ConstellationPoint>& current,
              const constellation::Normalizer& normalizer);

    struct BandColor { float r, g, b; };
    // One color per band, low frequency first; cycled if there are more bands
    const std::vector<BandColor>& palette() const { return palette_; }

private:
    std::vector<BandColor> palette_;

    ImU32 color_for(const constellation::ConstellationPoint& p, float alpha) const;
    void draw_grid(ImDrawList* dl, const ImVec2& p0, float width, float height,
                   const constellation::Normalizer& normalizer) const;

    static inline float clamp01(float v) { return v < 0.0f ? 0.0f : (v > 1.0f ? 1.0f : v); }
};

} // namespace gui
