#include "constellation_view.hpp"
#include <cmath>
#include <cstdio>

using constellation::ConstellationPoint;
using constellation::Normalizer;

namespace gui {

ConstellationView::ConstellationView() {
    palette_ = {
        {0.80f, 0.40f, 0.60f},   // purple-red
        {1.00f, 0.60f, 0.40f},   // red-orange
        {1.00f, 0.80f, 0.60f},   // orange
        {1.00f, 1.00f, 0.80f},   // yellow-white
        {0.80f, 0.90f, 1.00f},   // blue-white
    };
}

ImU32 ConstellationView::color_for(const ConstellationPoint& p, float alpha) const {
    const BandColor& c = palette_[static_cast<size_t>(p.band < 0 ? 0 : p.band) % palette_.size()];
    const float a = clamp01(alpha);
    return IM_COL32((int)(c.r*255), (int)(c.g*255), (int)(c.b*255), (int)(a*255));
}

void ConstellationView::draw_grid(ImDrawList* dl, const ImVec2& p0, float width, float height,
                                  const Normalizer& normalizer) const {
    const ImU32 line = IM_COL32(60, 60, 90, 120);
    const ImU32 text = IM_COL32(140, 140, 170, 200);
    const auto& cfg = normalizer.config();

    static const double freqs[] = {100.0, 250.0, 500.0, 1000.0, 2000.0, 4000.0, 8000.0};
    for (double f : freqs) {
        if (f < cfg.min_freq || f > cfg.max_freq) continue;
        const float x = p0.x + normalizer.frequency_position(f) * width;
        dl->AddLine(ImVec2(x, p0.y), ImVec2(x, p0.y + height), line, 1.0f);
        char buf[16];
        if (f >= 1000.0) snprintf(buf, sizeof(buf), "%.0fk", f / 1000.0);
        else snprintf(buf, sizeof(buf), "%.0f", f);
        dl->AddText(ImVec2(x + 3.0f, p0.y + height - ImGui::GetFontSize() - 2.0f), text, buf);
    }

    for (float db = std::ceil(cfg.min_db / 10.0f) * 10.0f; db <= cfg.max_db; db += 10.0f) {
        const float y = p0.y + (1.0f - normalizer.magnitude_position(db)) * height;
        dl->AddLine(ImVec2(p0.x, y), ImVec2(p0.x + width, y), line, 1.0f);
        char buf[16];
        snprintf(buf, sizeof(buf), "%.0f dB", db);
        dl->AddText(ImVec2(p0.x + 3.0f, y + 1.0f), text, buf);
    }
}

void ConstellationView::draw(ImDrawList* dl,
                             const ImVec2& canvas_pos,
                             float width,
                             float height,
                             const std::vector<ConstellationPoint>& points,
                             const std::vector<ConstellationPoint>& current,
                             const Normalizer& normalizer) {
    if (!dl || width <= 0 || height <= 0 || palette_.empty()) return;

    const ImVec2 p0 = canvas_pos;
    const ImVec2 p1 = ImVec2(canvas_pos.x + width, canvas_pos.y + height);
    dl->AddRectFilled(p0, p1, background);
    dl->AddRect(p0, p1, IM_COL32(60,60,60,255));

    ImGui::PushClipRect(p0, p1, true);

    if (show_grid) draw_grid(dl, p0, width, height, normalizer);

    auto to_screen = [&](const ConstellationPoint& p) {
        return ImVec2(p0.x + p.x * width, p0.y + (1.0f - p.y) * height);
    };
    auto radius_for = [&](const ConstellationPoint& p) {
        return min_star_px + clamp01(p.size) * (max_star_px - min_star_px);
    };

    // Oldest first so fresh stars end up on top
    for (const auto& p : points) {
        const ImVec2 c = to_screen(p);
        const float r = radius_for(p);
        if (show_glow) dl->AddCircleFilled(c, r * 2.5f, color_for(p, p.intensity * 0.15f));
        dl->AddCircleFilled(c, r, color_for(p, p.intensity));
    }

    if (highlight_current) {
        for (const auto& p : current) {
            dl->AddCircle(to_screen(p), radius_for(p) + 3.0f, IM_COL32(255,255,255,200), 0, 1.5f);
        }
    }

    ImGui::PopClipRect();
}

} // namespace gui
