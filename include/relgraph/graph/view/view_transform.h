#ifndef RELGRAPH_GRAPH_VIEW_VIEW_TRANSFORM_H
#define RELGRAPH_GRAPH_VIEW_VIEW_TRANSFORM_H

#include <imgui.h>

namespace relgraph {
namespace graph {

// Zoom limits shared by buttons, wheel and keyboard.
struct ViewSettings {
    float min_scale = 0.1f;
    float max_scale = 4.0f;
    float zoom_step = 0.2f;          // Additive step for the zoom buttons and keys
    float wheel_sensitivity = 0.1f;  // Wheel zoom factor is 1 + sensitivity * wheel
};

/**
 * @brief Scale + translation from simulation (world) space to canvas space.
 *
 * Canvas space is relative to the canvas origin; the renderer adds the
 * canvas' absolute screen position. Every zoom path goes through ClampScale,
 * so scale always stays within [min_scale, max_scale].
 */
class ViewTransform {
public:
    explicit ViewTransform(const ViewSettings& settings = ViewSettings());

    ImVec2 WorldToScreen(const ImVec2& world_pos) const;
    ImVec2 ScreenToWorld(const ImVec2& screen_pos) const;

    // Additive zoom by +/- zoom_step keeping the canvas center fixed.
    void ZoomIn(const ImVec2& canvas_size);
    void ZoomOut(const ImVec2& canvas_size);

    /**
     * @brief Multiplicative wheel zoom
     * @param pivot Canvas-space point that stays under the pointer
     * @param wheel Wheel delta; positive zooms in
     */
    void ZoomAt(const ImVec2& pivot, float wheel);

    // Set the scale directly, keeping pivot fixed.
    void SetScale(float scale, const ImVec2& pivot);

    void PanBy(const ImVec2& delta);
    void Reset();

    float scale() const { return scale_; }
    const ImVec2& translation() const { return translation_; }
    const ViewSettings& settings() const { return settings_; }

private:
    float ClampScale(float scale) const;

    ViewSettings settings_;
    float scale_ = 1.0f;
    ImVec2 translation_;
};

} // namespace graph
} // namespace relgraph

#endif // RELGRAPH_GRAPH_VIEW_VIEW_TRANSFORM_H
