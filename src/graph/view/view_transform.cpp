#include <relgraph/graph/view/view_transform.h>
#include <algorithm>
#include <cmath>

namespace relgraph {
namespace graph {

namespace {
bool IsFinite(const ImVec2& p) {
    return std::isfinite(p.x) && std::isfinite(p.y);
}
} // namespace

ViewTransform::ViewTransform(const ViewSettings& settings)
    : settings_(settings), scale_(1.0f), translation_(0.0f, 0.0f) {
    if (!(settings_.min_scale > 0.0f)) settings_.min_scale = 0.1f;
    if (!(settings_.max_scale >= settings_.min_scale)) settings_.max_scale = settings_.min_scale;
    scale_ = ClampScale(1.0f);
}

float ViewTransform::ClampScale(float scale) const {
    return std::max(settings_.min_scale, std::min(scale, settings_.max_scale));
}

ImVec2 ViewTransform::WorldToScreen(const ImVec2& world_pos) const {
    return ImVec2((world_pos.x * scale_) + translation_.x,
                  (world_pos.y * scale_) + translation_.y);
}

ImVec2 ViewTransform::ScreenToWorld(const ImVec2& screen_pos) const {
    return ImVec2((screen_pos.x - translation_.x) / scale_,
                  (screen_pos.y - translation_.y) / scale_);
}

void ViewTransform::SetScale(float scale, const ImVec2& pivot) {
    if (!std::isfinite(scale) || !IsFinite(pivot)) return;
    float new_scale = ClampScale(scale);
    float factor = new_scale / scale_;
    translation_.x = (translation_.x - pivot.x) * factor + pivot.x;
    translation_.y = (translation_.y - pivot.y) * factor + pivot.y;
    scale_ = new_scale;
}

void ViewTransform::ZoomIn(const ImVec2& canvas_size) {
    SetScale(scale_ + settings_.zoom_step, ImVec2(canvas_size.x * 0.5f, canvas_size.y * 0.5f));
}

void ViewTransform::ZoomOut(const ImVec2& canvas_size) {
    SetScale(scale_ - settings_.zoom_step, ImVec2(canvas_size.x * 0.5f, canvas_size.y * 0.5f));
}

void ViewTransform::ZoomAt(const ImVec2& pivot, float wheel) {
    if (!std::isfinite(wheel) || wheel == 0.0f) return;
    float zoom_factor = std::max(0.01f, 1.0f + wheel * settings_.wheel_sensitivity);
    SetScale(scale_ * zoom_factor, pivot);
}

void ViewTransform::PanBy(const ImVec2& delta) {
    if (!IsFinite(delta)) return;
    translation_.x += delta.x;
    translation_.y += delta.y;
}

void ViewTransform::Reset() {
    scale_ = ClampScale(1.0f);
    translation_ = ImVec2(0.0f, 0.0f);
}

} // namespace graph
} // namespace relgraph
