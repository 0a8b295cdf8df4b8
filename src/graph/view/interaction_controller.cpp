#include <relgraph/graph/view/interaction_controller.h>
#include <relgraph/graph/view/node_style.h>
#include <cmath>

namespace relgraph {
namespace graph {

namespace {
bool IsFinite(const ImVec2& p) {
    return std::isfinite(p.x) && std::isfinite(p.y);
}
} // namespace

InteractionController::InteractionController(ViewTransform& transform)
    : transform_(transform), press_pos_(0.0f, 0.0f), last_pos_(0.0f, 0.0f), grab_offset_(0.0f, 0.0f) {}

void InteractionController::Attach(ForceSimulation* simulation) {
    simulation_ = simulation;
    gesture_ = Gesture::kNone;
    active_node_.clear();
    selected_.reset();
}

std::optional<std::size_t> InteractionController::NodeAt(const ImVec2& canvas_pos) const {
    if (!simulation_ || !IsFinite(canvas_pos)) return std::nullopt;
    const ImVec2 world = transform_.ScreenToWorld(canvas_pos);
    const auto& nodes = simulation_->model().nodes();
    for (std::size_t i = nodes.size(); i-- > 0;) {
        if (HitTest(nodes[i].type, nodes[i].position, world)) return i;
    }
    return std::nullopt;
}

bool InteractionController::Select(const NodeId& id) {
    if (!simulation_ || !simulation_->model().FindNode(id)) return false;
    selected_ = id;
    return true;
}

const Node* InteractionController::SelectedNode() const {
    if (!simulation_ || !selected_) return nullptr;
    return simulation_->model().FindNode(*selected_);
}

ImVec2 InteractionController::GrabbedPosition(const ImVec2& canvas_pos) const {
    const ImVec2 world = transform_.ScreenToWorld(canvas_pos);
    return ImVec2(world.x + grab_offset_.x, world.y + grab_offset_.y);
}

bool InteractionController::MovedPastSlop(const ImVec2& canvas_pos) const {
    float dx = canvas_pos.x - press_pos_.x;
    float dy = canvas_pos.y - press_pos_.y;
    return dx * dx + dy * dy > kClickSlop * kClickSlop;
}

void InteractionController::OnPointerDown(const ImVec2& canvas_pos) {
    if (!IsFinite(canvas_pos)) return;
    press_pos_ = canvas_pos;
    last_pos_ = canvas_pos;

    auto hit = NodeAt(canvas_pos);
    if (!hit) {
        gesture_ = Gesture::kBackgroundPress;
        return;
    }

    const Node& node = simulation_->model().nodes()[*hit];
    active_node_ = node.id;
    const ImVec2 world = transform_.ScreenToWorld(canvas_pos);
    grab_offset_ = ImVec2(node.position.x - world.x, node.position.y - world.y);

    // Pinned where it is; the node follows the pointer keeping the grab offset.
    const ImVec2 pin = node.position;
    simulation_->SetAlphaTarget(kDragAlphaTarget);
    gesture_ = simulation_->Pin(active_node_, pin.x, pin.y) ? Gesture::kNodePress : Gesture::kNone;
}

void InteractionController::OnPointerMove(const ImVec2& canvas_pos) {
    if (!IsFinite(canvas_pos)) return;

    switch (gesture_) {
        case Gesture::kNone:
            break;
        case Gesture::kNodePress:
            if (MovedPastSlop(canvas_pos)) gesture_ = Gesture::kNodeDrag;
            [[fallthrough]];
        case Gesture::kNodeDrag: {
            const ImVec2 target = GrabbedPosition(canvas_pos);
            if (!simulation_ || !simulation_->Pin(active_node_, target.x, target.y)) {
                gesture_ = Gesture::kNone;
            }
            break;
        }
        case Gesture::kBackgroundPress:
            if (!MovedPastSlop(canvas_pos)) break;
            gesture_ = Gesture::kBackgroundPan;
            transform_.PanBy(ImVec2(canvas_pos.x - press_pos_.x, canvas_pos.y - press_pos_.y));
            break;
        case Gesture::kBackgroundPan:
            transform_.PanBy(ImVec2(canvas_pos.x - last_pos_.x, canvas_pos.y - last_pos_.y));
            break;
    }
    last_pos_ = canvas_pos;
}

void InteractionController::EndNodeGesture(const ImVec2& canvas_pos) {
    if (!simulation_) return;
    if (IsFinite(canvas_pos)) {
        const ImVec2 target = GrabbedPosition(canvas_pos);
        if (!simulation_->Pin(active_node_, target.x, target.y)) return;
    }
    // The node stays pinned where it was dropped.
    simulation_->SetAlphaTarget(0.0f);
}

void InteractionController::OnPointerUp(const ImVec2& canvas_pos) {
    switch (gesture_) {
        case Gesture::kNone:
            break;
        case Gesture::kNodePress:
            EndNodeGesture(canvas_pos);
            Select(active_node_);
            break;
        case Gesture::kNodeDrag:
            EndNodeGesture(canvas_pos);
            break;
        case Gesture::kBackgroundPress:
            ClearSelection();
            break;
        case Gesture::kBackgroundPan:
            break;
    }
    gesture_ = Gesture::kNone;
    active_node_.clear();
}

void InteractionController::OnWheel(const ImVec2& canvas_pos, float wheel) {
    transform_.ZoomAt(canvas_pos, wheel);
}

void InteractionController::OnKey(ViewKey key, const ImVec2& canvas_size) {
    switch (key) {
        case ViewKey::kPlus:
        case ViewKey::kEquals:
            ZoomIn(canvas_size);
            break;
        case ViewKey::kMinus:
            ZoomOut(canvas_size);
            break;
        case ViewKey::kZero:
            ResetView();
            break;
        case ViewKey::kEscape:
            ClearSelection();
            break;
    }
}

} // namespace graph
} // namespace relgraph
