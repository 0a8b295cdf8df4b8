#ifndef RELGRAPH_GRAPH_VIEW_INTERACTION_CONTROLLER_H
#define RELGRAPH_GRAPH_VIEW_INTERACTION_CONTROLLER_H

#include <relgraph/graph/layout/force_simulation.h>
#include <relgraph/graph/view/view_transform.h>
#include <imgui.h>
#include <cstddef>
#include <optional>

namespace relgraph {
namespace graph {

// Keys the view reacts to, independent of the windowing backend.
enum class ViewKey {
    kPlus,
    kEquals,
    kMinus,
    kZero,
    kEscape
};

/**
 * @brief Turns pointer and keyboard input into pins, selection and view changes.
 *
 * All positions are canvas-relative screen coordinates. The controller does
 * not own the simulation or the transform; the owning GraphView attaches the
 * current engine and detaches it before the engine is destroyed.
 */
class InteractionController {
public:
    static constexpr float kDragAlphaTarget = 0.3f;
    static constexpr float kClickSlop = 3.0f; // Pixels of travel before a press becomes a drag

    explicit InteractionController(ViewTransform& transform);

    // Attach a new engine (or nullptr). Cancels any gesture and clears the selection.
    void Attach(ForceSimulation* simulation);

    void OnPointerDown(const ImVec2& canvas_pos);
    void OnPointerMove(const ImVec2& canvas_pos);
    void OnPointerUp(const ImVec2& canvas_pos);
    void OnWheel(const ImVec2& canvas_pos, float wheel);
    void OnKey(ViewKey key, const ImVec2& canvas_size);

    void ZoomIn(const ImVec2& canvas_size) { transform_.ZoomIn(canvas_size); }
    void ZoomOut(const ImVec2& canvas_size) { transform_.ZoomOut(canvas_size); }
    void ResetView() { transform_.Reset(); }

    // Topmost node under the canvas position; later nodes draw above earlier ones.
    std::optional<std::size_t> NodeAt(const ImVec2& canvas_pos) const;

    bool Select(const NodeId& id);
    void ClearSelection() { selected_.reset(); }
    const std::optional<NodeId>& selected() const { return selected_; }
    const Node* SelectedNode() const;

    bool is_dragging_node() const { return gesture_ == Gesture::kNodeDrag; }
    bool is_panning() const { return gesture_ == Gesture::kBackgroundPan; }
    bool has_active_gesture() const { return gesture_ != Gesture::kNone; }

private:
    enum class Gesture {
        kNone,
        kNodePress,        // Pressed on a node, not yet moved past the slop
        kNodeDrag,
        kBackgroundPress,
        kBackgroundPan
    };

    bool MovedPastSlop(const ImVec2& canvas_pos) const;
    ImVec2 GrabbedPosition(const ImVec2& canvas_pos) const;
    void EndNodeGesture(const ImVec2& canvas_pos);

    ViewTransform& transform_;
    ForceSimulation* simulation_ = nullptr;

    Gesture gesture_ = Gesture::kNone;
    ImVec2 press_pos_;
    ImVec2 last_pos_;
    ImVec2 grab_offset_;     // Node position minus pointer world position at press
    NodeId active_node_;
    std::optional<NodeId> selected_;
};

} // namespace graph
} // namespace relgraph

#endif // RELGRAPH_GRAPH_VIEW_INTERACTION_CONTROLLER_H
