#ifndef RELGRAPH_GRAPH_RENDER_GRAPH_RENDERER_H
#define RELGRAPH_GRAPH_RENDER_GRAPH_RENDERER_H

#include <relgraph/graph/layout/force_simulation.h>
#include <relgraph/graph/view/graph_view.h>
#include <imgui.h>

namespace relgraph {
namespace graph {

/**
 * @brief Dear ImGui front end for one GraphView.
 *
 * Draws the toolbar, error banner, canvas, detail panel and status line into
 * the current ImGui window, and forwards canvas input to the view's
 * InteractionController. Reads node positions through a snapshot taken after
 * the frame's ticks have run.
 */
class GraphRenderer {
public:
    explicit GraphRenderer(GraphView& view);

    void Render(const ImVec2& canvas_size);

private:
    void RenderToolbar();
    void RenderErrorBanner();
    void HandleInput(const ImVec2& canvas_pos, const ImVec2& canvas_size, bool canvas_hovered);
    void HandleKeys(const ImVec2& canvas_size);
    void RenderLinks(ImDrawList* draw_list, const ImVec2& canvas_pos, const LayoutSnapshot& snapshot);
    void RenderNodes(ImDrawList* draw_list, const ImVec2& canvas_pos, const LayoutSnapshot& snapshot);
    void RenderLoadingIndicator(ImDrawList* draw_list, const ImVec2& canvas_pos, const ImVec2& canvas_size);
    void RenderDetailPanel(const ImVec2& canvas_pos, const ImVec2& canvas_size);
    void RenderStatusLine();

    ImVec2 ToScreen(const ImVec2& canvas_pos, const ImVec2& world_pos) const;

    GraphView& view_;
    bool zoom_in_requested_ = false;   // Applied once the canvas size is known
    bool zoom_out_requested_ = false;
};

} // namespace graph
} // namespace relgraph

#endif // RELGRAPH_GRAPH_RENDER_GRAPH_RENDERER_H
