#ifndef RELGRAPH_GRAPH_RENDER_GRAPH_DRAWING_UTILS_H
#define RELGRAPH_GRAPH_RENDER_GRAPH_DRAWING_UTILS_H

#include <imgui.h>
#include <cstdint>

namespace relgraph {
namespace graph {
namespace draw {

// 0xRRGGBB to a packed ImGui color.
ImU32 ColorFromRgb(std::uint32_t rgb, int alpha = 255);

// Low-level ImDrawList helpers
void AddTextCentered(ImDrawList* draw_list, ImFont* font, float font_size, const ImVec2& center, ImU32 col,
                     const char* text);
void AddTextBelow(ImDrawList* draw_list, ImFont* font, float font_size, const ImVec2& top_center, ImU32 col,
                  const char* text);

} // namespace draw
} // namespace graph
} // namespace relgraph

#endif // RELGRAPH_GRAPH_RENDER_GRAPH_DRAWING_UTILS_H
