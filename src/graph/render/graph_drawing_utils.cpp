#include <relgraph/graph/render/graph_drawing_utils.h>
#include <cfloat>  // For FLT_MAX
#include <cstring> // For strlen

namespace relgraph {
namespace graph {
namespace draw {

ImU32 ColorFromRgb(std::uint32_t rgb, int alpha) {
    return IM_COL32((rgb >> 16) & 0xff, (rgb >> 8) & 0xff, rgb & 0xff, alpha);
}

void AddTextCentered(ImDrawList* draw_list, ImFont* font, float font_size, const ImVec2& center, ImU32 col,
                     const char* text) {
    if (!text || text[0] == '\0' || font_size <= 0.0f || font == nullptr)
        return;

    const char* text_end = text + strlen(text);
    ImVec2 size = font->CalcTextSizeA(font_size, FLT_MAX, 0.0f, text, text_end);
    ImVec2 pos(center.x - size.x * 0.5f, center.y - size.y * 0.5f);
    draw_list->AddText(font, font_size, pos, col, text, text_end);
}

void AddTextBelow(ImDrawList* draw_list, ImFont* font, float font_size, const ImVec2& top_center, ImU32 col,
                  const char* text) {
    if (!text || text[0] == '\0' || font_size <= 0.0f || font == nullptr)
        return;

    const char* text_end = text + strlen(text);
    ImVec2 size = font->CalcTextSizeA(font_size, FLT_MAX, 0.0f, text, text_end);
    draw_list->AddText(font, font_size, ImVec2(top_center.x - size.x * 0.5f, top_center.y), col, text, text_end);
}

} // namespace draw
} // namespace graph
} // namespace relgraph
