#include <relgraph/graph/render/graph_renderer.h>
#include <relgraph/graph/render/graph_drawing_utils.h>
#include <relgraph/graph/view/node_style.h>
#include <algorithm>
#include <cfloat>
#include <cmath>
#include <string>

namespace relgraph {
namespace graph {

namespace {
const ImU32 kBackgroundColor = IM_COL32(17, 24, 39, 255);
const ImU32 kBorderColor = IM_COL32(100, 100, 100, 255);
const ImU32 kLinkColor = IM_COL32(0x55, 0x55, 0x55, 153);         // #555, opacity 0.6
const ImU32 kLinkLabelColor = IM_COL32(0xaa, 0xaa, 0xaa, 255);
const ImU32 kNodeStrokeColor = IM_COL32(255, 255, 255, 255);
const ImU32 kSelectedStrokeColor = IM_COL32(250, 204, 21, 255);
const ImU32 kNodeLabelColor = IM_COL32(255, 255, 255, 255);
const ImVec4 kErrorTextColor = ImVec4(0.94f, 0.27f, 0.27f, 1.0f);

constexpr float kNodeLabelFontSize = 12.0f;
constexpr float kLinkLabelFontSize = 10.0f;
constexpr float kNodeLabelOffset = 22.0f;  // World units below the node center
constexpr float kLinkLabelOffset = 5.0f;   // World units above the link midpoint
constexpr float kMinReadableFont = 4.0f;
constexpr float kDetailPanelWidth = 280.0f;
} // namespace

GraphRenderer::GraphRenderer(GraphView& view) : view_(view) {}

ImVec2 GraphRenderer::ToScreen(const ImVec2& canvas_pos, const ImVec2& world_pos) const {
    ImVec2 p = view_.transform().WorldToScreen(world_pos);
    return ImVec2(canvas_pos.x + p.x, canvas_pos.y + p.y);
}

void GraphRenderer::Render(const ImVec2& requested_canvas_size) {
    RenderToolbar();
    RenderErrorBanner();

    ImVec2 canvas_pos = ImGui::GetCursorScreenPos();
    ImVec2 avail = ImGui::GetContentRegionAvail();
    ImVec2 canvas_size(std::min(requested_canvas_size.x, avail.x),
                       std::min(requested_canvas_size.y, avail.y - ImGui::GetTextLineHeightWithSpacing()));
    if (canvas_size.x < 50.0f) canvas_size.x = 50.0f;
    if (canvas_size.y < 50.0f) canvas_size.y = 50.0f;
    ImVec2 canvas_end(canvas_pos.x + canvas_size.x, canvas_pos.y + canvas_size.y);

    // Toolbar zoom keeps the center of the canvas actually drawn fixed.
    if (zoom_in_requested_) view_.interaction().ZoomIn(canvas_size);
    if (zoom_out_requested_) view_.interaction().ZoomOut(canvas_size);
    zoom_in_requested_ = false;
    zoom_out_requested_ = false;

    ImDrawList* draw_list = ImGui::GetWindowDrawList();
    draw_list->AddRectFilled(canvas_pos, canvas_end, kBackgroundColor);
    draw_list->AddRect(canvas_pos, canvas_end, kBorderColor);

    ImGui::InvisibleButton("##graph_canvas", canvas_size, ImGuiButtonFlags_MouseButtonLeft);
    bool canvas_hovered = ImGui::IsItemHovered();
    HandleInput(canvas_pos, canvas_size, canvas_hovered);

    draw_list->PushClipRect(canvas_pos, canvas_end, true);
    if (view_.IsLoading()) {
        RenderLoadingIndicator(draw_list, canvas_pos, canvas_size);
    } else if (const ForceSimulation* simulation = view_.simulation()) {
        LayoutSnapshot snapshot = simulation->Snapshot();
        RenderLinks(draw_list, canvas_pos, snapshot);
        RenderNodes(draw_list, canvas_pos, snapshot);
    }
    draw_list->PopClipRect();

    RenderStatusLine();

    if (!view_.IsLoading()) {
        RenderDetailPanel(canvas_pos, canvas_size);
    }
}

void GraphRenderer::RenderToolbar() {
    ImGui::TextUnformatted("Relationship Graph");
    ImGui::SameLine();
    if (ImGui::SmallButton("Zoom in")) {
        zoom_in_requested_ = true;
    }
    ImGui::SameLine();
    if (ImGui::SmallButton("Zoom out")) {
        zoom_out_requested_ = true;
    }
    ImGui::SameLine();
    if (ImGui::SmallButton("Refresh")) {
        view_.Refresh();
    }
    ImGui::SameLine();
    ImGui::TextDisabled("%.0f%%", view_.transform().scale() * 100.0f);
}

void GraphRenderer::RenderErrorBanner() {
    if (view_.error().empty()) return;
    ImGui::PushStyleColor(ImGuiCol_Text, kErrorTextColor);
    ImGui::TextUnformatted(view_.error().c_str());
    ImGui::PopStyleColor();
    ImGui::SameLine();
    if (ImGui::SmallButton("Dismiss")) {
        view_.DismissError();
    }
}

void GraphRenderer::HandleInput(const ImVec2& canvas_pos, const ImVec2& canvas_size, bool canvas_hovered) {
    ImGuiIO& io = ImGui::GetIO();
    InteractionController& interaction = view_.interaction();
    ImVec2 mouse(io.MousePos.x - canvas_pos.x, io.MousePos.y - canvas_pos.y);

    if (canvas_hovered && ImGui::IsMouseClicked(ImGuiMouseButton_Left)) {
        interaction.OnPointerDown(mouse);
    }
    if (interaction.has_active_gesture()) {
        if (io.MouseDelta.x != 0.0f || io.MouseDelta.y != 0.0f) {
            interaction.OnPointerMove(mouse);
        }
        if (ImGui::IsMouseReleased(ImGuiMouseButton_Left)) {
            interaction.OnPointerUp(mouse);
        }
    }
    if (canvas_hovered && io.MouseWheel != 0.0f) {
        interaction.OnWheel(mouse, io.MouseWheel);
    }

    if (ImGui::IsWindowFocused(ImGuiFocusedFlags_RootAndChildWindows) && !io.WantTextInput && !io.KeyCtrl) {
        HandleKeys(canvas_size);
    }
}

void GraphRenderer::HandleKeys(const ImVec2& canvas_size) {
    InteractionController& interaction = view_.interaction();
    ImGuiIO& io = ImGui::GetIO();

    if (ImGui::IsKeyPressed(ImGuiKey_KeypadAdd, false)) {
        interaction.OnKey(ViewKey::kPlus, canvas_size);
    } else if (ImGui::IsKeyPressed(ImGuiKey_Equal, false)) {
        interaction.OnKey(io.KeyShift ? ViewKey::kPlus : ViewKey::kEquals, canvas_size);
    } else if (ImGui::IsKeyPressed(ImGuiKey_Minus, false) || ImGui::IsKeyPressed(ImGuiKey_KeypadSubtract, false)) {
        interaction.OnKey(ViewKey::kMinus, canvas_size);
    } else if (ImGui::IsKeyPressed(ImGuiKey_0, false) || ImGui::IsKeyPressed(ImGuiKey_Keypad0, false)) {
        interaction.OnKey(ViewKey::kZero, canvas_size);
    } else if (ImGui::IsKeyPressed(ImGuiKey_Escape, false)) {
        interaction.OnKey(ViewKey::kEscape, canvas_size);
    }
}

void GraphRenderer::RenderLinks(ImDrawList* draw_list, const ImVec2& canvas_pos, const LayoutSnapshot& snapshot) {
    const ForceSimulation* simulation = view_.simulation();
    const float scale = view_.transform().scale();
    ImFont* font = ImGui::GetFont();
    const float label_font_size = kLinkLabelFontSize * scale;

    for (const Link& link : simulation->model().links()) {
        if (link.is_self_link()) continue;
        const ImVec2& s = snapshot.positions[link.source_index];
        const ImVec2& t = snapshot.positions[link.target_index];
        ImVec2 p1 = ToScreen(canvas_pos, s);
        ImVec2 p2 = ToScreen(canvas_pos, t);

        float thickness = std::max(1.0f, std::sqrt(link.Strength() * 2.0f) * scale);
        draw_list->AddLine(p1, p2, kLinkColor, thickness);

        if (!link.type.empty() && label_font_size >= kMinReadableFont) {
            ImVec2 mid((s.x + t.x) * 0.5f, (s.y + t.y) * 0.5f - kLinkLabelOffset);
            draw::AddTextCentered(draw_list, font, label_font_size, ToScreen(canvas_pos, mid), kLinkLabelColor,
                                  link.type.c_str());
        }
    }
}

void GraphRenderer::RenderNodes(ImDrawList* draw_list, const ImVec2& canvas_pos, const LayoutSnapshot& snapshot) {
    const ForceSimulation* simulation = view_.simulation();
    const auto& nodes = simulation->model().nodes();
    const float scale = view_.transform().scale();
    ImFont* font = ImGui::GetFont();
    const float label_font_size = kNodeLabelFontSize * scale;
    const auto& selected = view_.interaction().selected();

    for (std::size_t i = 0; i < nodes.size(); ++i) {
        const Node& node = nodes[i];
        const NodeStyle style = StyleFor(node.type);
        const ImVec2 center = ToScreen(canvas_pos, snapshot.positions[i]);
        const ImU32 fill = draw::ColorFromRgb(style.rgb);
        const bool is_selected = selected && *selected == node.id;
        const ImU32 stroke = is_selected ? kSelectedStrokeColor : kNodeStrokeColor;
        const float stroke_width = is_selected ? 3.0f : 1.5f;

        switch (style.shape) {
            case NodeShape::kCircle: {
                float radius = style.extent * scale;
                draw_list->AddCircleFilled(center, radius, fill);
                draw_list->AddCircle(center, radius, stroke, 0, stroke_width);
                break;
            }
            case NodeShape::kRoundedSquare: {
                float half = style.extent * 0.5f * scale;
                ImVec2 min(center.x - half, center.y - half);
                ImVec2 max(center.x + half, center.y + half);
                draw_list->AddRectFilled(min, max, fill, kSquareRounding * scale);
                draw_list->AddRect(min, max, stroke, kSquareRounding * scale, 0, stroke_width);
                break;
            }
        }

        if (label_font_size >= kMinReadableFont) {
            std::string label = TruncateLabel(node.name);
            ImVec2 label_world(snapshot.positions[i].x, snapshot.positions[i].y + kNodeLabelOffset);
            draw::AddTextBelow(draw_list, font, label_font_size, ToScreen(canvas_pos, label_world), kNodeLabelColor,
                               label.c_str());
        }
    }
}

void GraphRenderer::RenderLoadingIndicator(ImDrawList* draw_list, const ImVec2& canvas_pos, const ImVec2& canvas_size) {
    ImVec2 center(canvas_pos.x + canvas_size.x * 0.5f, canvas_pos.y + canvas_size.y * 0.5f);
    const float radius = 16.0f;
    const float start = static_cast<float>(ImGui::GetTime()) * 6.0f;
    draw_list->PathArcTo(center, radius, start, start + 4.5f, 32);
    draw_list->PathStroke(draw::ColorFromRgb(0x60a5fa), 0, 3.0f);
}

void GraphRenderer::RenderDetailPanel(const ImVec2& canvas_pos, const ImVec2& canvas_size) {
    const Node* node = view_.interaction().SelectedNode();
    if (!node) return;

    ImGui::SetNextWindowPos(ImVec2(canvas_pos.x + canvas_size.x - kDetailPanelWidth - 16.0f, canvas_pos.y + 16.0f),
                            ImGuiCond_Always);
    ImGui::SetNextWindowSize(ImVec2(kDetailPanelWidth, 0.0f), ImGuiCond_Always);
    const ImGuiWindowFlags flags = ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoMove |
                                   ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoSavedSettings |
                                   ImGuiWindowFlags_NoTitleBar;
    if (ImGui::Begin("Node Details", nullptr, flags)) {
        ImGui::TextWrapped("%s", node->name.c_str());
        ImGui::TextDisabled("Type: %s", node->type_label.empty() ? NodeTypeName(node->type) : node->type_label.c_str());
        ImGui::Separator();
        for (auto it = node->properties.begin(); it != node->properties.end(); ++it) {
            std::string value = FormatPropertyValue(it.value());
            ImGui::TextDisabled("%s:", it.key().c_str());
            ImGui::SameLine();
            ImGui::TextWrapped("%s", value.c_str());
        }
        if (ImGui::Button("Close", ImVec2(-FLT_MIN, 0.0f))) {
            view_.interaction().ClearSelection();
        }
    }
    ImGui::End();
}

void GraphRenderer::RenderStatusLine() {
    std::string status = view_.StatusLine();
    ImGui::TextDisabled("%s", status.c_str());
}

} // namespace graph
} // namespace relgraph
