#ifndef RELGRAPH_GRAPH_VIEW_NODE_STYLE_H
#define RELGRAPH_GRAPH_VIEW_NODE_STYLE_H

#include <relgraph/graph/model/graph_types.h>
#include <imgui.h>
#include <cstddef>
#include <cstdint>
#include <string>

namespace relgraph {
namespace graph {

enum class NodeShape {
    kCircle,
    kRoundedSquare
};

struct NodeStyle {
    NodeShape shape;
    std::uint32_t rgb;   // 0xRRGGBB
    float extent;        // Circle radius, or square side length
};

constexpr float kPersonRadius = 20.0f;
constexpr float kSquareSide = 35.0f;
constexpr float kSquareRounding = 5.0f;
constexpr std::size_t kMaxLabelLength = 15;
constexpr std::size_t kTruncatedLabelLength = 12;

NodeStyle StyleFor(NodeType type);

// True when world-space point lies inside the node's shape centered at center.
bool HitTest(NodeType type, const ImVec2& center, const ImVec2& point);

// Names longer than kMaxLabelLength become their first kTruncatedLabelLength
// characters followed by "...".
std::string TruncateLabel(const std::string& name);

} // namespace graph
} // namespace relgraph

#endif // RELGRAPH_GRAPH_VIEW_NODE_STYLE_H
