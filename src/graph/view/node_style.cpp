#include <relgraph/graph/view/node_style.h>
#include <cmath>

namespace relgraph {
namespace graph {

NodeStyle StyleFor(NodeType type) {
    switch (type) {
        case NodeType::kPerson:       return NodeStyle{NodeShape::kCircle, 0x60a5fa, kPersonRadius};
        case NodeType::kCompany:      return NodeStyle{NodeShape::kRoundedSquare, 0x34d399, kSquareSide};
        case NodeType::kSocialMedia:  return NodeStyle{NodeShape::kRoundedSquare, 0xf87171, kSquareSide};
        case NodeType::kWebsite:      return NodeStyle{NodeShape::kRoundedSquare, 0xa78bfa, kSquareSide};
        case NodeType::kOrganization: return NodeStyle{NodeShape::kRoundedSquare, 0xfbbf24, kSquareSide};
        case NodeType::kOther:        return NodeStyle{NodeShape::kRoundedSquare, 0x9ca3af, kSquareSide};
    }
    return NodeStyle{NodeShape::kRoundedSquare, 0x9ca3af, kSquareSide};
}

bool HitTest(NodeType type, const ImVec2& center, const ImVec2& point) {
    const NodeStyle style = StyleFor(type);
    float dx = point.x - center.x;
    float dy = point.y - center.y;
    switch (style.shape) {
        case NodeShape::kCircle:
            return dx * dx + dy * dy <= style.extent * style.extent;
        case NodeShape::kRoundedSquare: {
            float half = style.extent * 0.5f;
            return std::fabs(dx) <= half && std::fabs(dy) <= half;
        }
    }
    return false;
}

std::string TruncateLabel(const std::string& name) {
    if (name.size() <= kMaxLabelLength) return name;
    return name.substr(0, kTruncatedLabelLength) + "...";
}

} // namespace graph
} // namespace relgraph
