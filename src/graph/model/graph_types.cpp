#include <relgraph/graph/model/graph_types.h>
#include <cmath>

namespace relgraph {
namespace graph {

NodeType ParseNodeType(std::string_view label) {
    if (label == "person") return NodeType::kPerson;
    if (label == "company") return NodeType::kCompany;
    if (label == "social_media") return NodeType::kSocialMedia;
    if (label == "website") return NodeType::kWebsite;
    if (label == "organization") return NodeType::kOrganization;
    return NodeType::kOther;
}

const char* NodeTypeName(NodeType type) {
    switch (type) {
        case NodeType::kPerson: return "person";
        case NodeType::kCompany: return "company";
        case NodeType::kSocialMedia: return "social_media";
        case NodeType::kWebsite: return "website";
        case NodeType::kOrganization: return "organization";
        case NodeType::kOther: return "other";
    }
    return "other";
}

float Link::Strength() const {
    if (!properties.is_object()) return 1.0f;
    auto it = properties.find("strength");
    if (it == properties.end() || !it->is_number()) return 1.0f;
    double value = it->get<double>();
    if (!std::isfinite(value) || value <= 0.0) return 1.0f;
    return static_cast<float>(value);
}

std::string FormatPropertyValue(const nlohmann::ordered_json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_null()) return "null";
    return value.dump();
}

} // namespace graph
} // namespace relgraph
