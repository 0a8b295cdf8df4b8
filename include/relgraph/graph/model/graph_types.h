#ifndef RELGRAPH_GRAPH_MODEL_GRAPH_TYPES_H
#define RELGRAPH_GRAPH_MODEL_GRAPH_TYPES_H

#include <imgui.h> // For ImVec2
#include <nlohmann/json.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace relgraph {
namespace graph {

using NodeId = std::string;

// Property bags keep the key order the backend sent them in.
using PropertyMap = nlohmann::ordered_json;

// Entity kinds the view knows how to draw. Every switch over NodeType must be
// exhaustive; labels outside the known set map to kOther.
enum class NodeType {
    kPerson,
    kCompany,
    kSocialMedia,
    kWebsite,
    kOrganization,
    kOther
};

NodeType ParseNodeType(std::string_view label);
const char* NodeTypeName(NodeType type);

// Node as delivered by the collaborator API, before validation.
struct RawNode {
    NodeId id;
    std::string name;
    std::string type;
    PropertyMap properties = PropertyMap::object();
    std::optional<ImVec2> position; // Optional seed position
};

struct RawLink {
    NodeId source;
    NodeId target;
    std::string type;
    PropertyMap properties = PropertyMap::object();
};

struct GraphData {
    std::vector<RawNode> nodes;
    std::vector<RawLink> links;
};

// Working copy of a node owned by a GraphModel.
struct Node {
    NodeId id;
    std::string name;
    NodeType type = NodeType::kOther;
    std::string type_label;          // Label as received, shown in the detail panel
    PropertyMap properties = PropertyMap::object();

    ImVec2 position;                 // Simulated position (world space)
    std::optional<ImVec2> pinned;    // When set, overrides integration (fx, fy)

    bool is_pinned() const { return pinned.has_value(); }
};

// Link with endpoints resolved to indices into GraphModel::nodes().
struct Link {
    NodeId source;
    NodeId target;
    std::size_t source_index = 0;
    std::size_t target_index = 0;
    std::string type;
    PropertyMap properties = PropertyMap::object();

    bool is_self_link() const { return source_index == target_index; }

    // `strength` property, 1 when absent or not a positive finite number.
    float Strength() const;
};

// Display form of a property value: strings unquoted, everything else as JSON.
std::string FormatPropertyValue(const nlohmann::ordered_json& value);

} // namespace graph
} // namespace relgraph

#endif // RELGRAPH_GRAPH_MODEL_GRAPH_TYPES_H
