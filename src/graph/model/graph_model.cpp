#include <relgraph/graph/model/graph_model.h>
#include <cmath>
#include <iostream>

namespace relgraph {
namespace graph {

bool GraphModel::FindNodeIndex(const NodeId& id, std::size_t& index) const {
    auto it = index_by_id_.find(id);
    if (it == index_by_id_.end()) return false;
    index = it->second;
    return true;
}

const Node* GraphModel::FindNode(const NodeId& id) const {
    std::size_t index = 0;
    if (!FindNodeIndex(id, index)) return nullptr;
    return &nodes_[index];
}

GraphModel BuildModel(const std::vector<RawNode>& raw_nodes,
                      const std::vector<RawLink>& raw_links,
                      LinkPolicy policy) {
    GraphModel model;
    model.nodes_.reserve(raw_nodes.size());
    model.links_.reserve(raw_links.size());
    model.index_by_id_.reserve(raw_nodes.size());

    for (const auto& raw : raw_nodes) {
        if (model.index_by_id_.count(raw.id) != 0) {
            if (policy == LinkPolicy::kReject) {
                throw InvalidReferenceError("Duplicate node id '" + raw.id + "' in graph data", 0, raw.id);
            }
            std::cerr << "Warning: dropping duplicate node id '" << raw.id << "'" << std::endl;
            ++model.dropped_nodes_;
            continue;
        }

        Node node;
        node.id = raw.id;
        node.name = raw.name;
        node.type = ParseNodeType(raw.type);
        node.type_label = raw.type;
        node.properties = raw.properties.is_object() ? raw.properties : PropertyMap::object();
        // Non-finite seeds are treated as unset; the simulation places them.
        if (raw.position && std::isfinite(raw.position->x) && std::isfinite(raw.position->y)) {
            node.position = *raw.position;
        } else {
            node.position = ImVec2(NAN, NAN);
        }

        model.index_by_id_.emplace(node.id, model.nodes_.size());
        model.nodes_.push_back(std::move(node));
    }

    for (std::size_t i = 0; i < raw_links.size(); ++i) {
        const RawLink& raw = raw_links[i];
        std::size_t source_index = 0;
        std::size_t target_index = 0;
        bool has_source = model.FindNodeIndex(raw.source, source_index);
        bool has_target = model.FindNodeIndex(raw.target, target_index);

        if (!has_source || !has_target) {
            const NodeId& missing = has_source ? raw.target : raw.source;
            if (policy == LinkPolicy::kReject) {
                throw InvalidReferenceError("Link " + std::to_string(i) + " references unknown node '" + missing + "'",
                                            i, missing);
            }
            std::cerr << "Warning: dropping link " << i << " (" << raw.source << " -> " << raw.target
                      << "): unknown node '" << missing << "'" << std::endl;
            ++model.dropped_links_;
            continue;
        }

        Link link;
        link.source = raw.source;
        link.target = raw.target;
        link.source_index = source_index;
        link.target_index = target_index;
        link.type = raw.type;
        link.properties = raw.properties.is_object() ? raw.properties : PropertyMap::object();
        model.links_.push_back(std::move(link));
    }

    return model;
}

} // namespace graph
} // namespace relgraph
