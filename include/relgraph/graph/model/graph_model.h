#ifndef RELGRAPH_GRAPH_MODEL_GRAPH_MODEL_H
#define RELGRAPH_GRAPH_MODEL_GRAPH_MODEL_H

#include <relgraph/graph/model/graph_types.h>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace relgraph {
namespace graph {

// How BuildModel treats links whose endpoint is missing and duplicate node ids.
enum class LinkPolicy {
    kDrop,   // Skip the offending entry, warn on stderr, keep building
    kReject  // Throw InvalidReferenceError on the first offending entry
};

class InvalidReferenceError : public std::runtime_error {
public:
    InvalidReferenceError(const std::string& message, std::size_t link_index, NodeId missing_id)
        : std::runtime_error(message), link_index_(link_index), missing_id_(std::move(missing_id)) {}

    std::size_t link_index() const { return link_index_; }
    const NodeId& missing_id() const { return missing_id_; }

private:
    std::size_t link_index_;
    NodeId missing_id_;
};

class GraphModel;

/**
 * @brief Validate raw input and produce a fresh model.
 *
 * The input vectors are never modified. Under LinkPolicy::kReject the first
 * duplicate node id or dangling link endpoint throws InvalidReferenceError;
 * under LinkPolicy::kDrop every such entry is skipped.
 */
GraphModel BuildModel(const std::vector<RawNode>& raw_nodes,
                      const std::vector<RawLink>& raw_links,
                      LinkPolicy policy = LinkPolicy::kDrop);

/**
 * @brief Validated node and link collections for one simulation run.
 *
 * A GraphModel only comes out of BuildModel, which deep-copies the raw input.
 * After that it is handed to a ForceSimulation, which is its single writer.
 */
class GraphModel {
public:
    GraphModel() = default;

    const std::vector<Node>& nodes() const { return nodes_; }
    std::vector<Node>& nodes() { return nodes_; }
    const std::vector<Link>& links() const { return links_; }

    std::size_t node_count() const { return nodes_.size(); }
    std::size_t link_count() const { return links_.size(); }
    bool empty() const { return nodes_.empty(); }

    /**
     * @brief Look up a node index by id
     * @return true and fills @p index when the id exists
     */
    bool FindNodeIndex(const NodeId& id, std::size_t& index) const;

    const Node* FindNode(const NodeId& id) const;

    // Number of links and duplicate nodes skipped under LinkPolicy::kDrop.
    std::size_t dropped_link_count() const { return dropped_links_; }
    std::size_t dropped_node_count() const { return dropped_nodes_; }

private:
    friend GraphModel BuildModel(const std::vector<RawNode>&, const std::vector<RawLink>&, LinkPolicy);

    std::vector<Node> nodes_;
    std::vector<Link> links_;
    std::unordered_map<NodeId, std::size_t> index_by_id_;
    std::size_t dropped_links_ = 0;
    std::size_t dropped_nodes_ = 0;
};

inline GraphModel BuildModel(const GraphData& data, LinkPolicy policy = LinkPolicy::kDrop) {
    return BuildModel(data.nodes, data.links, policy);
}

} // namespace graph
} // namespace relgraph

#endif // RELGRAPH_GRAPH_MODEL_GRAPH_MODEL_H
