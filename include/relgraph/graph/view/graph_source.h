#ifndef RELGRAPH_GRAPH_VIEW_GRAPH_SOURCE_H
#define RELGRAPH_GRAPH_VIEW_GRAPH_SOURCE_H

#include <relgraph/graph/model/graph_types.h>
#include <optional>
#include <stop_token>
#include <string>

namespace relgraph {
namespace graph {

// Which slice of the entity graph a view shows.
struct GraphScope {
    std::optional<std::string> investigation_id; // Unset: sample across all investigations
    int limit = 100;                             // Clamped to [kMinLimit, kMaxLimit] by the source

    static constexpr int kMinLimit = 10;
    static constexpr int kMaxLimit = 500;

    bool operator==(const GraphScope& other) const {
        return investigation_id == other.investigation_id && limit == other.limit;
    }
    bool operator!=(const GraphScope& other) const { return !(*this == other); }
};

/**
 * @brief Collaborator that produces raw graph data for a scope.
 *
 * Implementations run on a worker thread. They throw net::FetchError on
 * failure and should return promptly once stop is requested; a result
 * produced after cancellation is discarded by the caller.
 */
class GraphSource {
public:
    virtual ~GraphSource() = default;
    virtual GraphData FetchGraph(const GraphScope& scope, std::stop_token stop) = 0;
};

} // namespace graph
} // namespace relgraph

#endif // RELGRAPH_GRAPH_VIEW_GRAPH_SOURCE_H
