#ifndef RELGRAPH_GRAPH_MODEL_GRAPH_JSON_H
#define RELGRAPH_GRAPH_MODEL_GRAPH_JSON_H

#include <relgraph/graph/model/graph_types.h>
#include <string>

namespace relgraph {
namespace graph {

/**
 * @brief Decode a `{ "nodes": [...], "links": [...] }` response body.
 *
 * Integer ids are converted to their decimal string form. A missing name
 * becomes "Unknown" and missing properties an empty object.
 * Throws net::FetchError when the body is not a usable graph document.
 */
GraphData ParseGraphResponse(const std::string& body);

} // namespace graph
} // namespace relgraph

#endif // RELGRAPH_GRAPH_MODEL_GRAPH_JSON_H
