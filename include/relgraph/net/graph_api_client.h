#ifndef RELGRAPH_NET_GRAPH_API_CLIENT_H
#define RELGRAPH_NET_GRAPH_API_CLIENT_H

#include <relgraph/graph/view/graph_source.h>
#include <stop_token>
#include <string>

namespace relgraph {
namespace net {

/**
 * GraphApiClient fetches entity graphs from the investigation backend:
 * - GET {base_url}/graph/?investigation_id=...&limit=...
 * - Bearer authentication when a token is configured
 * - Cancellation through the caller's stop_token
 * Throws FetchError on transport errors, non-200 statuses and malformed bodies.
 */
class GraphApiClient : public graph::GraphSource {
public:
    explicit GraphApiClient(std::string base_url, std::string api_token = std::string(),
                            long timeout_seconds = 30);

    graph::GraphData FetchGraph(const graph::GraphScope& scope, std::stop_token stop) override;

    std::string BuildGraphUrl(const graph::GraphScope& scope) const;

    static int ClampLimit(int limit);

    const std::string& base_url() const { return base_url_; }

private:
    std::string base_url_;
    std::string api_token_;
    long timeout_seconds_;
};

} // namespace net
} // namespace relgraph

#endif // RELGRAPH_NET_GRAPH_API_CLIENT_H
