#include "gtest/gtest.h"
#include <relgraph/net/fetch_error.h>
#include <relgraph/net/graph_api_client.h>
#include <stop_token>

using namespace relgraph;

TEST(GraphApiClientTest, TrimsTrailingSlashes) {
    net::GraphApiClient client("http://localhost:8000/api//");
    EXPECT_EQ(client.base_url(), "http://localhost:8000/api");
}

TEST(GraphApiClientTest, UrlWithoutInvestigation) {
    net::GraphApiClient client("http://localhost:8000/api");
    graph::GraphScope scope;
    EXPECT_EQ(client.BuildGraphUrl(scope), "http://localhost:8000/api/graph/?limit=100");
}

TEST(GraphApiClientTest, UrlEscapesInvestigationId) {
    net::GraphApiClient client("http://localhost:8000/api/");
    graph::GraphScope scope;
    scope.investigation_id = "case 12&x=1";
    scope.limit = 50;
    EXPECT_EQ(client.BuildGraphUrl(scope),
              "http://localhost:8000/api/graph/?investigation_id=case%2012%26x%3D1&limit=50");
}

TEST(GraphApiClientTest, EmptyInvestigationIdIsOmitted) {
    net::GraphApiClient client("http://localhost:8000/api");
    graph::GraphScope scope;
    scope.investigation_id = "";
    EXPECT_EQ(client.BuildGraphUrl(scope), "http://localhost:8000/api/graph/?limit=100");
}

TEST(GraphApiClientTest, LimitIsClamped) {
    EXPECT_EQ(net::GraphApiClient::ClampLimit(1), 10);
    EXPECT_EQ(net::GraphApiClient::ClampLimit(10), 10);
    EXPECT_EQ(net::GraphApiClient::ClampLimit(320), 320);
    EXPECT_EQ(net::GraphApiClient::ClampLimit(100000), 500);

    net::GraphApiClient client("http://h");
    graph::GraphScope scope;
    scope.limit = 9999;
    EXPECT_EQ(client.BuildGraphUrl(scope), "http://h/graph/?limit=500");
}

TEST(GraphApiClientTest, UnreachableServerThrowsFetchError) {
    net::GraphApiClient client("http://127.0.0.1:1", "", 2);
    std::stop_source stop;
    EXPECT_THROW(client.FetchGraph(graph::GraphScope(), stop.get_token()), net::FetchError);
}

TEST(GraphApiClientTest, CancelledRequestThrowsFetchError) {
    net::GraphApiClient client("http://127.0.0.1:1", "", 2);
    std::stop_source stop;
    stop.request_stop();
    EXPECT_THROW(client.FetchGraph(graph::GraphScope(), stop.get_token()), net::FetchError);
}
