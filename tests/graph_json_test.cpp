#include "gtest/gtest.h"
#include <relgraph/graph/model/graph_json.h>
#include <relgraph/net/fetch_error.h>

using namespace relgraph;
using namespace relgraph::graph;

TEST(GraphJsonTest, ParsesNodesAndLinks) {
    const std::string body = R"({
        "nodes": [
            {"id": "p1", "name": "Alice", "type": "person", "properties": {"city": "Oslo", "age": 41}},
            {"id": 7, "name": "Acme", "type": "company"}
        ],
        "links": [
            {"source": "p1", "target": 7, "type": "WORKS_AT", "properties": {"strength": 2}}
        ]
    })";

    GraphData data = ParseGraphResponse(body);

    ASSERT_EQ(data.nodes.size(), 2u);
    EXPECT_EQ(data.nodes[0].id, "p1");
    EXPECT_EQ(data.nodes[0].name, "Alice");
    EXPECT_EQ(data.nodes[0].type, "person");
    EXPECT_EQ(data.nodes[1].id, "7");
    EXPECT_TRUE(data.nodes[1].properties.is_object());
    EXPECT_TRUE(data.nodes[1].properties.empty());

    // Property order is preserved for the detail panel.
    auto it = data.nodes[0].properties.begin();
    EXPECT_EQ(it.key(), "city");
    ++it;
    EXPECT_EQ(it.key(), "age");

    ASSERT_EQ(data.links.size(), 1u);
    EXPECT_EQ(data.links[0].source, "p1");
    EXPECT_EQ(data.links[0].target, "7");
    EXPECT_EQ(data.links[0].type, "WORKS_AT");
    EXPECT_EQ(data.links[0].properties["strength"], 2);
}

TEST(GraphJsonTest, MissingNameBecomesUnknown) {
    GraphData data = ParseGraphResponse(R"({"nodes": [{"id": "x"}], "links": []})");
    ASSERT_EQ(data.nodes.size(), 1u);
    EXPECT_EQ(data.nodes[0].name, "Unknown");
    EXPECT_EQ(data.nodes[0].type, "");
}

TEST(GraphJsonTest, EmptyGraph) {
    GraphData data = ParseGraphResponse(R"({"nodes": [], "links": []})");
    EXPECT_TRUE(data.nodes.empty());
    EXPECT_TRUE(data.links.empty());
}

TEST(GraphJsonTest, MalformedBodiesThrowFetchError) {
    EXPECT_THROW(ParseGraphResponse("not json"), net::FetchError);
    EXPECT_THROW(ParseGraphResponse("[]"), net::FetchError);
    EXPECT_THROW(ParseGraphResponse(R"({"nodes": []})"), net::FetchError);
    EXPECT_THROW(ParseGraphResponse(R"({"nodes": [{"name": "no id"}], "links": []})"), net::FetchError);
    EXPECT_THROW(ParseGraphResponse(R"({"nodes": [], "links": [{"source": "a"}]})"), net::FetchError);
}

TEST(GraphJsonTest, ParseErrorsCarryNoHttpStatus) {
    try {
        ParseGraphResponse("{");
        FAIL() << "Expected FetchError";
    } catch (const net::FetchError& e) {
        EXPECT_EQ(e.http_status(), 0);
        EXPECT_FALSE(e.is_unauthorized());
    }
}
