#include "gtest/gtest.h"
#include <relgraph/graph/layout/forces.h>
#include <cmath>

using namespace relgraph::graph;

namespace {

const QuadTree::JiggleFn kJiggle = []() { return 1e-6f; };

GraphModel MakeModel(const std::vector<ImVec2>& positions,
                     const std::vector<std::pair<std::string, std::string>>& edges) {
    std::vector<RawNode> nodes;
    for (size_t i = 0; i < positions.size(); ++i) {
        RawNode node;
        node.id = "n" + std::to_string(i);
        node.name = node.id;
        node.type = "person";
        node.position = positions[i];
        nodes.push_back(node);
    }
    std::vector<RawLink> links;
    for (const auto& edge : edges) {
        RawLink link;
        link.source = edge.first;
        link.target = edge.second;
        links.push_back(link);
    }
    return BuildModel(nodes, links);
}

struct Harness {
    explicit Harness(GraphModel m, float alpha = 1.0f)
        : model(std::move(m)),
          physics(model.node_count()),
          ctx{model.nodes(), physics, model.links(), alpha, kJiggle} {}

    GraphModel model;
    std::vector<NodePhysics> physics;
    ForceContext ctx;
};

} // namespace

TEST(LinkForceTest, StretchedLinkPullsEndpointsTogether) {
    Harness h(MakeModel({ImVec2(0, 0), ImVec2(300, 0)}, {{"n0", "n1"}}));
    LinkForce force(100.0f);
    force.Initialize(h.model);
    force.Apply(h.ctx);

    EXPECT_GT(h.physics[0].velocity.x, 0.0f);
    EXPECT_LT(h.physics[1].velocity.x, 0.0f);
    // Equal degrees share the correction evenly.
    EXPECT_NEAR(h.physics[0].velocity.x, -h.physics[1].velocity.x, 1e-4);
}

TEST(LinkForceTest, CompressedLinkPushesEndpointsApart) {
    Harness h(MakeModel({ImVec2(0, 0), ImVec2(20, 0)}, {{"n0", "n1"}}));
    LinkForce force(100.0f);
    force.Initialize(h.model);
    force.Apply(h.ctx);

    EXPECT_LT(h.physics[0].velocity.x, 0.0f);
    EXPECT_GT(h.physics[1].velocity.x, 0.0f);
}

TEST(LinkForceTest, LinkAtRestDistanceIsStable) {
    Harness h(MakeModel({ImVec2(0, 0), ImVec2(0, 100)}, {{"n0", "n1"}}));
    LinkForce force(100.0f);
    force.Initialize(h.model);
    force.Apply(h.ctx);

    EXPECT_NEAR(h.physics[0].velocity.y, 0.0f, 1e-4);
    EXPECT_NEAR(h.physics[1].velocity.y, 0.0f, 1e-4);
}

TEST(LinkForceTest, SelfLinksExertNothing) {
    Harness h(MakeModel({ImVec2(0, 0)}, {{"n0", "n0"}}));
    LinkForce force(100.0f);
    force.Initialize(h.model);
    force.Apply(h.ctx);

    EXPECT_FLOAT_EQ(h.physics[0].velocity.x, 0.0f);
    EXPECT_FLOAT_EQ(h.physics[0].velocity.y, 0.0f);
}

TEST(LinkForceTest, HubMovesLessThanLeaf) {
    // n0 is linked to three leaves; n1 is one of them.
    Harness h(MakeModel({ImVec2(0, 0), ImVec2(300, 0), ImVec2(-300, 0), ImVec2(0, 300)},
                        {{"n0", "n1"}, {"n0", "n2"}, {"n0", "n3"}}));
    LinkForce force(100.0f);
    force.Initialize(h.model);

    // Only the n0-n1 link matters for the x-axis comparison below.
    h.model.nodes()[2].position = ImVec2(-100, 0);
    h.model.nodes()[3].position = ImVec2(0, 100);
    force.Apply(h.ctx);

    EXPECT_GT(std::fabs(h.physics[1].velocity.x), std::fabs(h.physics[0].velocity.x));
}

TEST(ChargeForceTest, NegativeStrengthRepels) {
    Harness h(MakeModel({ImVec2(0, 0), ImVec2(10, 0)}, {}));
    ChargeForce force(-300.0f);
    force.Apply(h.ctx);

    EXPECT_LT(h.physics[0].velocity.x, 0.0f);
    EXPECT_GT(h.physics[1].velocity.x, 0.0f);
}

TEST(ChargeForceTest, ScalesWithAlpha) {
    Harness full(MakeModel({ImVec2(0, 0), ImVec2(10, 0)}, {}), 1.0f);
    Harness half(MakeModel({ImVec2(0, 0), ImVec2(10, 0)}, {}), 0.5f);
    ChargeForce a(-300.0f);
    ChargeForce b(-300.0f);
    a.Apply(full.ctx);
    b.Apply(half.ctx);

    EXPECT_NEAR(half.physics[0].velocity.x, full.physics[0].velocity.x * 0.5f, 1e-4);
}

TEST(ChargeForceTest, ApproximationAgreesWithExactSum) {
    std::vector<ImVec2> positions;
    for (int i = 0; i < 100; ++i) {
        positions.emplace_back(static_cast<float>((i % 10) * 37), static_cast<float>((i / 10) * 41));
    }
    Harness exact(MakeModel(positions, {}));
    Harness approx(MakeModel(positions, {}));

    ChargeForce exact_force(-300.0f, 0.9f, 1.0f, 1000);
    ChargeForce approx_force(-300.0f, 0.9f, 1.0f, 64);
    ASSERT_FALSE(exact_force.uses_approximation(positions.size()));
    ASSERT_TRUE(approx_force.uses_approximation(positions.size()));

    exact_force.Apply(exact.ctx);
    approx_force.Apply(approx.ctx);

    // Corner nodes feel a strong net push outward; both paths agree on it.
    for (size_t i : {size_t(0), size_t(9), size_t(90), size_t(99)}) {
        ImVec2 e = exact.physics[i].velocity;
        ImVec2 a = approx.physics[i].velocity;
        float magnitude = std::sqrt(e.x * e.x + e.y * e.y);
        EXPECT_NEAR(a.x, e.x, magnitude * 0.15f) << "node " << i;
        EXPECT_NEAR(a.y, e.y, magnitude * 0.15f) << "node " << i;
    }
}

TEST(ChargeForceTest, CoincidentNodesGetFiniteVelocity) {
    Harness h(MakeModel({ImVec2(5, 5), ImVec2(5, 5), ImVec2(5, 5)}, {}));
    ChargeForce force(-300.0f);
    force.Apply(h.ctx);

    for (const auto& p : h.physics) {
        EXPECT_TRUE(std::isfinite(p.velocity.x));
        EXPECT_TRUE(std::isfinite(p.velocity.y));
    }
}

TEST(CenterForceTest, MovesCentroidOntoCenter) {
    Harness h(MakeModel({ImVec2(0, 0), ImVec2(100, 0), ImVec2(50, 90)}, {}));
    CenterForce force(ImVec2(400, 300));
    force.Apply(h.ctx);

    float cx = 0.0f;
    float cy = 0.0f;
    for (const auto& node : h.model.nodes()) {
        cx += node.position.x;
        cy += node.position.y;
    }
    EXPECT_NEAR(cx / 3.0f, 400.0f, 1e-3);
    EXPECT_NEAR(cy / 3.0f, 300.0f, 1e-3);
}

TEST(CenterForceTest, PinnedNodesDoNotMove) {
    Harness h(MakeModel({ImVec2(0, 0), ImVec2(100, 0)}, {}));
    h.model.nodes()[0].pinned = ImVec2(0, 0);
    CenterForce force(ImVec2(400, 300));
    force.Apply(h.ctx);

    EXPECT_FLOAT_EQ(h.model.nodes()[0].position.x, 0.0f);
    EXPECT_FLOAT_EQ(h.model.nodes()[0].position.y, 0.0f);
    EXPECT_NE(h.model.nodes()[1].position.x, 100.0f);
}

TEST(CollisionForceTest, OverlappingNodesArePushedApart) {
    Harness h(MakeModel({ImVec2(0, 0), ImVec2(30, 0)}, {}));
    CollisionForce force(40.0f);
    force.Apply(h.ctx);

    EXPECT_LT(h.physics[0].velocity.x, 0.0f);
    EXPECT_GT(h.physics[1].velocity.x, 0.0f);
    EXPECT_NEAR(h.physics[0].velocity.x, -h.physics[1].velocity.x, 1e-4);
}

TEST(CollisionForceTest, SeparatedNodesAreUntouched) {
    Harness h(MakeModel({ImVec2(0, 0), ImVec2(200, 0)}, {}));
    CollisionForce force(40.0f);
    force.Apply(h.ctx);

    EXPECT_FLOAT_EQ(h.physics[0].velocity.x, 0.0f);
    EXPECT_FLOAT_EQ(h.physics[1].velocity.x, 0.0f);
}
