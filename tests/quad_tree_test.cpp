#include "gtest/gtest.h"
#include <relgraph/graph/layout/quad_tree.h>
#include <algorithm>
#include <cmath>
#include <random>

using namespace relgraph::graph;

namespace {

const QuadTree::JiggleFn kJiggle = []() { return 1e-6f; };

// Direct pairwise sum, the reference for Accumulate.
ImVec2 BruteForce(const std::vector<ImVec2>& points, const std::vector<float>& weights, int index,
                  float distance_min2) {
    ImVec2 out(0.0f, 0.0f);
    for (size_t j = 0; j < points.size(); ++j) {
        if (static_cast<int>(j) == index) continue;
        float x = points[j].x - points[index].x;
        float y = points[j].y - points[index].y;
        float l = x * x + y * y;
        if (l < distance_min2) l = std::sqrt(distance_min2 * l);
        out.x += x * weights[j] / l;
        out.y += y * weights[j] / l;
    }
    return out;
}

float Distance(const ImVec2& a, const ImVec2& b) {
    return std::sqrt((a.x - b.x) * (a.x - b.x) + (a.y - b.y) * (a.y - b.y));
}

std::vector<ImVec2> RandomPoints(size_t count, unsigned seed) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<float> dist(-500.0f, 500.0f);
    std::vector<ImVec2> points;
    for (size_t i = 0; i < count; ++i) {
        points.emplace_back(dist(rng), dist(rng));
    }
    return points;
}

} // namespace

TEST(QuadTreeTest, EmptyBuild) {
    QuadTree tree;
    tree.Build({}, {});
    EXPECT_TRUE(tree.empty());
    ImVec2 f = tree.Accumulate(0, ImVec2(0, 0), 0.9f, 1.0f, kJiggle);
    EXPECT_FLOAT_EQ(f.x, 0.0f);
    EXPECT_FLOAT_EQ(f.y, 0.0f);
}

TEST(QuadTreeTest, RootSummarizesAllPoints) {
    QuadTree tree;
    std::vector<ImVec2> points = {ImVec2(0, 0), ImVec2(10, 0), ImVec2(0, 10), ImVec2(10, 10)};
    tree.Build(points, std::vector<float>(4, -2.0f));

    EXPECT_EQ(tree.point_count(), 4u);
    EXPECT_FLOAT_EQ(tree.total_weight(), -8.0f);
    EXPECT_NEAR(tree.centroid().x, 5.0f, 1e-4);
    EXPECT_NEAR(tree.centroid().y, 5.0f, 1e-4);
}

TEST(QuadTreeTest, ZeroThetaMatchesPairwiseSum) {
    std::vector<ImVec2> points = RandomPoints(80, 7);
    std::vector<float> weights(points.size(), -300.0f);
    QuadTree tree;
    tree.Build(points, weights);

    for (int i = 0; i < static_cast<int>(points.size()); i += 9) {
        ImVec2 expected = BruteForce(points, weights, i, 1.0f);
        ImVec2 actual = tree.Accumulate(i, points[i], 0.0f, 1.0f, kJiggle);
        EXPECT_NEAR(actual.x, expected.x, std::fabs(expected.x) * 1e-3 + 1e-3);
        EXPECT_NEAR(actual.y, expected.y, std::fabs(expected.y) * 1e-3 + 1e-3);
    }
}

TEST(QuadTreeTest, ApproximationStaysCloseToPairwiseSum) {
    std::vector<ImVec2> points = RandomPoints(200, 11);
    std::vector<float> weights(points.size(), -300.0f);
    QuadTree tree;
    tree.Build(points, weights);

    for (int i = 0; i < static_cast<int>(points.size()); i += 17) {
        // Bound the error by the summed size of the individual terms; the net
        // force near the middle of the cloud largely cancels out.
        float scale = 0.0f;
        for (size_t j = 0; j < points.size(); ++j) {
            if (static_cast<int>(j) == i) continue;
            scale += 300.0f / std::max(1.0f, Distance(points[i], points[j]));
        }
        ImVec2 expected = BruteForce(points, weights, i, 1.0f);
        ImVec2 actual = tree.Accumulate(i, points[i], 0.9f, 1.0f, kJiggle);
        float error = std::sqrt((actual.x - expected.x) * (actual.x - expected.x) +
                                (actual.y - expected.y) * (actual.y - expected.y));
        EXPECT_LT(error, scale * 0.1f) << "point " << i;
    }
}

TEST(QuadTreeTest, CoincidentPointsStayFinite) {
    std::vector<ImVec2> points(5, ImVec2(3.0f, 3.0f));
    QuadTree tree;
    tree.Build(points, std::vector<float>(points.size(), -300.0f));

    for (int i = 0; i < 5; ++i) {
        ImVec2 f = tree.Accumulate(i, points[i], 0.9f, 1.0f, kJiggle);
        EXPECT_TRUE(std::isfinite(f.x));
        EXPECT_TRUE(std::isfinite(f.y));
    }
}

TEST(QuadTreeTest, NonFinitePointsAreSkipped) {
    std::vector<ImVec2> points = {ImVec2(0, 0), ImVec2(NAN, 1), ImVec2(4, 0)};
    QuadTree tree;
    tree.Build(points, std::vector<float>(3, 1.0f));

    EXPECT_EQ(tree.point_count(), 2u);
    EXPECT_FLOAT_EQ(tree.total_weight(), 2.0f);
    ImVec2 f = tree.Accumulate(0, points[0], 0.0f, 1.0f, kJiggle);
    // Only the point at (4, 0) contributes: 4 * 1 / 16.
    EXPECT_NEAR(f.x, 0.25f, 1e-4);
    EXPECT_NEAR(f.y, 0.0f, 1e-4);
}
