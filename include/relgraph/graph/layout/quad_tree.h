#ifndef RELGRAPH_GRAPH_LAYOUT_QUAD_TREE_H
#define RELGRAPH_GRAPH_LAYOUT_QUAD_TREE_H

#include <imgui.h>
#include <array>
#include <cstddef>
#include <functional>
#include <vector>

namespace relgraph {
namespace graph {

/**
 * @brief Region quad-tree over weighted points for Barnes-Hut summation.
 *
 * Each cell stores the weighted centroid and total weight of the points below
 * it, so a far-away cell can stand in for all of them. Coincident points share
 * one leaf; leaves at max_depth hold every point that falls into them.
 */
class QuadTree {
public:
    // Returns a tiny non-zero offset used to separate coincident points.
    using JiggleFn = std::function<float()>;

    explicit QuadTree(int max_depth = 16) : max_depth_(max_depth) {}

    /**
     * @brief Rebuild the tree from scratch
     * @param points Point positions; non-finite points are skipped
     * @param weights Per-point weight (charge strength), same size as points
     */
    void Build(const std::vector<ImVec2>& points, const std::vector<float>& weights);

    /**
     * @brief Sum of weight * d / |d|^2 over all other points, d = other - position
     *
     * Cells whose size s satisfies s^2 / theta^2 < |d|^2 are approximated by
     * their centroid. Squared distances below distance_min2 are softened.
     */
    ImVec2 Accumulate(int index, const ImVec2& position, float theta, float distance_min2,
                      const JiggleFn& jiggle) const;

    bool empty() const { return cells_.empty(); }
    std::size_t point_count() const { return point_count_; }
    float total_weight() const { return cells_.empty() ? 0.0f : cells_[0].weight; }
    ImVec2 centroid() const { return cells_.empty() ? ImVec2(0.0f, 0.0f) : cells_[0].centroid; }

private:
    struct Cell {
        ImVec2 origin;          // Top-left corner
        float size = 0.0f;      // Side length
        int depth = 0;
        std::array<int, 4> children{{-1, -1, -1, -1}};
        std::vector<int> bodies;
        ImVec2 centroid;        // Weighted by |weight|
        float weight = 0.0f;    // Signed sum of weights
        bool has_children = false;
    };

    int NewCell(const ImVec2& origin, float size, int depth);
    void Insert(int cell_index, int point_index);
    int ChildFor(int cell_index, const ImVec2& p);
    float Summarize(int cell_index, float& abs_weight);
    void AccumulateCell(int cell_index, int index, const ImVec2& position, float theta2,
                        float distance_min2, const JiggleFn& jiggle, ImVec2& out) const;

    int max_depth_;
    std::vector<Cell> cells_;
    std::vector<ImVec2> points_;
    std::vector<float> weights_;
    std::size_t point_count_ = 0;
};

} // namespace graph
} // namespace relgraph

#endif // RELGRAPH_GRAPH_LAYOUT_QUAD_TREE_H
