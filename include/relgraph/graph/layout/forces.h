#ifndef RELGRAPH_GRAPH_LAYOUT_FORCES_H
#define RELGRAPH_GRAPH_LAYOUT_FORCES_H

#include <relgraph/graph/model/graph_model.h>
#include <relgraph/graph/layout/quad_tree.h>
#include <relgraph/graph/layout/spatial_hash.h>
#include <imgui.h>
#include <cstddef>
#include <vector>

namespace relgraph {
namespace graph {

// Per-node integration state, kept outside Node so the model stays a plain
// data carrier.
struct NodePhysics {
    ImVec2 velocity;
    NodePhysics() : velocity(0.0f, 0.0f) {}
};

// Everything a force may read or write during one tick.
struct ForceContext {
    std::vector<Node>& nodes;
    std::vector<NodePhysics>& physics;
    const std::vector<Link>& links;
    float alpha;
    const QuadTree::JiggleFn& jiggle;
};

/**
 * @brief One term of the simulation.
 *
 * Forces accumulate into NodePhysics::velocity (or, for centering, shift
 * positions directly). They never integrate; ForceSimulation does that.
 */
class Force {
public:
    virtual ~Force() = default;

    // Called once per model before the first Apply.
    virtual void Initialize(const GraphModel& model) { (void)model; }

    virtual void Apply(ForceContext& ctx) = 0;
};

/**
 * @brief Spring between linked nodes toward a rest distance.
 *
 * Strength per link is 1 / min(degree(source), degree(target)); the
 * correction is split by degree so hubs move less than leaves.
 */
class LinkForce : public Force {
public:
    explicit LinkForce(float distance = 100.0f, int iterations = 1);

    void Initialize(const GraphModel& model) override;
    void Apply(ForceContext& ctx) override;

    float distance() const { return distance_; }

private:
    float distance_;
    int iterations_;
    std::vector<float> strengths_; // Per link
    std::vector<float> biases_;    // Share of the correction taken by the target
};

/**
 * @brief Inverse-square repulsion (or attraction) between every pair of nodes.
 *
 * Graphs with more than approximation_threshold nodes use a Barnes-Hut
 * quad-tree; smaller graphs use the exact pairwise sum.
 */
class ChargeForce : public Force {
public:
    ChargeForce(float strength = -300.0f, float theta = 0.9f, float distance_min = 1.0f,
                std::size_t approximation_threshold = 64);

    void Apply(ForceContext& ctx) override;

    bool uses_approximation(std::size_t node_count) const { return node_count > approximation_threshold_; }

private:
    void ApplyExact(ForceContext& ctx);
    void ApplyApproximate(ForceContext& ctx);

    float strength_;
    float theta_;
    float distance_min2_;
    std::size_t approximation_threshold_;
    QuadTree tree_;
    std::vector<ImVec2> scratch_positions_;
    std::vector<float> scratch_weights_;
};

// Shifts free nodes so the centroid of all nodes sits on the canvas center.
class CenterForce : public Force {
public:
    explicit CenterForce(const ImVec2& center, float strength = 1.0f);

    void Apply(ForceContext& ctx) override;

private:
    ImVec2 center_;
    float strength_;
};

// Pushes apart discs of a fixed radius that overlap at their predicted positions.
class CollisionForce : public Force {
public:
    explicit CollisionForce(float radius = 40.0f, float strength = 1.0f, int iterations = 1);

    void Apply(ForceContext& ctx) override;

private:
    float radius_;
    float strength_;
    int iterations_;
    SpatialHash spatial_hash_;
    std::vector<ImVec2> predicted_;
};

} // namespace graph
} // namespace relgraph

#endif // RELGRAPH_GRAPH_LAYOUT_FORCES_H
