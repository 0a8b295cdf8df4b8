#ifndef RELGRAPH_GRAPH_LAYOUT_FORCE_SIMULATION_H
#define RELGRAPH_GRAPH_LAYOUT_FORCE_SIMULATION_H

#include <relgraph/core/frame_scheduler.h>
#include <relgraph/graph/layout/forces.h>
#include <relgraph/graph/model/graph_model.h>
#include <imgui.h>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <random>
#include <vector>

namespace relgraph {
namespace graph {

struct SimulationParams {
    float alpha_min;
    float alpha_decay;
    float velocity_decay;
    float link_distance;
    float charge_strength;
    float charge_theta;
    float charge_distance_min;
    std::size_t approximation_threshold;
    float collision_radius;
    ImVec2 center;
    float max_speed;          // Per-tick velocity clamp
    float position_limit;     // |x|, |y| beyond this count as diverged

    SimulationParams();
};

// Positions copied out after a tick; indices follow GraphModel::nodes().
struct LayoutSnapshot {
    std::vector<ImVec2> positions;
    float alpha = 0.0f;
    std::uint64_t tick = 0;
};

/**
 * @brief Force-directed layout engine for one GraphModel.
 *
 * The engine owns its model and is the only writer of node positions. While
 * Running or Cooling it holds a FrameScheduler subscription and advances one
 * tick per frame; once alpha drops below alpha_min it unsubscribes and goes
 * Idle. Destroying the engine stops it.
 */
class ForceSimulation {
public:
    enum class State {
        kIdle,     // No scheduled ticks
        kRunning,  // Ticking toward a non-zero alpha target or decaying after restart
        kCooling   // Ticking with alpha target 0 after a reheat was released
    };

    ForceSimulation(GraphModel model, core::FrameScheduler& scheduler,
                    const SimulationParams& params = SimulationParams());
    ~ForceSimulation();

    ForceSimulation(const ForceSimulation&) = delete;
    ForceSimulation& operator=(const ForceSimulation&) = delete;

    // Back to Running with the given alpha.
    void Restart(float alpha = 1.0f);

    /**
     * @brief Set the resting point alpha decays toward.
     *
     * A target above alpha_min resumes an Idle engine without touching alpha.
     * A target of 0 moves a ticking engine to Cooling.
     */
    void SetAlphaTarget(float target);

    /**
     * @brief Fix a node at (x, y) until Unpin or a rebuild
     * @return false for an unknown id, or coordinates that are non-finite or beyond position_limit
     */
    bool Pin(const NodeId& id, float x, float y);
    bool Unpin(const NodeId& id);

    // Cancel the scheduled callback. Idempotent.
    void Stop();

    // One synchronous step: decay, forces, integrate.
    void Tick();

    LayoutSnapshot Snapshot() const;

    State state() const { return state_; }
    bool IsRunning() const { return state_ != State::kIdle; }
    float alpha() const { return alpha_; }
    float alpha_target() const { return alpha_target_; }
    std::uint64_t tick_count() const { return tick_count_; }
    std::size_t numeric_corrections() const { return numeric_corrections_; }

    const GraphModel& model() const { return model_; }
    const SimulationParams& params() const { return params_; }

private:
    void InitializePositions();
    void Schedule();
    void OnFrame();
    void Integrate();
    float Jiggle();

    GraphModel model_;
    SimulationParams params_;
    core::FrameScheduler& scheduler_;
    core::FrameScheduler::SubscriptionId subscription_ = core::FrameScheduler::kInvalidSubscription;

    std::vector<NodePhysics> physics_;
    std::vector<std::unique_ptr<Force>> forces_;
    QuadTree::JiggleFn jiggle_;
    std::mt19937 rng_;

    State state_ = State::kIdle;
    float alpha_ = 1.0f;
    float alpha_target_ = 0.0f;
    std::uint64_t tick_count_ = 0;
    std::size_t numeric_corrections_ = 0;
};

} // namespace graph
} // namespace relgraph

#endif // RELGRAPH_GRAPH_LAYOUT_FORCE_SIMULATION_H
