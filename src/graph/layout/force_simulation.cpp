#include <relgraph/graph/layout/force_simulation.h>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <numbers>
#include <utility>

namespace relgraph {
namespace graph {

namespace {
constexpr unsigned kJiggleSeed = 123; // fixed seed for reproducible layouts
constexpr float kInitialRadius = 10.0f;
const float kInitialAngle = static_cast<float>(std::numbers::pi * (3.0 - std::sqrt(5.0)));

bool IsFinite(const ImVec2& p) {
    return std::isfinite(p.x) && std::isfinite(p.y);
}

bool WithinLimit(float x, float y, float limit) {
    return std::isfinite(x) && std::isfinite(y) && std::fabs(x) <= limit && std::fabs(y) <= limit;
}
} // namespace

SimulationParams::SimulationParams()
    : alpha_min(0.001f),
      alpha_decay(static_cast<float>(1.0 - std::pow(0.001, 1.0 / 300.0))),
      velocity_decay(0.4f),
      link_distance(100.0f),
      charge_strength(-300.0f),
      charge_theta(0.9f),
      charge_distance_min(1.0f),
      approximation_threshold(64),
      collision_radius(40.0f),
      center(ImVec2(400.0f, 300.0f)),
      max_speed(1000.0f),
      position_limit(1.0e6f) {}

ForceSimulation::ForceSimulation(GraphModel model, core::FrameScheduler& scheduler, const SimulationParams& params)
    : model_(std::move(model)),
      params_(params),
      scheduler_(scheduler),
      physics_(model_.node_count()),
      rng_(kJiggleSeed) {
    jiggle_ = [this]() { return Jiggle(); };

    forces_.push_back(std::make_unique<LinkForce>(params_.link_distance));
    forces_.push_back(std::make_unique<ChargeForce>(params_.charge_strength, params_.charge_theta,
                                                    params_.charge_distance_min, params_.approximation_threshold));
    forces_.push_back(std::make_unique<CenterForce>(params_.center));
    forces_.push_back(std::make_unique<CollisionForce>(params_.collision_radius));

    InitializePositions();
    for (auto& force : forces_) {
        force->Initialize(model_);
    }

    alpha_ = 1.0f;
    Schedule();
    state_ = State::kRunning;
}

ForceSimulation::~ForceSimulation() {
    Stop();
}

void ForceSimulation::InitializePositions() {
    auto& nodes = model_.nodes();
    for (size_t i = 0; i < nodes.size(); ++i) {
        Node& node = nodes[i];
        if (node.pinned && !WithinLimit(node.pinned->x, node.pinned->y, params_.position_limit)) {
            node.pinned.reset();
            node.position = ImVec2(NAN, NAN);
        }
        if (node.pinned) {
            node.position = *node.pinned;
        } else if (!WithinLimit(node.position.x, node.position.y, params_.position_limit)) {
            // Seeds beyond the position limit are laid out like unset ones.
            float radius = kInitialRadius * std::sqrt(0.5f + static_cast<float>(i));
            float angle = static_cast<float>(i) * kInitialAngle;
            node.position = ImVec2(radius * std::cos(angle), radius * std::sin(angle));
        }
        physics_[i].velocity = ImVec2(0.0f, 0.0f);
    }
}

float ForceSimulation::Jiggle() {
    std::uniform_real_distribution<float> dist(-0.5f, 0.5f);
    float v = dist(rng_) * 1e-6f;
    return v != 0.0f ? v : 1e-6f;
}

void ForceSimulation::Schedule() {
    if (subscription_ != core::FrameScheduler::kInvalidSubscription) return;
    subscription_ = scheduler_.Subscribe([this](double) { OnFrame(); });
}

void ForceSimulation::Stop() {
    if (subscription_ != core::FrameScheduler::kInvalidSubscription) {
        scheduler_.Unsubscribe(subscription_);
        subscription_ = core::FrameScheduler::kInvalidSubscription;
    }
    state_ = State::kIdle;
}

void ForceSimulation::Restart(float alpha) {
    if (!std::isfinite(alpha)) alpha = 1.0f;
    alpha_ = std::clamp(alpha, 0.0f, 1.0f);
    Schedule();
    state_ = State::kRunning;
}

void ForceSimulation::SetAlphaTarget(float target) {
    if (!std::isfinite(target)) return;
    alpha_target_ = std::clamp(target, 0.0f, 1.0f);

    if (alpha_target_ > params_.alpha_min) {
        Schedule();
        state_ = State::kRunning;
    } else if (state_ != State::kIdle) {
        state_ = State::kCooling;
    }
}

bool ForceSimulation::Pin(const NodeId& id, float x, float y) {
    if (!WithinLimit(x, y, params_.position_limit)) return false;
    std::size_t index = 0;
    if (!model_.FindNodeIndex(id, index)) return false;

    Node& node = model_.nodes()[index];
    node.pinned = ImVec2(x, y);
    node.position = ImVec2(x, y);
    physics_[index].velocity = ImVec2(0.0f, 0.0f);
    return true;
}

bool ForceSimulation::Unpin(const NodeId& id) {
    std::size_t index = 0;
    if (!model_.FindNodeIndex(id, index)) return false;
    model_.nodes()[index].pinned.reset();
    return true;
}

void ForceSimulation::OnFrame() {
    if (state_ == State::kIdle) return;
    Tick();
    if (alpha_ < params_.alpha_min) {
        Stop();
    }
}

void ForceSimulation::Tick() {
    alpha_ += (alpha_target_ - alpha_) * params_.alpha_decay;

    ForceContext ctx{model_.nodes(), physics_, model_.links(), alpha_, jiggle_};
    for (auto& force : forces_) {
        force->Apply(ctx);
    }

    Integrate();
    ++tick_count_;
}

void ForceSimulation::Integrate() {
    auto& nodes = model_.nodes();
    const float keep = 1.0f - params_.velocity_decay;
    std::size_t corrected = 0;

    for (size_t i = 0; i < nodes.size(); ++i) {
        Node& node = nodes[i];
        NodePhysics& phys = physics_[i];

        if (node.pinned) {
            node.position = *node.pinned;
            phys.velocity = ImVec2(0.0f, 0.0f);
            continue;
        }

        if (!IsFinite(phys.velocity)) {
            phys.velocity = ImVec2(0.0f, 0.0f);
            ++corrected;
        }
        phys.velocity.x *= keep;
        phys.velocity.y *= keep;

        float speed = std::sqrt(phys.velocity.x * phys.velocity.x + phys.velocity.y * phys.velocity.y);
        if (speed > params_.max_speed) {
            float s = params_.max_speed / speed;
            phys.velocity.x *= s;
            phys.velocity.y *= s;
        }

        node.position.x += phys.velocity.x;
        node.position.y += phys.velocity.y;

        if (!IsFinite(node.position) || std::fabs(node.position.x) > params_.position_limit ||
            std::fabs(node.position.y) > params_.position_limit) {
            node.position = ImVec2(params_.center.x + Jiggle(), params_.center.y + Jiggle());
            phys.velocity = ImVec2(0.0f, 0.0f);
            ++corrected;
        }
    }

    if (corrected > 0) {
        if (numeric_corrections_ == 0) {
            std::cerr << "Warning: layout reset " << corrected
                      << " non-finite or diverged values; further corrections are only counted" << std::endl;
        }
        numeric_corrections_ += corrected;
    }
}

LayoutSnapshot ForceSimulation::Snapshot() const {
    LayoutSnapshot snapshot;
    snapshot.positions.reserve(model_.node_count());
    for (const auto& node : model_.nodes()) {
        snapshot.positions.push_back(node.position);
    }
    snapshot.alpha = alpha_;
    snapshot.tick = tick_count_;
    return snapshot;
}

} // namespace graph
} // namespace relgraph
