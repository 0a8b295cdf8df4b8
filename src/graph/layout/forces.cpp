#include <relgraph/graph/layout/forces.h>
#include <algorithm>
#include <cmath>

namespace relgraph {
namespace graph {

namespace {
ImVec2 Predicted(const Node& node, const NodePhysics& physics) {
    return ImVec2(node.position.x + physics.velocity.x, node.position.y + physics.velocity.y);
}

bool IsFinite(const ImVec2& p) {
    return std::isfinite(p.x) && std::isfinite(p.y);
}
} // namespace

// ---------------------------------------------------------------------------
// LinkForce

LinkForce::LinkForce(float distance, int iterations)
    : distance_(distance), iterations_(std::max(1, iterations)) {}

void LinkForce::Initialize(const GraphModel& model) {
    const auto& links = model.links();
    std::vector<int> degree(model.node_count(), 0);
    for (const auto& link : links) {
        if (link.is_self_link()) continue;
        ++degree[link.source_index];
        ++degree[link.target_index];
    }

    strengths_.assign(links.size(), 0.0f);
    biases_.assign(links.size(), 0.5f);
    for (size_t i = 0; i < links.size(); ++i) {
        const Link& link = links[i];
        if (link.is_self_link()) continue;
        float ds = static_cast<float>(degree[link.source_index]);
        float dt = static_cast<float>(degree[link.target_index]);
        strengths_[i] = 1.0f / std::min(ds, dt);
        biases_[i] = ds / (ds + dt);
    }
}

void LinkForce::Apply(ForceContext& ctx) {
    if (strengths_.size() != ctx.links.size()) return;

    for (int k = 0; k < iterations_; ++k) {
        for (size_t i = 0; i < ctx.links.size(); ++i) {
            const Link& link = ctx.links[i];
            if (link.is_self_link()) continue;

            Node& source = ctx.nodes[link.source_index];
            Node& target = ctx.nodes[link.target_index];
            NodePhysics& sp = ctx.physics[link.source_index];
            NodePhysics& tp = ctx.physics[link.target_index];

            ImVec2 s = Predicted(source, sp);
            ImVec2 t = Predicted(target, tp);
            float x = t.x - s.x;
            float y = t.y - s.y;
            if (x == 0.0f) x = ctx.jiggle();
            if (y == 0.0f) y = ctx.jiggle();
            float l = std::sqrt(x * x + y * y);
            l = (l - distance_) / l * ctx.alpha * strengths_[i];
            x *= l;
            y *= l;

            float b = biases_[i];
            tp.velocity.x -= x * b;
            tp.velocity.y -= y * b;
            sp.velocity.x += x * (1.0f - b);
            sp.velocity.y += y * (1.0f - b);
        }
    }
}

// ---------------------------------------------------------------------------
// ChargeForce

ChargeForce::ChargeForce(float strength, float theta, float distance_min, std::size_t approximation_threshold)
    : strength_(strength),
      theta_(theta),
      distance_min2_(distance_min * distance_min),
      approximation_threshold_(approximation_threshold) {}

void ChargeForce::Apply(ForceContext& ctx) {
    if (ctx.nodes.size() < 2 || strength_ == 0.0f) return;
    if (uses_approximation(ctx.nodes.size())) {
        ApplyApproximate(ctx);
    } else {
        ApplyExact(ctx);
    }
}

void ChargeForce::ApplyExact(ForceContext& ctx) {
    const size_t n = ctx.nodes.size();
    for (size_t i = 0; i < n; ++i) {
        const ImVec2& pi = ctx.nodes[i].position;
        if (!IsFinite(pi)) continue;
        NodePhysics& phys = ctx.physics[i];

        for (size_t j = 0; j < n; ++j) {
            if (j == i) continue;
            const ImVec2& pj = ctx.nodes[j].position;
            if (!IsFinite(pj)) continue;

            float x = pj.x - pi.x;
            float y = pj.y - pi.y;
            float l = x * x + y * y;
            if (x == 0.0f) { x = ctx.jiggle(); l += x * x; }
            if (y == 0.0f) { y = ctx.jiggle(); l += y * y; }
            if (l < distance_min2_) l = std::sqrt(distance_min2_ * l);

            float w = strength_ * ctx.alpha / l;
            phys.velocity.x += x * w;
            phys.velocity.y += y * w;
        }
    }
}

void ChargeForce::ApplyApproximate(ForceContext& ctx) {
    const size_t n = ctx.nodes.size();
    scratch_positions_.resize(n);
    scratch_weights_.assign(n, strength_);
    for (size_t i = 0; i < n; ++i) {
        scratch_positions_[i] = ctx.nodes[i].position;
    }
    tree_.Build(scratch_positions_, scratch_weights_);

    for (size_t i = 0; i < n; ++i) {
        if (!IsFinite(scratch_positions_[i])) continue;
        ImVec2 f = tree_.Accumulate(static_cast<int>(i), scratch_positions_[i], theta_, distance_min2_, ctx.jiggle);
        ctx.physics[i].velocity.x += f.x * ctx.alpha;
        ctx.physics[i].velocity.y += f.y * ctx.alpha;
    }
}

// ---------------------------------------------------------------------------
// CenterForce

CenterForce::CenterForce(const ImVec2& center, float strength)
    : center_(center), strength_(strength) {}

void CenterForce::Apply(ForceContext& ctx) {
    float sx = 0.0f;
    float sy = 0.0f;
    size_t counted = 0;
    for (const auto& node : ctx.nodes) {
        if (!IsFinite(node.position)) continue;
        sx += node.position.x;
        sy += node.position.y;
        ++counted;
    }
    if (counted == 0) return;

    float shift_x = (sx / counted - center_.x) * strength_;
    float shift_y = (sy / counted - center_.y) * strength_;
    for (auto& node : ctx.nodes) {
        if (node.is_pinned()) continue;
        node.position.x -= shift_x;
        node.position.y -= shift_y;
    }
}

// ---------------------------------------------------------------------------
// CollisionForce

CollisionForce::CollisionForce(float radius, float strength, int iterations)
    : radius_(radius),
      strength_(strength),
      iterations_(std::max(1, iterations)),
      spatial_hash_(std::max(1.0f, radius * 2.0f)) {}

void CollisionForce::Apply(ForceContext& ctx) {
    const size_t n = ctx.nodes.size();
    if (n < 2 || radius_ <= 0.0f) return;

    const float r = radius_ * 2.0f;
    const float r2 = r * r;

    for (int k = 0; k < iterations_; ++k) {
        predicted_.resize(n);
        for (size_t i = 0; i < n; ++i) {
            predicted_[i] = Predicted(ctx.nodes[i], ctx.physics[i]);
        }
        spatial_hash_.Insert(predicted_);

        for (size_t i = 0; i < n; ++i) {
            if (!IsFinite(predicted_[i])) continue;
            const ImVec2 pi = predicted_[i];
            std::vector<int> neighbors = spatial_hash_.Query(pi, r);

            for (int j_index : neighbors) {
                if (j_index <= static_cast<int>(i)) continue;
                NodePhysics& a = ctx.physics[i];
                NodePhysics& b = ctx.physics[j_index];
                const Node& other = ctx.nodes[j_index];

                float x = pi.x - other.position.x - b.velocity.x;
                float y = pi.y - other.position.y - b.velocity.y;
                float l = x * x + y * y;
                if (l >= r2) continue;

                if (x == 0.0f) { x = ctx.jiggle(); l += x * x; }
                if (y == 0.0f) { y = ctx.jiggle(); l += y * y; }
                l = std::sqrt(l);
                l = (r - l) / l * strength_;
                x *= l;
                y *= l;

                // Equal radii: the overlap is split evenly.
                a.velocity.x += x * 0.5f;
                a.velocity.y += y * 0.5f;
                b.velocity.x -= x * 0.5f;
                b.velocity.y -= y * 0.5f;
            }
        }
    }
}

} // namespace graph
} // namespace relgraph
