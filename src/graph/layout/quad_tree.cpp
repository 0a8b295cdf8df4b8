#include <relgraph/graph/layout/quad_tree.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace relgraph {
namespace graph {

namespace {
bool IsFinite(const ImVec2& p) {
    return std::isfinite(p.x) && std::isfinite(p.y);
}
} // namespace

int QuadTree::NewCell(const ImVec2& origin, float size, int depth) {
    Cell cell;
    cell.origin = origin;
    cell.size = size;
    cell.depth = depth;
    cells_.push_back(std::move(cell));
    return static_cast<int>(cells_.size()) - 1;
}

void QuadTree::Build(const std::vector<ImVec2>& points, const std::vector<float>& weights) {
    cells_.clear();
    points_ = points;
    weights_ = weights;
    weights_.resize(points_.size(), 0.0f);
    point_count_ = 0;

    float min_x = std::numeric_limits<float>::max();
    float min_y = std::numeric_limits<float>::max();
    float max_x = std::numeric_limits<float>::lowest();
    float max_y = std::numeric_limits<float>::lowest();
    for (const auto& p : points_) {
        if (!IsFinite(p)) continue;
        min_x = std::min(min_x, p.x);
        min_y = std::min(min_y, p.y);
        max_x = std::max(max_x, p.x);
        max_y = std::max(max_y, p.y);
        ++point_count_;
    }
    if (point_count_ == 0) return;

    float size = std::max(1.0f, std::max(max_x - min_x, max_y - min_y));
    cells_.reserve(point_count_ * 2);
    NewCell(ImVec2(min_x, min_y), size, 0);

    for (size_t i = 0; i < points_.size(); ++i) {
        if (!IsFinite(points_[i])) continue;
        Insert(0, static_cast<int>(i));
    }

    float abs_weight = 0.0f;
    Summarize(0, abs_weight);
}

int QuadTree::ChildFor(int cell_index, const ImVec2& p) {
    const Cell& cell = cells_[cell_index];
    float half = cell.size * 0.5f;
    int quadrant = (p.x >= cell.origin.x + half ? 1 : 0) | (p.y >= cell.origin.y + half ? 2 : 0);
    return cell.children[quadrant];
}

void QuadTree::Insert(int cell_index, int point_index) {
    const ImVec2& p = points_[point_index];

    while (true) {
        if (cells_[cell_index].has_children) {
            cell_index = ChildFor(cell_index, p);
            continue;
        }

        Cell& leaf = cells_[cell_index];
        if (leaf.bodies.empty() || leaf.depth >= max_depth_) {
            leaf.bodies.push_back(point_index);
            return;
        }
        const ImVec2& existing = points_[leaf.bodies.front()];
        if (existing.x == p.x && existing.y == p.y) {
            leaf.bodies.push_back(point_index);
            return;
        }

        // Split: every body already here is coincident, so they move together.
        std::vector<int> moved = std::move(leaf.bodies);
        leaf.bodies.clear();
        ImVec2 origin = leaf.origin;
        float half = leaf.size * 0.5f;
        int depth = leaf.depth + 1;
        for (int q = 0; q < 4; ++q) {
            ImVec2 child_origin(origin.x + ((q & 1) ? half : 0.0f), origin.y + ((q & 2) ? half : 0.0f));
            int child = NewCell(child_origin, half, depth);
            cells_[cell_index].children[q] = child;
        }
        cells_[cell_index].has_children = true;

        int target = ChildFor(cell_index, points_[moved.front()]);
        cells_[target].bodies = std::move(moved);
    }
}

float QuadTree::Summarize(int cell_index, float& abs_weight) {
    float weight = 0.0f;
    float sum_abs = 0.0f;
    float cx = 0.0f;
    float cy = 0.0f;

    if (cells_[cell_index].has_children) {
        for (int q = 0; q < 4; ++q) {
            int child = cells_[cell_index].children[q];
            float child_abs = 0.0f;
            float child_weight = Summarize(child, child_abs);
            if (child_abs <= 0.0f) continue;
            weight += child_weight;
            sum_abs += child_abs;
            cx += child_abs * cells_[child].centroid.x;
            cy += child_abs * cells_[child].centroid.y;
        }
    } else {
        for (int body : cells_[cell_index].bodies) {
            float w = weights_[body];
            float a = std::fabs(w);
            weight += w;
            sum_abs += a;
            cx += a * points_[body].x;
            cy += a * points_[body].y;
        }
    }

    Cell& cell = cells_[cell_index];
    if (sum_abs > 0.0f) {
        cell.centroid = ImVec2(cx / sum_abs, cy / sum_abs);
    } else if (!cell.bodies.empty()) {
        cell.centroid = points_[cell.bodies.front()];
    } else {
        cell.centroid = ImVec2(cell.origin.x + cell.size * 0.5f, cell.origin.y + cell.size * 0.5f);
    }
    cell.weight = weight;
    abs_weight = sum_abs;
    return weight;
}

ImVec2 QuadTree::Accumulate(int index, const ImVec2& position, float theta, float distance_min2,
                            const JiggleFn& jiggle) const {
    ImVec2 out(0.0f, 0.0f);
    if (cells_.empty() || !IsFinite(position)) return out;
    float theta2 = std::max(theta * theta, 1e-6f);
    AccumulateCell(0, index, position, theta2, distance_min2, jiggle, out);
    return out;
}

void QuadTree::AccumulateCell(int cell_index, int index, const ImVec2& position, float theta2,
                              float distance_min2, const JiggleFn& jiggle, ImVec2& out) const {
    const Cell& cell = cells_[cell_index];
    if (cell.weight == 0.0f) return;

    float dx = cell.centroid.x - position.x;
    float dy = cell.centroid.y - position.y;
    float l = dx * dx + dy * dy;

    if (cell.size * cell.size / theta2 < l) {
        if (dx == 0.0f) { dx = jiggle(); l += dx * dx; }
        if (dy == 0.0f) { dy = jiggle(); l += dy * dy; }
        if (l < distance_min2) l = std::sqrt(distance_min2 * l);
        out.x += dx * cell.weight / l;
        out.y += dy * cell.weight / l;
        return;
    }

    if (cell.has_children) {
        for (int child : cell.children) {
            AccumulateCell(child, index, position, theta2, distance_min2, jiggle, out);
        }
        return;
    }

    for (int body : cell.bodies) {
        if (body == index) continue;
        float bx = points_[body].x - position.x;
        float by = points_[body].y - position.y;
        float bl = bx * bx + by * by;
        if (bx == 0.0f) { bx = jiggle(); bl += bx * bx; }
        if (by == 0.0f) { by = jiggle(); bl += by * by; }
        if (bl < distance_min2) bl = std::sqrt(distance_min2 * bl);
        out.x += bx * weights_[body] / bl;
        out.y += by * weights_[body] / bl;
    }
}

} // namespace graph
} // namespace relgraph
