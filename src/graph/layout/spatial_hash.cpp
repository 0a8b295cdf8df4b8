#include <relgraph/graph/layout/spatial_hash.h>
#include <cmath>
#include <algorithm>
#include <limits>

namespace relgraph {
namespace graph {

namespace {
// Cell coordinate of v, or false when it does not fit in an int32 cell index.
bool CellIndex(float v, float cell_size, int64_t& out) {
    if (!std::isfinite(v)) return false;
    double cell = std::floor(static_cast<double>(v) / cell_size);
    if (cell < static_cast<double>(std::numeric_limits<int32_t>::min()) ||
        cell > static_cast<double>(std::numeric_limits<int32_t>::max())) {
        return false;
    }
    out = static_cast<int64_t>(cell);
    return true;
}

bool InCellRange(int64_t c) {
    return c >= std::numeric_limits<int32_t>::min() && c <= std::numeric_limits<int32_t>::max();
}
} // namespace

SpatialHash::SpatialHash(float cell_size) : cell_size_(std::max(1.0f, cell_size)) {}

void SpatialHash::Insert(const std::vector<ImVec2>& points) {
    buckets_.clear();
    buckets_.reserve(points.size() * 2);

    for (size_t idx = 0; idx < points.size(); ++idx) {
        const ImVec2& p = points[idx];
        int64_t cx = 0;
        int64_t cy = 0;
        if (!CellIndex(p.x, cell_size_, cx) || !CellIndex(p.y, cell_size_, cy)) continue;

        buckets_[detail::PackCell(static_cast<int32_t>(cx), static_cast<int32_t>(cy))]
            .push_back(static_cast<int>(idx));
    }
}

std::vector<int> SpatialHash::Query(const ImVec2& position, float radius) const {
    std::vector<int> result;
    int64_t center_cx = 0;
    int64_t center_cy = 0;
    if (buckets_.empty() || !CellIndex(position.x, cell_size_, center_cx) ||
        !CellIndex(position.y, cell_size_, center_cy)) {
        return result;
    }

    int search_radius = static_cast<int>(std::ceil(std::max(0.0f, radius) / cell_size_));

    for (int64_t dx = -search_radius; dx <= search_radius; ++dx) {
        for (int64_t dy = -search_radius; dy <= search_radius; ++dy) {
            int64_t cx = center_cx + dx;
            int64_t cy = center_cy + dy;
            if (!InCellRange(cx) || !InCellRange(cy)) continue;

            uint64_t key = detail::PackCell(static_cast<int32_t>(cx), static_cast<int32_t>(cy));
            auto bucket_it = buckets_.find(key);
            if (bucket_it != buckets_.end()) {
                result.insert(result.end(), bucket_it->second.begin(), bucket_it->second.end());
            }
        }
    }
    return result;
}

} // namespace graph
} // namespace relgraph
