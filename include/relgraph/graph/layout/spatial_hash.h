#ifndef RELGRAPH_GRAPH_LAYOUT_SPATIAL_HASH_H
#define RELGRAPH_GRAPH_LAYOUT_SPATIAL_HASH_H

#include <imgui.h>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace relgraph {
namespace graph {

namespace detail {
// Helper: pack 2D grid cell coordinates into 64-bit key for unordered_map buckets
constexpr uint64_t PackCell(int32_t x, int32_t y) {
    return (static_cast<uint64_t>(static_cast<uint32_t>(x)) << 32) |
           static_cast<uint32_t>(y);
}
} // namespace detail

// Uniform grid over point indices. Rebuilt from scratch on every Insert.
class SpatialHash {
public:
    explicit SpatialHash(float cell_size);

    // Points with non-finite coordinates, or outside the int32 cell range, are not bucketed.
    void Insert(const std::vector<ImVec2>& points);

    // Indices of points in cells overlapping the square around position.
    std::vector<int> Query(const ImVec2& position, float radius) const;

private:
    float cell_size_;
    std::unordered_map<uint64_t, std::vector<int>> buckets_;
};

} // namespace graph
} // namespace relgraph

#endif // RELGRAPH_GRAPH_LAYOUT_SPATIAL_HASH_H
