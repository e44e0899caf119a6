// fuse_adjacent.cpp — Initial fused-vertex partition.
//
// High-level flow:
// 1) Give every (buffer, index) a dense flat id: offset[buffer] + index.
// 2) Visit vertices in fusion order. Each vertex looks up the spatial bins around its
//    quantized position and compares itself against the group representatives stored there.
// 3) On a match (positions within epsilon, attributes bit-identical) it is united with the
//    earliest matching representative; otherwise it becomes a representative itself.
// 4) Read the groups back out of the disjoint set in flat order, which yields groups ordered
//    by lowest member with ascending members.
//
// Only representatives are binned and compared, so every member ends up within epsilon of
// its representative rather than within epsilon of some other member.

#include "fusion.hpp"
#include "disjoint_set.hpp"
#include <cmath>
#include <cstdio>
#include <limits>
#include <unordered_map>
#include <utility>

namespace {

struct CellKey {
    int64_t x, y, z;
    bool operator==(const CellKey& o) const { return x == o.x && y == o.y && z == o.z; }
};

struct CellKeyHash {
    size_t operator()(const CellKey& k) const {
        uint64_t h = static_cast<uint64_t>(k.x) * 0x9E3779B97F4A7C15ull;
        h ^= static_cast<uint64_t>(k.y) * 0xC2B2AE3D27D4EB4Full + (h << 6) + (h >> 2);
        h ^= static_cast<uint64_t>(k.z) * 0x165667B19E3779F9ull + (h << 6) + (h >> 2);
        return static_cast<size_t>(h);
    }
};

// Non-finite coordinates never match anything; park them in one cell (offset so that
// neighbour lookups at +-1 stay in range).
inline int64_t quantize(float v, double inv_cell) {
    if (!std::isfinite(v)) return std::numeric_limits<int64_t>::min() + 1;
    double q = std::floor(static_cast<double>(v) * inv_cell);
    const double lim = 9.0e18;
    if (q > lim) q = lim;
    if (q < -lim) q = -lim;
    return static_cast<int64_t>(q);
}

inline bool positions_close(const Vec3f& a, const Vec3f& b, float eps) {
    return std::fabs(a.x - b.x) <= eps && std::fabs(a.y - b.y) <= eps && std::fabs(a.z - b.z) <= eps;
}

} // namespace

bool fuse_adjacent_vertices(const std::vector<VertexBuffer>& vertex_buffers,
                            const FusionOptions& opt, FusionIndex& out, std::string& err) {
    const std::vector<size_t> sizes = buffer_sizes(vertex_buffers);
    std::vector<VertexRef> refs;
    for (size_t b = 0; b < sizes.size(); ++b) {
        for (size_t i = 0; i < sizes[b]; ++i) refs.push_back({static_cast<int>(b), static_cast<int>(i)});
    }

    const float eps = opt.epsilon > 0.0f ? opt.epsilon : 0.0f;
    double cell = opt.bin_size > eps ? opt.bin_size : eps;
    if (cell <= 0.0) cell = 1e-4;
    const double inv_cell = 1.0 / cell;

    DisjointSet ds(refs.size());
    // Representatives (flat ids) per cell, in insertion (= fusion) order.
    std::unordered_map<CellKey, std::vector<uint32_t>, CellKeyHash> bins;
    bins.reserve(refs.size());

    for (uint32_t flat = 0; flat < refs.size(); ++flat) {
        const VertexBuffer& vb = vertex_buffers[refs[flat].buf];
        const int vi = refs[flat].idx;
        const Vec3f& p = vb.pos[vi];
        const CellKey key{quantize(p.x, inv_cell), quantize(p.y, inv_cell), quantize(p.z, inv_cell)};

        uint32_t best = std::numeric_limits<uint32_t>::max();
        for (int dx = -1; dx <= 1; ++dx) {
            for (int dy = -1; dy <= 1; ++dy) {
                for (int dz = -1; dz <= 1; ++dz) {
                    auto it = bins.find({key.x + dx, key.y + dy, key.z + dz});
                    if (it == bins.end()) continue;
                    for (uint32_t rep : it->second) {
                        if (rep >= best) break; // bins are ascending
                        const VertexBuffer& rb = vertex_buffers[refs[rep].buf];
                        const int ri = refs[rep].idx;
                        if (!positions_close(rb.pos[ri], p, eps)) continue;
                        if (!attributes_equal(rb, ri, vb, vi)) continue;
                        best = rep;
                    }
                }
            }
        }

        if (best != std::numeric_limits<uint32_t>::max()) ds.unite(best, flat);
        else bins[key].push_back(flat);
    }

    // Flat order visits each group's lowest member first, so groups come out sorted.
    std::vector<FusedGroup> groups;
    std::vector<int> root_to_group(refs.size(), -1);
    for (uint32_t flat = 0; flat < refs.size(); ++flat) {
        const uint32_t root = ds.find(flat);
        if (root_to_group[root] < 0) {
            root_to_group[root] = static_cast<int>(groups.size());
            groups.emplace_back();
        }
        groups[root_to_group[root]].push_back(refs[flat]);
    }

    if (opt.verbose) {
        fprintf(stderr, "[cpp] fused %zu vertices into %zu groups (%zu bins)\n",
                refs.size(), groups.size(), bins.size());
    }
    return rebuild_fusion_index(std::move(groups), sizes, out, err);
}

bool unfused_vertices(const std::vector<VertexBuffer>& vertex_buffers,
                      FusionIndex& out, std::string& err) {
    const std::vector<size_t> sizes = buffer_sizes(vertex_buffers);
    std::vector<FusedGroup> groups;
    for (size_t b = 0; b < sizes.size(); ++b) {
        for (size_t i = 0; i < sizes[b]; ++i) groups.push_back({VertexRef{static_cast<int>(b), static_cast<int>(i)}});
    }
    return rebuild_fusion_index(std::move(groups), sizes, out, err);
}
