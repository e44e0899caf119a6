// unfusion.cpp — Detecting and undoing fusions that collapse distinct triangles.
//
// A triangle is "fully fused" when its three fused ids, as a set, equal another triangle's.
// The editor keys faces by their vertices, so such triangles cannot both exist there.
//
// Resolution is a refinement of the current partition:
// - decide_on_unfusions picks (vertex, vertex) pairs that must not stay fused,
// - solve_unfusion splits each constrained group with a greedy colouring.
// Groups only ever split, so triangles that were distinguishable stay distinguishable.

#include "fusion.hpp"
#include <algorithm>
#include <string>
#include <utility>

namespace {

// One triangle corner with the fused id it currently maps to.
struct Corner {
    int fused{};
    VertexRef ref{};
    bool operator<(const Corner& o) const { return fused != o.fused ? fused < o.fused : ref < o.ref; }
};

inline FusedTriKey fused_key(const std::vector<int>& to_fused, const std::array<int, 3>& tri) {
    FusedTriKey key{{to_fused[tri[0]], to_fused[tri[1]], to_fused[tri[2]]}};
    std::sort(key.begin(), key.end());
    return key;
}

// Corners sorted by fused id, so slot s of two colliding triangles refers to the same fused vertex.
inline std::array<Corner, 3> aligned_corners(const std::vector<std::vector<int>>& to_fused,
                                             const TriangleRef& t) {
    std::array<Corner, 3> c;
    for (int k = 0; k < 3; ++k) {
        c[k].fused = to_fused[t.buf][t.idx[k]];
        c[k].ref = VertexRef{t.buf, t.idx[k]};
    }
    std::sort(c.begin(), c.end());
    return c;
}

// Reverse of fused_idx_to_buf_idx, sized by the highest index seen in each buffer.
std::vector<std::vector<int>> reverse_map(const std::vector<FusedGroup>& groups, size_t num_buffers) {
    std::vector<std::vector<int>> to_fused(num_buffers);
    for (size_t fi = 0; fi < groups.size(); ++fi) {
        for (const VertexRef& r : groups[fi]) {
            if (static_cast<size_t>(r.buf) >= to_fused.size()) to_fused.resize(r.buf + 1);
            std::vector<int>& row = to_fused[r.buf];
            if (static_cast<size_t>(r.idx) >= row.size()) row.resize(r.idx + 1, -1);
            row[r.idx] = static_cast<int>(fi);
        }
    }
    return to_fused;
}

inline void add_unfusion(UnfuseMap& m, const VertexRef& a, const VertexRef& b) {
    m[a].insert(b);
    m[b].insert(a);
}

inline bool must_separate(const UnfuseMap& m, const VertexRef& a, const VertexRef& b) {
    auto it = m.find(a);
    return it != m.end() && it->second.count(b) != 0;
}

} // namespace

CollisionMap detect_fully_fused_triangles(const std::vector<IndexBuffer>& index_buffers,
                                          const FusionIndex& fusion) {
    CollisionMap by_key;
    const size_t nbuf = std::min(index_buffers.size(), fusion.buf_idx_to_fused_idx.size());
    for (size_t b = 0; b < nbuf; ++b) {
        const IndexBuffer& ib = index_buffers[b];
        const std::vector<int>& to_fused = fusion.buf_idx_to_fused_idx[b];
        for (size_t t = 0; t + 2 < ib.size(); t += 3) {
            TriangleRef tri{static_cast<int>(b), {{ib[t], ib[t + 1], ib[t + 2]}}};
            by_key[fused_key(to_fused, tri.idx)].push_back(tri);
        }
    }

    for (auto it = by_key.begin(); it != by_key.end();) {
        if (it->second.size() < 2) it = by_key.erase(it);
        else ++it;
    }
    return by_key;
}

bool check_collisions(const std::vector<IndexBuffer>& index_buffers, const FusionIndex& fusion,
                      const CollisionMap& collisions, std::string& err) {
    const size_t nbuf = std::min(index_buffers.size(), fusion.buf_idx_to_fused_idx.size());
    for (const auto& entry : collisions) {
        for (const TriangleRef& t : entry.second) {
            const std::string where = "collision triangle (" + std::to_string(t.buf) + ", (" +
                                      std::to_string(t.idx[0]) + ", " + std::to_string(t.idx[1]) + ", " +
                                      std::to_string(t.idx[2]) + "))";
            if (t.buf < 0 || static_cast<size_t>(t.buf) >= nbuf) {
                err = where + " names a missing buffer";
                return false;
            }
            const std::vector<int>& to_fused = fusion.buf_idx_to_fused_idx[t.buf];
            for (int i : t.idx) {
                if (i < 0 || static_cast<size_t>(i) >= to_fused.size()) {
                    err = where + " has index " + std::to_string(i) + " outside its buffer";
                    return false;
                }
            }
            if (fused_key(to_fused, t.idx) != entry.first) {
                err = where + " does not map to its fused key";
                return false;
            }
        }
    }
    return true;
}

UnfuseMap decide_on_unfusions(const std::vector<IndexBuffer>& index_buffers,
                              const std::vector<FusedGroup>& fused_idx_to_buf_idx,
                              const CollisionMap& collisions) {
    UnfuseMap unfuse;
    if (collisions.empty()) return unfuse;

    const std::vector<std::vector<int>> to_fused = reverse_map(fused_idx_to_buf_idx, index_buffers.size());

    // A fused vertex touched by any triangle that collides with nothing is anchored in the
    // surrounding surface. Unfusing it would tear that surface, so interior ones go first.
    std::vector<char> anchored(fused_idx_to_buf_idx.size(), 0);
    for (size_t b = 0; b < index_buffers.size(); ++b) {
        const IndexBuffer& ib = index_buffers[b];
        for (size_t t = 0; t + 2 < ib.size(); t += 3) {
            const std::array<int, 3> tri{{ib[t], ib[t + 1], ib[t + 2]}};
            const FusedTriKey key = fused_key(to_fused[b], tri);
            if (collisions.count(key)) continue;
            for (int f : key) anchored[f] = 1;
        }
    }

    for (const auto& entry : collisions) {
        const std::vector<TriangleRef>& tris = entry.second;
        for (size_t i = 0; i < tris.size(); ++i) {
            const std::array<Corner, 3> a = aligned_corners(to_fused, tris[i]);
            for (size_t j = i + 1; j < tris.size(); ++j) {
                const std::array<Corner, 3> c = aligned_corners(to_fused, tris[j]);

                int first_diff = -1;
                bool separated = false;
                for (int s = 0; s < 3; ++s) {
                    if (a[s].ref == c[s].ref) continue;
                    if (first_diff < 0) first_diff = s;
                    if (!anchored[a[s].fused]) {
                        add_unfusion(unfuse, a[s].ref, c[s].ref);
                        separated = true;
                    }
                }
                // Same three source vertices: the same triangle referenced twice.
                if (first_diff < 0) continue;
                // Every differing corner is anchored; cut at the first one.
                if (!separated) add_unfusion(unfuse, a[first_diff].ref, c[first_diff].ref);
            }
        }
    }
    return unfuse;
}

bool solve_unfusion(const std::vector<VertexBuffer>& vertex_buffers,
                    const std::vector<FusedGroup>& old_fused_idx_to_buf_idx,
                    const UnfuseMap& unfuse_verts_with,
                    FusionIndex& out, std::string& err) {
    std::vector<FusedGroup> groups;
    groups.reserve(old_fused_idx_to_buf_idx.size());

    for (const FusedGroup& g : old_fused_idx_to_buf_idx) {
        bool constrained = false;
        for (const VertexRef& r : g) {
            if (unfuse_verts_with.count(r)) { constrained = true; break; }
        }
        if (!constrained) { groups.push_back(g); continue; }

        // Greedy colouring: open a subgroup at the first unassigned member, then sweep the
        // rest in order and take every member that conflicts with nobody already inside.
        std::vector<char> assigned(g.size(), 0);
        for (size_t start = 0; start < g.size(); ++start) {
            if (assigned[start]) continue;
            FusedGroup sub{g[start]};
            assigned[start] = 1;
            for (size_t k = start + 1; k < g.size(); ++k) {
                if (assigned[k]) continue;
                bool conflict = false;
                for (const VertexRef& m : sub) {
                    if (must_separate(unfuse_verts_with, g[k], m)) { conflict = true; break; }
                }
                if (conflict) continue;
                sub.push_back(g[k]);
                assigned[k] = 1;
            }
            groups.push_back(std::move(sub));
        }
    }

    if (!rebuild_fusion_index(std::move(groups), buffer_sizes(vertex_buffers), out, err)) return false;

    for (const auto& entry : unfuse_verts_with) {
        const VertexRef& a = entry.first;
        for (const VertexRef& b : entry.second) {
            if (a.buf < 0 || static_cast<size_t>(a.buf) >= out.buf_idx_to_fused_idx.size() ||
                b.buf < 0 || static_cast<size_t>(b.buf) >= out.buf_idx_to_fused_idx.size() ||
                a.idx < 0 || static_cast<size_t>(a.idx) >= out.buf_idx_to_fused_idx[a.buf].size() ||
                b.idx < 0 || static_cast<size_t>(b.idx) >= out.buf_idx_to_fused_idx[b.buf].size()) {
                err = "unfusion constraint references a vertex outside its buffer";
                out.clear();
                return false;
            }
            if (out.buf_idx_to_fused_idx[a.buf][a.idx] == out.buf_idx_to_fused_idx[b.buf][b.idx]) {
                err = "solved partition still fuses (" + std::to_string(a.buf) + ", " + std::to_string(a.idx) +
                      ") with (" + std::to_string(b.buf) + ", " + std::to_string(b.idx) + ")";
                out.clear();
                return false;
            }
        }
    }
    return true;
}
