// submesh.cpp — Loop deduplication, vertex-limit splitting and strip generation.

#include "submesh.hpp"
#include "fusion.hpp"
#include <stdexcept>
#include <unordered_map>
#include <utility>

bool dedupe_loops(const VertexBuffer& loops, std::vector<int>& unique,
                  std::vector<int>& loop_to_unique, std::string& err) {
    unique.clear();
    loop_to_unique.clear();

    // Exact duplicates only: zero position tolerance.
    FusionOptions opt;
    opt.epsilon = 0.0f;
    FusionIndex fusion;
    if (!fuse_adjacent_vertices(std::vector<VertexBuffer>(1, loops), opt, fusion, err)) return false;

    unique.reserve(fusion.num_fused());
    for (const FusedGroup& g : fusion.fused_idx_to_buf_idx) unique.push_back(g.front().idx);
    loop_to_unique = fusion.buf_idx_to_fused_idx[0];
    return true;
}

std::vector<Submesh> split_submeshes(const std::vector<std::array<int, 3>>& triangles, size_t max_verts) {
    if (max_verts < 3 || max_verts > kMaxSubmeshVerts) {
        throw std::length_error("submesh vertex limit " + std::to_string(max_verts) +
                                " cannot hold a triangle with 16-bit indices");
    }

    std::vector<Submesh> out;
    Submesh cur;
    std::unordered_map<int, uint16_t> global_to_local;

    for (const auto& t : triangles) {
        // Count the vertices this triangle would add (a triangle may repeat a vertex).
        size_t added = 0;
        for (int k = 0; k < 3; ++k) {
            if (global_to_local.count(t[k])) continue;
            bool seen = false;
            for (int j = 0; j < k; ++j) seen = seen || t[j] == t[k];
            if (!seen) ++added;
        }
        if (cur.verts.size() + added > max_verts) {
            out.push_back(std::move(cur));
            cur = Submesh();
            global_to_local.clear();
        }

        std::array<uint16_t, 3> local{};
        for (int k = 0; k < 3; ++k) {
            auto it = global_to_local.find(t[k]);
            if (it == global_to_local.end()) {
                it = global_to_local.emplace(t[k], static_cast<uint16_t>(cur.verts.size())).first;
                cur.verts.push_back(t[k]);
            }
            local[k] = it->second;
        }
        cur.triangles.push_back(local);
    }
    if (!cur.triangles.empty()) out.push_back(std::move(cur));
    return out;
}

TriangleIndices build_triangle_indices(const std::vector<std::array<uint16_t, 3>>& triangles) {
    TriangleIndices out;
    out.list.reserve(triangles.size() * 3);

    for (const auto& t : triangles) {
        out.list.insert(out.list.end(), t.begin(), t.end());

        // A triangle continues a strip iff it starts with the strip's last edge.
        std::vector<uint16_t>& nr = out.strip_noreset;
        if (nr.empty()) {
            nr.insert(nr.end(), t.begin(), t.end());
        } else if (nr[nr.size() - 2] == t[0] && nr[nr.size() - 1] == t[1]) {
            nr.push_back(t[2]);
        } else {
            // Two extra indices make degenerate triangles that bridge to the new strip.
            const uint16_t last = nr.back();
            nr.push_back(last);
            nr.push_back(t[0]);
            nr.insert(nr.end(), t.begin(), t.end());
        }

        std::vector<uint16_t>& rs = out.strip_reset;
        if (rs.empty()) {
            rs.insert(rs.end(), t.begin(), t.end());
        } else if (rs[rs.size() - 2] == t[0] && rs[rs.size() - 1] == t[1]) {
            rs.push_back(t[2]);
        } else {
            rs.push_back(kStripRestart);
            rs.insert(rs.end(), t.begin(), t.end());
        }
    }
    return out;
}
