// vertex_fusion.cpp — Top-level fusion loop.
//
// fuse (once) -> [detect -> decide -> solve]* until detection comes back empty.
// Every productive round splits at least one group and groups never merge back, so the
// fused vertex count strictly grows and is bounded by the total vertex count. A round whose
// collisions are all the same triangle referenced twice yields no constraint; nothing can
// separate those, so the loop stops and reports them as unresolved.

#include "fusion.hpp"
#include <cstdio>
#include <utility>

bool vertex_fusion(const std::vector<IndexBuffer>& index_buffers,
                   const std::vector<VertexBuffer>& vertex_buffers,
                   const FusionOptions& opt, FusionIndex& out, FusionReport& rep,
                   std::string& err) {
    out.clear();
    rep = FusionReport();
    if (index_buffers.size() != vertex_buffers.size()) {
        err = "got " + std::to_string(index_buffers.size()) + " index buffers for " +
              std::to_string(vertex_buffers.size()) + " vertex buffers";
        return false;
    }
    for (auto& vb : vertex_buffers) rep.verts_before += vb.size();

    FusionIndex fusion;
    const bool ok = opt.fuse ? fuse_adjacent_vertices(vertex_buffers, opt, fusion, err)
                             : unfused_vertices(vertex_buffers, fusion, err);
    if (!ok) return false;

    for (;;) {
        const CollisionMap collisions = detect_fully_fused_triangles(index_buffers, fusion);
        if (collisions.empty()) break;

        const UnfuseMap unfuse = decide_on_unfusions(index_buffers, fusion.fused_idx_to_buf_idx, collisions);
        if (unfuse.empty()) {
            rep.unresolved_collisions = collisions.size();
            if (opt.verbose) {
                fprintf(stderr, "[cpp] %zu duplicate triangle groups cannot be separated\n", collisions.size());
            }
            break;
        }

        FusionIndex next;
        if (!solve_unfusion(vertex_buffers, fusion.fused_idx_to_buf_idx, unfuse, next, err)) return false;
        if (next.num_fused() <= fusion.num_fused()) {
            err = "unfusion round " + std::to_string(rep.rounds + 1) + " did not split any group";
            return false;
        }

        ++rep.rounds;
        rep.collisions_resolved += collisions.size();
        if (opt.verbose) {
            fprintf(stderr, "[cpp] unfusion round=%zu collisions=%zu constrained_verts=%zu groups=%zu->%zu\n",
                    rep.rounds, collisions.size(), unfuse.size(), fusion.num_fused(), next.num_fused());
        }
        fusion = std::move(next);
    }

    out = std::move(fusion);
    rep.verts_after = out.num_fused();
    return true;
}
