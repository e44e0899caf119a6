// fused_mesh.cpp — Assemble the editor mesh from a FusionIndex.

#include "fused_mesh.hpp"
#include <cstdio>

void FusedMesh::clear() {
    verts.clear();
    faces.clear();
}

bool build_fused_mesh(const std::vector<IndexBuffer>& index_buffers,
                      const std::vector<VertexBuffer>& vertex_buffers,
                      const FusionIndex& fusion, FusedMesh& mesh, std::string& err) {
    mesh.clear();
    if (index_buffers.size() != vertex_buffers.size() ||
        fusion.buf_idx_to_fused_idx.size() != vertex_buffers.size()) {
        err = "buffer count mismatch between index buffers, vertex buffers and fusion";
        return false;
    }

    mesh.verts.reserve(fusion.num_fused());
    for (const FusedGroup& g : fusion.fused_idx_to_buf_idx) {
        const VertexRef& rep = g.front();
        mesh.verts.push_back(vertex_buffers[rep.buf].pos[rep.idx]);
    }

    for (size_t b = 0; b < index_buffers.size(); ++b) {
        const IndexBuffer& ib = index_buffers[b];
        const std::vector<int>& to_fused = fusion.buf_idx_to_fused_idx[b];
        const size_t nverts = vertex_buffers[b].size();
        if (ib.size() % 3 != 0) {
            fprintf(stderr, "[cpp] buffer %zu: ignoring %zu trailing indices\n", b, ib.size() % 3);
        }
        for (size_t t = 0; t + 2 < ib.size(); t += 3) {
            FusedFace f;
            f.buf = static_cast<int>(b);
            for (int k = 0; k < 3; ++k) {
                const uint16_t i = ib[t + k];
                if (i >= nverts || i >= to_fused.size()) {
                    err = "bad face index " + std::to_string(i) + " in buffer " + std::to_string(b) +
                          " (" + std::to_string(nverts) + " vertices)";
                    mesh.clear();
                    return false;
                }
                f.v[k] = to_fused[i];
                f.loops[k] = VertexRef{static_cast<int>(b), i};
            }
            mesh.faces.push_back(f);
        }
    }
    return true;
}
