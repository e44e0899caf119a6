// fused_mesh.hpp — Editor-side mesh assembled from a fusion result.
//
// One vertex per fused group, one face per source triangle. Each face remembers which source
// vertex fed each corner so per-loop data (UVs, colours, split normals) can be read back from
// the original buffers by the importer.
//
#pragma once
#include "mesh.hpp"
#include <array>
#include <string>
#include <vector>

struct FusedFace {
    std::array<int, 3> v{};             // fused vertex ids, source winding
    int buf{};                          // source buffer (material slot)
    std::array<VertexRef, 3> loops{};   // source vertex of each corner
};

struct FusedMesh {
    std::vector<Vec3f> verts;       // representative position of each fused vertex
    std::vector<FusedFace> faces;

    void clear();
    size_t num_faces() const { return faces.size(); }
    size_t num_verts() const { return verts.size(); }
};

// Build the mesh. Validates that every index is inside its buffer; on failure returns false,
// leaves `mesh` cleared and writes a message to `err`.
bool build_fused_mesh(const std::vector<IndexBuffer>& index_buffers,
                      const std::vector<VertexBuffer>& vertex_buffers,
                      const FusionIndex& fusion, FusedMesh& mesh, std::string& err);
