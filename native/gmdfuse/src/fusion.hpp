// fusion.hpp — Vertex fusion/unfusion engine.
//
// The GMD format stores one vertex per loop corner; the editor keys vertices by shared
// identity. Fusion merges coincident vertices with identical attributes so shared
// normals/tangents survive the round trip. Fusion can collapse two distinct triangles
// onto the same three fused vertices ("fully fused"); those are found and undone by
// selectively unfusing vertices until no such collision is left.
//
// Pipeline (see vertex_fusion):
//   fuse_adjacent_vertices -> detect_fully_fused_triangles -> decide_on_unfusions
//   -> solve_unfusion -> back to detection until stable.
//
// All stages are pure functions of their inputs. Index ranges are a caller precondition.
//
#pragma once
#include "mesh.hpp"
#include <string>
#include <vector>

// Tuning knobs for a fusion run. See src/main.cpp for CLI wiring.
struct FusionOptions {
    float epsilon = 1e-6f;      // max per-component position difference for fusion
    float bin_size = 1e-4f;     // spatial bin edge; clamped to >= epsilon
    bool  fuse = true;          // false: identity partition, no fusion at all
    bool  verbose = false;      // emit per-round diagnostics to stderr
};

// Summary counters filled by vertex_fusion().
struct FusionReport {
    size_t verts_before = 0;          // total vertices over all buffers
    size_t verts_after = 0;           // fused vertex count
    size_t rounds = 0;                // unfusion rounds run
    size_t collisions_resolved = 0;   // collision groups handled over all rounds
    size_t unresolved_collisions = 0; // exact-duplicate triangle groups left at the end
};

// Partition every vertex of every buffer into fused groups (position within epsilon,
// all other attributes identical). Groups and members are in fusion order.
bool fuse_adjacent_vertices(const std::vector<VertexBuffer>& vertex_buffers,
                            const FusionOptions& opt, FusionIndex& out, std::string& err);

// Identity partition: every vertex is its own fused vertex.
bool unfused_vertices(const std::vector<VertexBuffer>& vertex_buffers,
                      FusionIndex& out, std::string& err);

// Group triangles by their sorted fused-id triple and keep groups of 2+ triangles.
CollisionMap detect_fully_fused_triangles(const std::vector<IndexBuffer>& index_buffers,
                                          const FusionIndex& fusion);

// Check that every triangle in `collisions` lies inside its buffer and maps to the key
// it is filed under. decide_on_unfusions() assumes both for collisions it did not detect.
bool check_collisions(const std::vector<IndexBuffer>& index_buffers, const FusionIndex& fusion,
                      const CollisionMap& collisions, std::string& err);

// Choose vertex pairs that must be pulled apart so that colliding triangles separate.
// The result is symmetric.
UnfuseMap decide_on_unfusions(const std::vector<IndexBuffer>& index_buffers,
                              const std::vector<FusedGroup>& fused_idx_to_buf_idx,
                              const CollisionMap& collisions);

// Split the old groups so no group holds a constrained pair, keeping everything else
// together. Returns false (with err) if the result breaks an invariant.
bool solve_unfusion(const std::vector<VertexBuffer>& vertex_buffers,
                    const std::vector<FusedGroup>& old_fused_idx_to_buf_idx,
                    const UnfuseMap& unfuse_verts_with,
                    FusionIndex& out, std::string& err);

// Top-level entry point. index_buffers[i] indexes vertex_buffers[i].
// Returns true with a fully resolved `out`; false leaves `out` cleared and fills `err`.
bool vertex_fusion(const std::vector<IndexBuffer>& index_buffers,
                   const std::vector<VertexBuffer>& vertex_buffers,
                   const FusionOptions& opt, FusionIndex& out, FusionReport& rep,
                   std::string& err);
