// mesh.hpp — Vertex/index buffer containers and fusion bookkeeping types for gmdfuse.
//
// Design goals:
// - Keep data structures plain and explicit; the engine only needs positions,
//   opaque attribute channels and 16-bit triangle lists.
// - Positions are float32, matching what the GMD codec unpacks.
//
// Conventions used across gmdfuse:
// - A "buffer" is one vertex buffer + its paired index buffer (one per submesh/material).
// - A vertex is identified by VertexRef (buffer id, index in that buffer).
// - Index buffers are triangle lists; every 3 consecutive indices form one triangle.
//
#pragma once
#include <array>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

// 3D position. Plain struct for cache-friendly access.
struct Vec3f { float x{}, y{}, z{}; };

// One per-vertex attribute stream (normal, tangent, col0, uv0, bone weights, ...).
// `data` holds `arity` floats per vertex, densely packed.
struct AttributeChannel {
    std::string name;
    int arity{};
    std::vector<float> data;
};

// Vertex buffer: positions plus any number of attribute channels of equal length.
struct VertexBuffer {
    std::vector<Vec3f> pos;
    std::vector<AttributeChannel> channels;

    size_t size() const { return pos.size(); }

    // Add an empty channel and return it. The caller fills `data` to size()*arity.
    AttributeChannel& add_channel(const std::string& name, int arity);

    // True if both buffers carry the same channel names and arities, in the same order.
    bool same_layout(const VertexBuffer& o) const;

    void clear();
};

// Triangle list over one vertex buffer.
using IndexBuffer = std::vector<uint16_t>;

// (buffer id, index within buffer). Ordered by buffer first, then index ("fusion order").
struct VertexRef {
    int buf{}, idx{};
    bool operator==(const VertexRef& o) const { return buf == o.buf && idx == o.idx; }
    bool operator!=(const VertexRef& o) const { return !(*this == o); }
    bool operator<(const VertexRef& o) const { return buf != o.buf ? buf < o.buf : idx < o.idx; }
};

// Members of one fused vertex, ascending. members[0] is the representative.
using FusedGroup = std::vector<VertexRef>;

// The partition of every vertex of every buffer into fused groups, in both directions.
// Always rebuilt from scratch via rebuild_fusion_index(); never patched in place.
struct FusionIndex {
    std::vector<FusedGroup> fused_idx_to_buf_idx;       // fused id -> members
    std::vector<std::vector<int>> buf_idx_to_fused_idx; // [buf][idx] -> fused id
    std::vector<std::vector<char>> is_fused;            // [buf][idx] -> 1 unless representative

    size_t num_fused() const { return fused_idx_to_buf_idx.size(); }
    void clear();
};

// One source triangle, original winding.
struct TriangleRef {
    int buf{};
    std::array<int, 3> idx{};
    bool operator==(const TriangleRef& o) const { return buf == o.buf && idx == o.idx; }
};

// Sorted fused-id triple; the key under which colliding triangles are grouped.
using FusedTriKey = std::array<int, 3>;

// Only keys with 2+ triangles are ever stored.
using CollisionMap = std::map<FusedTriKey, std::vector<TriangleRef>>;

// Symmetric "must not share a fused vertex" relation.
using UnfuseMap = std::map<VertexRef, std::set<VertexRef>>;

// Sort the members of each group, then the groups by lowest member, and fill `out`
// (groups, reverse map, is_fused). `buf_sizes[b]` is the vertex count of buffer b.
// Returns false if the groups do not cover every vertex exactly once.
bool rebuild_fusion_index(std::vector<FusedGroup> groups,
                          const std::vector<size_t>& buf_sizes,
                          FusionIndex& out, std::string& err);

// Vertex counts of each buffer, used to size the per-buffer maps.
std::vector<size_t> buffer_sizes(const std::vector<VertexBuffer>& vertex_buffers);

// Exact attribute equality between two vertices (position excluded).
// Floats are compared by bit pattern after folding -0.0 into +0.0.
bool attributes_equal(const VertexBuffer& a, int ia, const VertexBuffer& b, int ib);
