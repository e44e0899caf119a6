// submesh.hpp — Export-side helpers layered on top of fusion output.
//
// GMD meshes use 16-bit indices, so an exported mesh is cut into submeshes of at most
// 65536 vertices, each carrying a triangle list and two strip encodings.
//
#pragma once
#include "mesh.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

constexpr size_t kMaxSubmeshVerts = 65536;
constexpr uint16_t kStripRestart = 0xFFFF;

// Exact-duplicate removal over one per-loop vertex buffer.
// `unique[k]` is the first loop carrying deduplicated vertex k; `loop_to_unique[i]` maps loop i.
bool dedupe_loops(const VertexBuffer& loops, std::vector<int>& unique,
                  std::vector<int>& loop_to_unique, std::string& err);

struct Submesh {
    std::vector<int> verts;                           // source vertex ids, first-use order
    std::vector<std::array<uint16_t, 3>> triangles;   // indices into verts
};

// Greedily pack triangles (over source vertex ids) into submeshes of at most `max_verts`
// vertices, preserving triangle order. Throws std::length_error if max_verts is outside
// [3, kMaxSubmeshVerts].
std::vector<Submesh> split_submeshes(const std::vector<std::array<int, 3>>& triangles,
                                     size_t max_verts = kMaxSubmeshVerts);

struct TriangleIndices {
    std::vector<uint16_t> list;            // 3 indices per triangle
    std::vector<uint16_t> strip_noreset;   // strips joined by degenerate triangles
    std::vector<uint16_t> strip_reset;     // strips separated by kStripRestart
};

TriangleIndices build_triangle_indices(const std::vector<std::array<uint16_t, 3>>& triangles);
