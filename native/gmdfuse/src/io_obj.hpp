// io_obj.hpp — Multi-object OBJ loader/saver used as an offline interchange format.
//
// Scope and limitations:
// - Each `o` record starts a new buffer (one vertex buffer + one index buffer). `g` groups
//   do not split buffers, so faces after a `g` may still use the object's earlier vertices.
// - `v x y z` adds a position; `vn x y z` adds a normal. Normals become a 3-wide "normal"
//   attribute channel when the object has exactly one `vn` per `v`, and are dropped otherwise.
// - `f i j k` adds a triangle. Indices are positive, 1-based and global as OBJ defines them; they are
//   converted to buffer-local 16-bit indices. `i/t/n` tokens use the first field only.
// - Lines starting with '#' are comments.
//
#pragma once
#include "mesh.hpp"
#include "fused_mesh.hpp"
#include <string>
#include <vector>

// Load buffers from the OBJ file at `path`.
// On failure, returns false and writes a human-readable message to `err`.
bool load_obj_buffers(const std::string& path, std::vector<VertexBuffer>& vertex_buffers,
                      std::vector<IndexBuffer>& index_buffers, std::string& err);

// Save the fused mesh: one `v` per fused vertex, then the faces of each source buffer
// under their own `o buffer<N>` record.
// On failure, returns false and writes a human-readable message to `err`.
bool save_obj_fused(const std::string& path, const FusedMesh& mesh, std::string& err);
