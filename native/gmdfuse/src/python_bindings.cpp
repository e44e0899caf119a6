//======================================================================
// Python bindings for the gmdfuse vertex fusion engine.
//
// The GMD importer/exporter calls into this module with the same data shapes its
// pure-Python helpers use:
//   vertex_buffers : List[buffer] where buffer is either
//                      - List[(x,y,z)]                     positions only, or
//                      - Dict with "pos": List[(x,y,z)] plus one entry per attribute
//                        channel, each a List of equal-length float tuples.
//   index_buffers  : List[List[int]]   triangle lists, buffer-local 16-bit indices
//   fused vertex   : List[(buf, idx)]  members of one fused vertex, ascending
//
// Every C++ call that reports failure through `err` raises RuntimeError here;
// malformed arguments raise ValueError.
//======================================================================

#include "fusion.hpp"
#include "mesh.hpp"
#include "submesh.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <algorithm>
#include <stdexcept>

namespace py = pybind11;

//======================================================================
// Argument conversion
//======================================================================

static std::vector<float> flatten_rows(const py::handle& rows, int& arity, const std::string& what) {
    std::vector<float> data;
    arity = -1;
    for (auto row : rows) {
        auto vals = row.cast<std::vector<double>>();
        if (arity < 0) arity = static_cast<int>(vals.size());
        if (static_cast<int>(vals.size()) != arity || arity == 0) {
            throw std::invalid_argument(what + ": rows must be non-empty and of equal length");
        }
        for (double v : vals) data.push_back(static_cast<float>(v));
    }
    if (arity < 0) arity = 0;
    return data;
}

static VertexBuffer to_vertex_buffer(const py::handle& obj, size_t b) {
    const std::string where = "vertex buffer " + std::to_string(b);
    VertexBuffer vb;
    py::object positions;
    py::dict attrs;
    if (py::isinstance<py::dict>(obj)) {
        attrs = py::reinterpret_borrow<py::dict>(obj);
        if (!attrs.contains("pos")) throw std::invalid_argument(where + ": missing 'pos'");
        positions = attrs["pos"];
    } else {
        positions = py::reinterpret_borrow<py::object>(obj);
    }

    int arity = 0;
    std::vector<float> flat = flatten_rows(positions, arity, where + " positions");
    if (!flat.empty() && arity != 3) throw std::invalid_argument(where + ": positions must be (x,y,z)");
    vb.pos.resize(flat.size() / 3);
    for (size_t i = 0; i < vb.pos.size(); ++i) vb.pos[i] = Vec3f{flat[3*i], flat[3*i+1], flat[3*i+2]};

    for (auto item : attrs) {
        const std::string name = item.first.cast<std::string>();
        if (name == "pos") continue;
        int a = 0;
        std::vector<float> data = flatten_rows(item.second, a, where + " channel '" + name + "'");
        if (a > 0 && data.size() / a != vb.size()) {
            throw std::invalid_argument(where + " channel '" + name + "' has " +
                                        std::to_string(data.size() / a) + " rows for " +
                                        std::to_string(vb.size()) + " vertices");
        }
        if (a == 0 && vb.size() != 0) throw std::invalid_argument(where + " channel '" + name + "' is empty");
        vb.add_channel(name, a).data = std::move(data);
    }
    return vb;
}

static std::vector<VertexBuffer> to_vertex_buffers(const py::sequence& seq) {
    std::vector<VertexBuffer> out;
    out.reserve(seq.size());
    for (size_t b = 0; b < seq.size(); ++b) {
        py::object item = seq[b];
        out.push_back(to_vertex_buffer(item, b));
    }
    return out;
}

// Index buffers are range-checked here; the engine treats valid indices as a precondition.
static std::vector<IndexBuffer> to_index_buffers(const std::vector<std::vector<long>>& in,
                                                 const std::vector<VertexBuffer>& vbufs) {
    if (in.size() != vbufs.size()) {
        throw std::invalid_argument("got " + std::to_string(in.size()) + " index buffers for " +
                                    std::to_string(vbufs.size()) + " vertex buffers");
    }
    std::vector<IndexBuffer> out(in.size());
    for (size_t b = 0; b < in.size(); ++b) {
        out[b].reserve(in[b].size());
        for (long i : in[b]) {
            if (i < 0 || i > 0xFFFF || static_cast<size_t>(i) >= vbufs[b].size()) {
                throw std::invalid_argument("index " + std::to_string(i) + " out of range in buffer " +
                                            std::to_string(b));
            }
            out[b].push_back(static_cast<uint16_t>(i));
        }
    }
    return out;
}

static std::vector<FusedGroup> to_groups(const std::vector<std::vector<std::pair<int, int>>>& in) {
    std::vector<FusedGroup> out(in.size());
    for (size_t g = 0; g < in.size(); ++g) {
        for (auto& m : in[g]) out[g].push_back(VertexRef{m.first, m.second});
    }
    return out;
}

//======================================================================
// Result conversion
//======================================================================

static py::tuple vref(const VertexRef& r) { return py::make_tuple(r.buf, r.idx); }

// (fused_idx_to_buf_idx, buf_idx_to_fused_idx, is_fused)
static py::tuple fusion_to_py(const FusionIndex& f) {
    py::list groups;
    for (auto& g : f.fused_idx_to_buf_idx) {
        py::list members;
        for (auto& m : g) members.append(vref(m));
        groups.append(members);
    }
    py::list is_fused;
    for (auto& row : f.is_fused) {
        py::list flags;
        for (char c : row) flags.append(py::bool_(c != 0));
        is_fused.append(flags);
    }
    return py::make_tuple(groups, py::cast(f.buf_idx_to_fused_idx), is_fused);
}

//======================================================================
// Exposed functions
//======================================================================

static py::tuple py_vertex_fusion(const std::vector<std::vector<long>>& index_buffers,
                                  const py::sequence& vertex_buffers,
                                  double epsilon, double bin_size, bool fuse, bool verbose) {
    const std::vector<VertexBuffer> vbufs = to_vertex_buffers(vertex_buffers);
    const std::vector<IndexBuffer> ibufs = to_index_buffers(index_buffers, vbufs);

    FusionOptions opt;
    opt.epsilon = static_cast<float>(epsilon);
    opt.bin_size = static_cast<float>(bin_size);
    opt.fuse = fuse;
    opt.verbose = verbose;

    FusionIndex fusion; FusionReport rep; std::string err;
    bool ok;
    {
        py::gil_scoped_release release;
        ok = vertex_fusion(ibufs, vbufs, opt, fusion, rep, err);
    }
    if (!ok) throw std::runtime_error(err);
    return fusion_to_py(fusion);
}

static py::tuple py_fuse_adjacent_vertices(const py::sequence& vertex_buffers, double epsilon, double bin_size) {
    const std::vector<VertexBuffer> vbufs = to_vertex_buffers(vertex_buffers);
    FusionOptions opt;
    opt.epsilon = static_cast<float>(epsilon);
    opt.bin_size = static_cast<float>(bin_size);
    FusionIndex fusion; std::string err;
    if (!fuse_adjacent_vertices(vbufs, opt, fusion, err)) throw std::runtime_error(err);
    return fusion_to_py(fusion);
}

// Rebuilds the FusionIndex from groups; the reverse map must agree with what Python holds.
static FusionIndex fusion_from_groups(const std::vector<std::vector<std::pair<int, int>>>& groups,
                                      const std::vector<size_t>& sizes) {
    FusionIndex f; std::string err;
    if (!rebuild_fusion_index(to_groups(groups), sizes, f, err)) throw std::invalid_argument(err);
    return f;
}

static std::vector<size_t> sizes_from_indices(const std::vector<std::vector<int>>& buf_idx_to_fused_idx) {
    std::vector<size_t> sizes;
    for (auto& row : buf_idx_to_fused_idx) sizes.push_back(row.size());
    return sizes;
}

static py::dict py_detect_fully_fused_triangles(const std::vector<std::vector<long>>& index_buffers,
                                                const std::vector<std::vector<std::pair<int, int>>>& fused_idx_to_buf_idx,
                                                const std::vector<std::vector<int>>& buf_idx_to_fused_idx) {
    const std::vector<size_t> sizes = sizes_from_indices(buf_idx_to_fused_idx);
    FusionIndex f = fusion_from_groups(fused_idx_to_buf_idx, sizes);
    if (f.buf_idx_to_fused_idx != buf_idx_to_fused_idx) {
        throw std::invalid_argument("buf_idx_to_fused_idx does not match fused_idx_to_buf_idx");
    }
    std::vector<VertexBuffer> shape(sizes.size());
    for (size_t b = 0; b < sizes.size(); ++b) shape[b].pos.resize(sizes[b]);
    const std::vector<IndexBuffer> ibufs = to_index_buffers(index_buffers, shape);

    py::dict out;
    for (auto& kv : detect_fully_fused_triangles(ibufs, f)) {
        py::list tris;
        for (auto& t : kv.second) tris.append(py::make_tuple(t.buf, py::make_tuple(t.idx[0], t.idx[1], t.idx[2])));
        out[py::make_tuple(kv.first[0], kv.first[1], kv.first[2])] = tris;
    }
    return out;
}

static CollisionMap to_collisions(const py::dict& d) {
    CollisionMap out;
    for (auto kv : d) {
        auto key = kv.first.cast<std::array<int, 3>>();
        auto tris = kv.second.cast<std::vector<std::pair<int, std::array<int, 3>>>>();
        auto& dst = out[key];
        for (auto& t : tris) dst.push_back(TriangleRef{t.first, t.second});
    }
    return out;
}

static py::dict py_decide_on_unfusions(const std::vector<std::vector<long>>& index_buffers,
                                       const std::vector<std::vector<std::pair<int, int>>>& fused_idx_to_buf_idx,
                                       const py::dict& collisions) {
    const std::vector<FusedGroup> groups = to_groups(fused_idx_to_buf_idx);
    std::vector<size_t> sizes(index_buffers.size(), 0);
    for (auto& g : groups) {
        for (auto& m : g) {
            if (m.buf < 0 || static_cast<size_t>(m.buf) >= sizes.size() || m.idx < 0) {
                throw std::invalid_argument("fused vertex member out of range");
            }
            sizes[m.buf] = std::max(sizes[m.buf], static_cast<size_t>(m.idx) + 1);
        }
    }
    FusionIndex f; std::string err;
    if (!rebuild_fusion_index(groups, sizes, f, err)) throw std::invalid_argument(err);
    std::vector<VertexBuffer> shape(sizes.size());
    for (size_t b = 0; b < sizes.size(); ++b) shape[b].pos.resize(sizes[b]);
    const std::vector<IndexBuffer> ibufs = to_index_buffers(index_buffers, shape);

    const CollisionMap colliding = to_collisions(collisions);
    if (!check_collisions(ibufs, f, colliding, err)) throw std::invalid_argument(err);

    py::dict out;
    for (auto& kv : decide_on_unfusions(ibufs, f.fused_idx_to_buf_idx, colliding)) {
        py::set others;
        for (auto& o : kv.second) others.add(vref(o));
        out[vref(kv.first)] = others;
    }
    return out;
}

static py::tuple py_solve_unfusion(const py::sequence& vertex_buffers,
                                   const std::vector<std::vector<std::pair<int, int>>>& fused_idx_to_buf_idx,
                                   const py::dict& unfuse_verts_with) {
    const std::vector<VertexBuffer> vbufs = to_vertex_buffers(vertex_buffers);
    UnfuseMap unfuse;
    for (auto kv : unfuse_verts_with) {
        auto a = kv.first.cast<std::pair<int, int>>();
        auto& dst = unfuse[VertexRef{a.first, a.second}];
        for (auto o : kv.second) {
            auto b = o.cast<std::pair<int, int>>();
            dst.insert(VertexRef{b.first, b.second});
        }
    }
    FusionIndex f; std::string err;
    if (!solve_unfusion(vbufs, to_groups(fused_idx_to_buf_idx), unfuse, f, err)) throw std::runtime_error(err);
    return fusion_to_py(f);
}

static py::list py_split_submeshes(const std::vector<std::array<int, 3>>& triangles, size_t max_verts) {
    py::list out;
    for (auto& sm : split_submeshes(triangles, max_verts)) {
        out.append(py::make_tuple(py::cast(sm.verts), py::cast(sm.triangles)));
    }
    return out;
}

static py::tuple py_build_triangle_indices(const std::vector<std::array<uint16_t, 3>>& triangles) {
    TriangleIndices t = build_triangle_indices(triangles);
    return py::make_tuple(py::cast(t.list), py::cast(t.strip_noreset), py::cast(t.strip_reset));
}

//======================================================================
// Module definition
//======================================================================

PYBIND11_MODULE(gmdfuse_py, m) {
    m.doc() = "Python bindings for native gmdfuse vertex fusion/unfusion";
    m.attr("__version__") = GMDFUSE_VERSION;
    m.attr("MAX_SUBMESH_VERTS") = kMaxSubmeshVerts;
    m.attr("STRIP_RESTART") = kStripRestart;

    m.def("vertex_fusion", &py_vertex_fusion,
          py::arg("index_buffers"),
          py::arg("vertex_buffers"),
          py::arg("epsilon") = 1e-6,
          py::arg("bin_size") = 1e-4,
          py::arg("fuse") = true,
          py::arg("verbose") = false,
          R"doc(
Fuse vertices across all buffers, then unfuse until no two triangles share all three
fused vertices.

Parameters
----------
index_buffers : List[List[int]]
    Triangle lists, one per vertex buffer.
vertex_buffers : List[List[(x,y,z)] | Dict[str, List[tuple]]]
    Positions only, or a dict with "pos" plus attribute channels.
epsilon : float
    Max per-component position difference for two vertices to fuse.
bin_size : float
    Spatial bin edge used to find candidates; clamped to >= epsilon.
fuse : bool
    False returns the identity partition.
verbose : bool
    Emit per-round diagnostics on stderr.

Returns
-------
fused_idx_to_buf_idx : List[List[(buf, idx)]]
buf_idx_to_fused_idx : List[List[int]]
is_fused : List[List[bool]]
        )doc");

    m.def("fuse_adjacent_vertices", &py_fuse_adjacent_vertices,
          py::arg("vertex_buffers"),
          py::arg("epsilon") = 1e-6,
          py::arg("bin_size") = 1e-4,
          "Fusion stage only. Returns the same triple as vertex_fusion.");

    m.def("detect_fully_fused_triangles", &py_detect_fully_fused_triangles,
          py::arg("index_buffers"),
          py::arg("fused_idx_to_buf_idx"),
          py::arg("buf_idx_to_fused_idx"),
          "Map sorted fused-id triples to the (buf, (i,j,k)) triangles sharing them; only keys with 2+ triangles.");

    m.def("decide_on_unfusions", &py_decide_on_unfusions,
          py::arg("index_buffers"),
          py::arg("fused_idx_to_buf_idx"),
          py::arg("collisions"),
          "Symmetric dict (buf, idx) -> set of (buf, idx) that must end up in different fused vertices.");

    m.def("solve_unfusion", &py_solve_unfusion,
          py::arg("vertex_buffers"),
          py::arg("fused_idx_to_buf_idx"),
          py::arg("unfuse_verts_with"),
          "Split fused vertices so that no constrained pair shares one. Returns the same triple as vertex_fusion.");

    m.def("split_submeshes", &py_split_submeshes,
          py::arg("triangles"),
          py::arg("max_verts") = kMaxSubmeshVerts,
          "Pack triangles into submeshes of at most max_verts vertices. Returns List[(verts, local_triangles)].");

    m.def("build_triangle_indices", &py_build_triangle_indices,
          py::arg("triangles"),
          "Return (triangle_list, strip_without_restart, strip_with_restart) for one submesh.");
}
