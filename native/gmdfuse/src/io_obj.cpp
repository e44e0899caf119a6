// io_obj.cpp — Multi-object OBJ reader/writer used to run the fusion engine offline on
// meshes dumped by the Python side. Robust enough for well-formed files our own exporter
// writes; anything it cannot map onto 16-bit buffer-local indices is rejected.

#include "io_obj.hpp"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <utility>

// Trim trailing whitespace (incl. CR/LF). OBJ is line-oriented so this is sufficient
// to normalize lines before tokenizing with stringstreams.
static inline void trim(std::string& s) {
    while (!s.empty() && (s.back()=='\n' || s.back()=='\r' || s.back()==' ' || s.back()=='\t')) s.pop_back();
}

// Accept "12", "12/34", "12//56", "12/34/56"; only the position index is used.
static bool parse_idx(const std::string& tok, long& out) {
    size_t p = tok.find('/');
    std::string a = (p==std::string::npos)? tok : tok.substr(0,p);
    if (a.empty()) return false;
    errno = 0;
    char* end = nullptr;
    out = std::strtol(a.c_str(), &end, 10);
    return errno == 0 && end && *end == '\0' && out > 0;
}

namespace {

// Loader state for one object: base is the global (0-based) index of its first `v`.
struct PendingBuffer {
    size_t base = 0;
    VertexBuffer vb;
    IndexBuffer ib;
    std::vector<Vec3f> normals;
};

} // namespace

bool load_obj_buffers(const std::string& path, std::vector<VertexBuffer>& vertex_buffers,
                      std::vector<IndexBuffer>& index_buffers, std::string& err) {
    vertex_buffers.clear(); index_buffers.clear(); // ensure targets are empty before filling
    std::ifstream ifs(path);
    if (!ifs) { err = "cannot open: " + path; return false; }

    std::vector<PendingBuffer> bufs;
    size_t total_verts = 0;
    auto start_buffer = [&](){
        // Consecutive o records with nothing in between share one buffer.
        if (!bufs.empty() && bufs.back().vb.pos.empty() && bufs.back().ib.empty()) return;
        bufs.emplace_back();
        bufs.back().base = total_verts;
    };

    std::string line;
    size_t line_no = 0;
    while (std::getline(ifs, line)) {
        ++line_no;
        trim(line);
        if (line.empty() || line[0]=='#') continue; // ignore comments/blank lines
        std::istringstream iss(line);
        std::string tok; iss >> tok; // first token is the record type
        if (tok == "o") {
            start_buffer();
        } else if (tok == "v") {
            if (bufs.empty()) start_buffer();
            Vec3f v; iss >> v.x >> v.y >> v.z;
            if (!iss) { err = path + ":" + std::to_string(line_no) + ": malformed vertex"; return false; }
            bufs.back().vb.pos.push_back(v);
            ++total_verts;
        } else if (tok == "vn") {
            if (bufs.empty()) start_buffer();
            Vec3f n; iss >> n.x >> n.y >> n.z;
            if (!iss) { err = path + ":" + std::to_string(line_no) + ": malformed normal"; return false; }
            bufs.back().normals.push_back(n);
        } else if (tok == "f") {
            if (bufs.empty()) start_buffer();
            PendingBuffer& pb = bufs.back();
            std::string s[3]; iss >> s[0] >> s[1] >> s[2];
            for (int k = 0; k < 3; ++k) {
                long idx = 0;
                if (!parse_idx(s[k], idx)) {
                    err = path + ":" + std::to_string(line_no) + ": bad face index '" + s[k] + "'";
                    return false;
                }
                // Convert 1-based global OBJ indices to 0-based buffer-local indices.
                const long local = idx - 1 - static_cast<long>(pb.base);
                if (local < 0 || static_cast<size_t>(local) >= pb.vb.pos.size()) {
                    err = path + ":" + std::to_string(line_no) + ": face index " + s[k] +
                          " is outside the current object";
                    return false;
                }
                if (local > 0xFFFF) {
                    err = path + ":" + std::to_string(line_no) + ": object exceeds 16-bit indices";
                    return false;
                }
                pb.ib.push_back(static_cast<uint16_t>(local));
            }
        }
        // Other directives (g, vt, usemtl, mtllib, s, etc.) are ignored; groups do not split buffers.
    }

    for (auto& pb : bufs) {
        if (!pb.normals.empty()) {
            if (pb.normals.size() == pb.vb.pos.size()) {
                AttributeChannel& ch = pb.vb.add_channel("normal", 3);
                ch.data.reserve(pb.normals.size() * 3);
                for (auto& n : pb.normals) { ch.data.push_back(n.x); ch.data.push_back(n.y); ch.data.push_back(n.z); }
            } else {
                fprintf(stderr, "[cpp] %s: %zu normals for %zu vertices, ignoring normals\n",
                        path.c_str(), pb.normals.size(), pb.vb.pos.size());
            }
        }
        vertex_buffers.push_back(std::move(pb.vb));
        index_buffers.push_back(std::move(pb.ib));
    }

    // Basic sanity: require at least one vertex and one face.
    if (total_verts == 0) { err = "empty mesh from: " + path; return false; }
    bool any_face = false;
    for (auto& ib : index_buffers) any_face = any_face || !ib.empty();
    if (!any_face) { err = "empty mesh from: " + path; return false; }
    return true;
}

bool save_obj_fused(const std::string& path, const FusedMesh& mesh, std::string& err) {
    std::ofstream ofs(path);
    if (!ofs) { err = "cannot write: " + path; return false; }
    ofs.precision(std::numeric_limits<float>::max_digits10); // reloads bit-exact
    ofs << "# gmdfuse output\n"; // simple banner for debugging
    // Emit fused vertex positions.
    for (auto& v : mesh.verts) {
        ofs << "v " << v.x << ' ' << v.y << ' ' << v.z << '\n';
    }
    // Emit faces grouped by source buffer. OBJ is 1-based, so we add 1 to each index.
    int cur_buf = -1;
    for (auto& f : mesh.faces) {
        if (f.buf != cur_buf) { cur_buf = f.buf; ofs << "o buffer" << cur_buf << '\n'; }
        ofs << "f " << (f.v[0]+1) << ' ' << (f.v[1]+1) << ' ' << (f.v[2]+1) << '\n';
    }
    if (!ofs) { err = "write failed: " + path; return false; }
    return true;
}
