// mesh.cpp — Helpers on top of the buffer containers and FusionIndex rebuild.

#include "mesh.hpp"
#include <algorithm>
#include <cstring>
#include <utility>

AttributeChannel& VertexBuffer::add_channel(const std::string& name, int arity) {
    channels.push_back(AttributeChannel{name, arity, {}});
    return channels.back();
}

bool VertexBuffer::same_layout(const VertexBuffer& o) const {
    if (channels.size() != o.channels.size()) return false;
    for (size_t c = 0; c < channels.size(); ++c) {
        if (channels[c].name != o.channels[c].name || channels[c].arity != o.channels[c].arity) return false;
    }
    return true;
}

void VertexBuffer::clear() {
    pos.clear();
    channels.clear();
}

void FusionIndex::clear() {
    fused_idx_to_buf_idx.clear();
    buf_idx_to_fused_idx.clear();
    is_fused.clear();
}

// Bit pattern of a float with -0.0 folded into +0.0.
static inline uint32_t normalized_bits(float f) {
    if (f == 0.0f) f = 0.0f;
    uint32_t u; std::memcpy(&u, &f, sizeof(u));
    return u;
}

bool attributes_equal(const VertexBuffer& a, int ia, const VertexBuffer& b, int ib) {
    if (&a != &b && !a.same_layout(b)) return false;
    for (size_t c = 0; c < a.channels.size(); ++c) {
        const AttributeChannel& ca = a.channels[c];
        const AttributeChannel& cb = b.channels[c];
        const size_t n = static_cast<size_t>(ca.arity);
        const float* pa = ca.data.data() + n * static_cast<size_t>(ia);
        const float* pb = cb.data.data() + n * static_cast<size_t>(ib);
        for (size_t k = 0; k < n; ++k) {
            if (normalized_bits(pa[k]) != normalized_bits(pb[k])) return false;
        }
    }
    return true;
}

std::vector<size_t> buffer_sizes(const std::vector<VertexBuffer>& vertex_buffers) {
    std::vector<size_t> sizes;
    sizes.reserve(vertex_buffers.size());
    for (auto& vb : vertex_buffers) sizes.push_back(vb.size());
    return sizes;
}

bool rebuild_fusion_index(std::vector<FusedGroup> groups,
                          const std::vector<size_t>& buf_sizes,
                          FusionIndex& out, std::string& err) {
    out.clear();
    // The lowest member is the representative, whatever order the caller listed them in.
    for (auto& g : groups) std::sort(g.begin(), g.end());
    // Fused ids are assigned in order of each group's lowest member.
    std::sort(groups.begin(), groups.end(), [](const FusedGroup& a, const FusedGroup& b) {
        if (a.empty() || b.empty()) return !a.empty() && b.empty();
        return a.front() < b.front();
    });

    out.buf_idx_to_fused_idx.resize(buf_sizes.size());
    out.is_fused.resize(buf_sizes.size());
    for (size_t b = 0; b < buf_sizes.size(); ++b) {
        out.buf_idx_to_fused_idx[b].assign(buf_sizes[b], -1);
        out.is_fused[b].assign(buf_sizes[b], 0);
    }

    size_t covered = 0;
    for (size_t fi = 0; fi < groups.size(); ++fi) {
        const FusedGroup& g = groups[fi];
        if (g.empty()) { err = "empty fused group"; out.clear(); return false; }
        for (size_t m = 0; m < g.size(); ++m) {
            const VertexRef& r = g[m];
            if (r.buf < 0 || static_cast<size_t>(r.buf) >= buf_sizes.size() ||
                r.idx < 0 || static_cast<size_t>(r.idx) >= buf_sizes[r.buf]) {
                err = "fused group references vertex (" + std::to_string(r.buf) + ", " +
                      std::to_string(r.idx) + ") outside its buffer";
                out.clear(); return false;
            }
            int& slot = out.buf_idx_to_fused_idx[r.buf][r.idx];
            if (slot != -1) {
                err = "vertex (" + std::to_string(r.buf) + ", " + std::to_string(r.idx) +
                      ") is in fused groups " + std::to_string(slot) + " and " + std::to_string(fi);
                out.clear(); return false;
            }
            slot = static_cast<int>(fi);
            out.is_fused[r.buf][r.idx] = m == 0 ? 0 : 1;
            ++covered;
        }
    }

    size_t total = 0;
    for (size_t n : buf_sizes) total += n;
    if (covered != total) {
        err = "fused groups cover " + std::to_string(covered) + " of " + std::to_string(total) + " vertices";
        out.clear(); return false;
    }

    out.fused_idx_to_buf_idx = std::move(groups);
    return true;
}
