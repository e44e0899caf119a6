// Orchestrator: full fuse/detect/decide/solve runs and their report.

#include "test_util.hpp"
#include <gtest/gtest.h>

namespace {

bool run(const std::vector<IndexBuffer>& ibufs, const std::vector<VertexBuffer>& vbufs,
         FusionIndex& out, FusionReport& rep, const FusionOptions& opt = FusionOptions()) {
    std::string err;
    const bool ok = vertex_fusion(ibufs, vbufs, opt, out, rep, err);
    EXPECT_TRUE(ok) << err;
    return ok;
}

} // namespace

//    -A-
//  /  |  \
//  B--CD--E     C and D coincide but belong to different halves; fusing them is harmless.
//  \  |  /
//    -F-
TEST(VertexFusion, HexWithSplitCentreFusesCentre) {
    std::vector<VertexBuffer> vbufs{make_buffer({v(0, 1, 0), v(1, 0, 0), v(0, 0, 0), v(0, 0, 0), v(-1, 0, 0), v(0, -1, 0)})};
    std::vector<IndexBuffer> ibufs{make_indices({0, 1, 2, 1, 2, 5, 0, 3, 4, 3, 4, 5})};

    FusionIndex f; FusionReport rep;
    ASSERT_TRUE(run(ibufs, vbufs, f, rep));

    const std::vector<FusedGroup> expected{{{0, 0}}, {{0, 1}}, {{0, 2}, {0, 3}}, {{0, 4}}, {{0, 5}}};
    EXPECT_EQ(f.fused_idx_to_buf_idx, expected);
    ASSERT_EQ(f.buf_idx_to_fused_idx.size(), 1u);
    ASSERT_EQ(f.is_fused.size(), 1u);
    EXPECT_EQ(f.buf_idx_to_fused_idx[0], (std::vector<int>{0, 1, 2, 2, 3, 4}));
    EXPECT_EQ(f.is_fused[0], (std::vector<char>{0, 0, 0, 1, 0, 0}));

    EXPECT_EQ(rep.verts_before, 6u);
    EXPECT_EQ(rep.verts_after, 5u);
    EXPECT_EQ(rep.rounds, 0u);
    EXPECT_EQ(rep.collisions_resolved, 0u);
    EXPECT_EQ(rep.unresolved_collisions, 0u);
}

TEST(VertexFusion, DuplicateTriangleStackIsPulledApart) {
    std::vector<VertexBuffer> vbufs{make_buffer({v(0, 0, 0), v(1, 0, 0), v(0, 1, 0),
                                                 v(0, 0, 0), v(1, 0, 0), v(0, 1, 0)})};
    std::vector<IndexBuffer> ibufs{make_indices({0, 1, 2, 3, 4, 5})};

    FusionIndex f; FusionReport rep;
    ASSERT_TRUE(run(ibufs, vbufs, f, rep));
    EXPECT_TRUE(detect_fully_fused_triangles(ibufs, f).empty());
    EXPECT_GT(f.num_fused(), 3u);
    EXPECT_EQ(rep.rounds, 1u);
    EXPECT_EQ(rep.collisions_resolved, 1u);
    expect_partition(f, vbufs);
}

TEST(VertexFusion, TwoLayerStackKeepsSurroundingSurfaceFused) {
    // A' and B' of the lower layer are shared with the uncontested XYB'/XA'B' fan.
    std::vector<VertexBuffer> vbufs{make_buffer({
        v(3, 1, 0), v(2, 0, 0), v(4, 0, 0), v(4, 0, 0), v(5, 1, 0), v(6, 0, 0),
        v(3, 1, 0), v(2, 0, 0), v(4, 0, 0), v(5, 1, 0), v(6, 0, 0),
        v(1, 1, 0), v(0, 0, 0),
    })};
    std::vector<IndexBuffer> ibufs{make_indices({0, 1, 2, 0, 2, 4, 3, 4, 5, 6, 7, 8, 6, 8, 9, 8, 9, 10, 11, 12, 7, 11, 6, 7})};

    FusionIndex f; FusionReport rep;
    ASSERT_TRUE(run(ibufs, vbufs, f, rep));
    EXPECT_EQ(f.fused_idx_to_buf_idx[0], (FusedGroup{{0, 0}, {0, 6}}));
    EXPECT_EQ(f.fused_idx_to_buf_idx[1], (FusedGroup{{0, 1}, {0, 7}}));
    EXPECT_EQ(f.fused_idx_to_buf_idx[2], (FusedGroup{{0, 2}, {0, 3}}));
    EXPECT_EQ(f.num_fused(), 10u);
    EXPECT_EQ(rep.rounds, 1u);
    EXPECT_EQ(rep.collisions_resolved, 3u);
    EXPECT_TRUE(detect_fully_fused_triangles(ibufs, f).empty());
}

TEST(VertexFusion, CollisionsAcrossBuffersResolve) {
    // Buffer 1 duplicates buffer 0's triangle; the fan in buffer 0 anchors A and B.
    std::vector<VertexBuffer> vbufs{
        make_buffer({v(0, 0, 0), v(1, 0, 0), v(0, 1, 0), v(-1, -1, 0)}),
        make_buffer({v(0, 0, 0), v(1, 0, 0), v(0, 1, 0)}),
    };
    std::vector<IndexBuffer> ibufs{make_indices({0, 1, 2, 0, 3, 1}), make_indices({0, 1, 2})};

    FusionIndex f; FusionReport rep;
    ASSERT_TRUE(run(ibufs, vbufs, f, rep));
    EXPECT_TRUE(detect_fully_fused_triangles(ibufs, f).empty());
    // Only the interior corner C is torn; A and B stay fused across the seam.
    const std::vector<FusedGroup> expected{
        {{0, 0}, {1, 0}}, {{0, 1}, {1, 1}}, {{0, 2}}, {{0, 3}}, {{1, 2}},
    };
    EXPECT_EQ(f.fused_idx_to_buf_idx, expected);
    EXPECT_EQ(f.buf_idx_to_fused_idx[1], (std::vector<int>{0, 1, 4}));
    EXPECT_EQ(f.is_fused[1], (std::vector<char>{1, 1, 0}));
}

TEST(VertexFusion, ResultIsStableUnderRerun) {
    std::vector<VertexBuffer> vbufs{make_buffer({v(0, 0, 0), v(1, 0, 0), v(0, 1, 0),
                                                 v(0, 0, 0), v(1, 0, 0), v(0, 1, 0), v(1, 1, 0)})};
    std::vector<IndexBuffer> ibufs{make_indices({0, 1, 2, 3, 4, 5, 1, 6, 2})};

    FusionIndex a, b; FusionReport ra, rb;
    ASSERT_TRUE(run(ibufs, vbufs, a, ra));
    ASSERT_TRUE(run(ibufs, vbufs, b, rb));
    EXPECT_EQ(a.fused_idx_to_buf_idx, b.fused_idx_to_buf_idx);
    EXPECT_EQ(a.buf_idx_to_fused_idx, b.buf_idx_to_fused_idx);
    EXPECT_EQ(a.is_fused, b.is_fused);

    // Solving with no constraint leaves a resolved partition untouched.
    FusionIndex again; std::string err;
    ASSERT_TRUE(solve_unfusion(vbufs, a.fused_idx_to_buf_idx, UnfuseMap(), again, err)) << err;
    EXPECT_EQ(again.fused_idx_to_buf_idx, a.fused_idx_to_buf_idx);
}

TEST(VertexFusion, ExactDuplicateTrianglesAreReportedNotLooped) {
    std::vector<VertexBuffer> vbufs{make_buffer({v(0, 0, 0), v(1, 0, 0), v(0, 1, 0)})};
    std::vector<IndexBuffer> ibufs{make_indices({0, 1, 2, 0, 1, 2})};

    FusionIndex f; FusionReport rep;
    ASSERT_TRUE(run(ibufs, vbufs, f, rep));
    EXPECT_EQ(f.num_fused(), 3u);
    EXPECT_EQ(rep.rounds, 0u);
    EXPECT_EQ(rep.unresolved_collisions, 1u);
}

TEST(VertexFusion, NoFuseGivesIdentityPartition) {
    std::vector<VertexBuffer> vbufs{make_buffer({v(0, 0, 0), v(0, 0, 0), v(1, 0, 0)})};
    std::vector<IndexBuffer> ibufs{make_indices({0, 1, 2})};
    FusionOptions opt;
    opt.fuse = false;

    FusionIndex f; FusionReport rep;
    ASSERT_TRUE(run(ibufs, vbufs, f, rep, opt));
    EXPECT_EQ(f.num_fused(), 3u);
    EXPECT_EQ(rep.verts_after, 3u);
    EXPECT_EQ(f.is_fused[0], (std::vector<char>{0, 0, 0}));
}

TEST(VertexFusion, RejectsBufferCountMismatch) {
    std::vector<VertexBuffer> vbufs{make_buffer({v(0, 0, 0), v(1, 0, 0), v(0, 1, 0)})};
    std::vector<IndexBuffer> ibufs{make_indices({0, 1, 2}), make_indices({0, 1, 2})};

    FusionIndex f; FusionReport rep; std::string err;
    EXPECT_FALSE(vertex_fusion(ibufs, vbufs, FusionOptions(), f, rep, err));
    EXPECT_EQ(err, "got 2 index buffers for 1 vertex buffers");
    EXPECT_EQ(f.num_fused(), 0u);
}

TEST(VertexFusion, EmptyInputIsEmptyOutput) {
    FusionIndex f; FusionReport rep;
    ASSERT_TRUE(run({}, {}, f, rep));
    EXPECT_EQ(f.num_fused(), 0u);
    EXPECT_TRUE(f.buf_idx_to_fused_idx.empty());
}

TEST(VertexFusion, TrailingIndicesAreIgnored) {
    std::vector<VertexBuffer> vbufs{make_buffer({v(0, 0, 0), v(1, 0, 0), v(0, 1, 0)})};
    std::vector<IndexBuffer> ibufs{make_indices({0, 1, 2, 0, 1})};
    FusionIndex f; FusionReport rep;
    ASSERT_TRUE(run(ibufs, vbufs, f, rep));
    EXPECT_EQ(rep.unresolved_collisions, 0u);
}
