// OBJ interchange: multi-object loading and fused-mesh saving.

#include "io_obj.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>
#include <fstream>
#include <sstream>

namespace {

std::string write_temp(const std::string& name, const std::string& text) {
    const std::string path = ::testing::TempDir() + name;
    std::ofstream ofs(path);
    ofs << text;
    return path;
}

std::string read_all(const std::string& path) {
    std::ifstream ifs(path);
    std::stringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

} // namespace

TEST(LoadObj, EachObjectBecomesABuffer) {
    const std::string path = write_temp("gmdfuse_two_objects.obj",
        "# two objects\n"
        "o first\n"
        "v 0 0 0\n"
        "v 1 0 0\n"
        "v 0 1 0\n"
        "f 1 2 3\n"
        "o second\n"
        "g second_group\n"
        "v 0 0 0\n"
        "v 1 0 0\n"
        "v 0 1 0\n"
        "vn 0 0 1\n"
        "vn 0 0 1\n"
        "vn 0 0 1\r\n"
        "f 4/1/4 5//5 6\n");

    std::vector<VertexBuffer> vbufs; std::vector<IndexBuffer> ibufs; std::string err;
    ASSERT_TRUE(load_obj_buffers(path, vbufs, ibufs, err)) << err;
    ASSERT_EQ(vbufs.size(), 2u);
    ASSERT_EQ(ibufs.size(), 2u);
    EXPECT_EQ(vbufs[0].size(), 3u);
    EXPECT_TRUE(vbufs[0].channels.empty());
    EXPECT_EQ(ibufs[0], (IndexBuffer{0, 1, 2}));

    EXPECT_EQ(vbufs[1].size(), 3u);
    ASSERT_EQ(vbufs[1].channels.size(), 1u);
    EXPECT_EQ(vbufs[1].channels[0].name, "normal");
    EXPECT_EQ(vbufs[1].channels[0].arity, 3);
    EXPECT_EQ(vbufs[1].channels[0].data.size(), 9u);
    EXPECT_EQ(ibufs[1], (IndexBuffer{0, 1, 2}));
}

TEST(LoadObj, MismatchedNormalsAreDropped) {
    const std::string path = write_temp("gmdfuse_partial_normals.obj",
        "v 0 0 0\nv 1 0 0\nv 0 1 0\nvn 0 0 1\nf 1 2 3\n");
    std::vector<VertexBuffer> vbufs; std::vector<IndexBuffer> ibufs; std::string err;
    ASSERT_TRUE(load_obj_buffers(path, vbufs, ibufs, err)) << err;
    ASSERT_EQ(vbufs.size(), 1u);
    EXPECT_TRUE(vbufs[0].channels.empty());
}

TEST(LoadObj, RejectsFaceReachingIntoAnotherObject) {
    const std::string path = write_temp("gmdfuse_cross_object.obj",
        "o a\nv 0 0 0\nv 1 0 0\nv 0 1 0\nf 1 2 3\n"
        "o b\nv 0 0 0\nv 1 0 0\nv 0 1 0\nf 1 5 6\n");
    std::vector<VertexBuffer> vbufs; std::vector<IndexBuffer> ibufs; std::string err;
    EXPECT_FALSE(load_obj_buffers(path, vbufs, ibufs, err));
    EXPECT_NE(err.find(":10:"), std::string::npos) << err;
    EXPECT_NE(err.find("outside the current object"), std::string::npos) << err;
}

TEST(LoadObj, RejectsBadInput) {
    std::vector<VertexBuffer> vbufs; std::vector<IndexBuffer> ibufs; std::string err;

    EXPECT_FALSE(load_obj_buffers(::testing::TempDir() + "gmdfuse_missing.obj", vbufs, ibufs, err));
    EXPECT_NE(err.find("cannot open"), std::string::npos);

    EXPECT_FALSE(load_obj_buffers(write_temp("gmdfuse_zero_index.obj", "v 0 0 0\nf 0 1 1\n"), vbufs, ibufs, err));
    EXPECT_NE(err.find("bad face index '0'"), std::string::npos);

    EXPECT_FALSE(load_obj_buffers(write_temp("gmdfuse_bad_vertex.obj", "v 0 zero 0\n"), vbufs, ibufs, err));
    EXPECT_NE(err.find("malformed vertex"), std::string::npos);

    EXPECT_FALSE(load_obj_buffers(write_temp("gmdfuse_no_faces.obj", "# nothing\nv 0 0 0\n"), vbufs, ibufs, err));
    EXPECT_NE(err.find("empty mesh"), std::string::npos);
}

TEST(SaveObj, WritesFusedVerticesAndFacesPerBuffer) {
    std::vector<VertexBuffer> vbufs{
        make_buffer({v(0, 0, 0), v(1, 0, 0), v(0, 1, 0)}),
        make_buffer({v(1, 0, 0), v(0, 1, 0), v(1, 1, 0)}),
    };
    std::vector<IndexBuffer> ibufs{make_indices({0, 1, 2}), make_indices({0, 2, 1})};
    FusionIndex f; FusionReport rep; std::string err;
    ASSERT_TRUE(vertex_fusion(ibufs, vbufs, FusionOptions(), f, rep, err)) << err;
    FusedMesh mesh;
    ASSERT_TRUE(build_fused_mesh(ibufs, vbufs, f, mesh, err)) << err;

    const std::string path = ::testing::TempDir() + "gmdfuse_saved.obj";
    ASSERT_TRUE(save_obj_fused(path, mesh, err)) << err;
    EXPECT_EQ(read_all(path),
              "# gmdfuse output\n"
              "v 0 0 0\n"
              "v 1 0 0\n"
              "v 0 1 0\n"
              "v 1 1 0\n"
              "o buffer0\n"
              "f 1 2 3\n"
              "o buffer1\n"
              "f 2 4 3\n");
}

TEST(LoadObj, GroupsDoNotSplitBuffers) {
    const std::string path = write_temp("gmdfuse_group_after_verts.obj",
        "o quad\n"
        "v 0 0 0\nv 1 0 0\nv 0 1 0\nv 1 1 0\n"
        "g lower\nf 1 2 3\n"
        "g upper\nf 2 4 3\n");
    std::vector<VertexBuffer> vbufs; std::vector<IndexBuffer> ibufs; std::string err;
    ASSERT_TRUE(load_obj_buffers(path, vbufs, ibufs, err)) << err;
    ASSERT_EQ(vbufs.size(), 1u);
    EXPECT_EQ(vbufs[0].size(), 4u);
    EXPECT_EQ(ibufs[0], (IndexBuffer{0, 1, 2, 1, 3, 2}));
}

TEST(SaveObj, WritesPositionsBitExact) {
    const Vec3f p{0.1f, 1.00000012f, -3.14159274f};
    std::vector<VertexBuffer> vbufs{make_buffer({p, v(1, 0, 0), v(0, 1, 0)})};
    std::vector<IndexBuffer> ibufs{make_indices({0, 1, 2})};
    FusionIndex f; FusionReport rep; std::string err;
    ASSERT_TRUE(vertex_fusion(ibufs, vbufs, FusionOptions(), f, rep, err)) << err;
    FusedMesh mesh;
    ASSERT_TRUE(build_fused_mesh(ibufs, vbufs, f, mesh, err)) << err;

    const std::string path = ::testing::TempDir() + "gmdfuse_precision.obj";
    ASSERT_TRUE(save_obj_fused(path, mesh, err)) << err;

    std::istringstream lines(read_all(path));
    std::string banner, line;
    std::getline(lines, banner);
    ASSERT_TRUE(static_cast<bool>(std::getline(lines, line)));
    std::istringstream iss(line);
    std::string tok; Vec3f q;
    iss >> tok >> q.x >> q.y >> q.z;
    ASSERT_TRUE(static_cast<bool>(iss)) << line;
    EXPECT_EQ(tok, "v");
    EXPECT_EQ(q.x, p.x);
    EXPECT_EQ(q.y, p.y);
    EXPECT_EQ(q.z, p.z);
}
