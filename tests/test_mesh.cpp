#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include "core/Mesh.hpp"
#include <cmath>

using namespace neuroforge;
using namespace neuroforge::test;

// ============================================
// Construction
// ============================================

TEST(MeshTest, DefaultIsEmpty) {
    Mesh mesh;
    EXPECT_TRUE(mesh.empty());
    EXPECT_EQ(mesh.num_vertices(), 0u);
    EXPECT_EQ(mesh.num_faces(), 0u);
    EXPECT_FALSE(mesh.is_watertight());
    EXPECT_EQ(mesh.count_bodies(), 0u);
    EXPECT_DOUBLE_EQ(mesh.compute_volume(), 0.0);
    EXPECT_DOUBLE_EQ(mesh.compute_area(), 0.0);
}

TEST(MeshTest, VerticesWithoutFacesIsEmpty) {
    Mesh mesh({{0, 0, 0}, {1, 0, 0}}, {});
    EXPECT_TRUE(mesh.empty());
    EXPECT_EQ(mesh.num_vertices(), 2u);
}

TEST(MeshTest, OutOfRangeFaceIndexIsContractViolation) {
    EXPECT_THROW(Mesh({{0, 0, 0}, {1, 0, 0}, {0, 1, 0}}, {{0, 1, 3}}), MeshContractViolation);
}

TEST(MeshTest, ContractViolationNamesFaceAndVertex) {
    try {
        Mesh({{0, 0, 0}}, {{0, 0, 7}});
        FAIL() << "expected MeshContractViolation";
    } catch (const MeshContractViolation& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("Contract violation"), std::string::npos);
        EXPECT_NE(message.find("vertex 7"), std::string::npos);
    }
}

TEST(MeshTest, AccessorsCheckBounds) {
    Mesh box = make_box(10, 10, 10);
    EXPECT_NO_THROW(box.get_vertex(7));
    EXPECT_NO_THROW(box.get_face(11));
    EXPECT_THROW(box.get_vertex(8), std::out_of_range);
    EXPECT_THROW(box.get_face(12), std::out_of_range);
}

// ============================================
// Geometry
// ============================================

TEST(MeshTest, CubeVolumeAndArea) {
    Mesh cube = make_cuboid(10, 10, 10);
    EXPECT_NEAR(cube.compute_volume(), 1000.0, 1e-9);
    EXPECT_NEAR(cube.compute_area(), 600.0, 1e-9);
}

TEST(MeshTest, VolumeDoesNotDependOnPosition) {
    Mesh cube = make_box(10, 10, 10);
    Mesh moved = cube.translated(Vector3D(100, -250, 42));
    EXPECT_NEAR(moved.compute_volume(), cube.compute_volume(), 1e-6);
}

TEST(MeshTest, InvertedWindingGivesNegativeVolume) {
    EXPECT_NEAR(make_inverted_box(10).compute_volume(), -1000.0, 1e-9);
}

TEST(MeshTest, BoundingBoxExtents) {
    Mesh cuboid = make_cuboid(100, 50, 25);
    BoundingBox3D bbox = cuboid.compute_bounding_box();
    EXPECT_DOUBLE_EQ(bbox.min_x, 0.0);
    EXPECT_DOUBLE_EQ(bbox.max_x, 100.0);
    EXPECT_DOUBLE_EQ(bbox.extent_y(), 50.0);
    EXPECT_DOUBLE_EQ(bbox.extent_z(), 25.0);
    EXPECT_DOUBLE_EQ(bbox.max_extent(), 100.0);
    EXPECT_DOUBLE_EQ(bbox.min_extent(), 25.0);
}

TEST(MeshTest, FaceNormalFollowsWinding) {
    Mesh box = make_box(10, 10, 10);
    // Face 0 is on the bottom, face 2 on the top
    Vector3D bottom = box.compute_face_normal(0);
    Vector3D top = box.compute_face_normal(2);
    EXPECT_NEAR(bottom.z(), -1.0, 1e-12);
    EXPECT_NEAR(top.z(), 1.0, 1e-12);
}

TEST(MeshTest, FaceAreasMatchTotalArea) {
    Mesh sphere = make_icosphere(5.0, 2);
    auto areas = sphere.compute_face_areas();
    ASSERT_EQ(areas.size(), sphere.num_faces());
    double sum = 0.0;
    for (double a : areas) sum += a;
    EXPECT_NEAR(sum, sphere.compute_area(), 1e-9);
    EXPECT_NEAR(sphere.compute_face_area(0), areas[0], 1e-12);
}

TEST(MeshTest, CentroidOfCenteredBoxIsOrigin) {
    Point3D c = make_box(10, 20, 30).compute_centroid();
    EXPECT_NEAR(c.x(), 0.0, 1e-12);
    EXPECT_NEAR(c.y(), 0.0, 1e-12);
    EXPECT_NEAR(c.z(), 0.0, 1e-12);
}

TEST(MeshTest, CentroidOfZeroAreaMeshFallsBackToVertexMean) {
    Mesh degenerate({{0, 0, 0}, {2, 0, 0}, {4, 0, 0}}, {{0, 1, 2}});
    Point3D c = degenerate.compute_centroid();
    EXPECT_DOUBLE_EQ(c.x(), 2.0);
    EXPECT_DOUBLE_EQ(c.y(), 0.0);
}

// ============================================
// Topology
// ============================================

TEST(MeshTest, PrimitivesAreWatertightSingleBodies) {
    for (const Mesh& mesh : {make_box(10, 10, 10), make_icosphere(10, 2), make_cylinder(5, 10, 16)}) {
        EXPECT_TRUE(mesh.is_watertight());
        EXPECT_EQ(mesh.count_bodies(), 1u);
        EXPECT_GT(mesh.compute_volume(), 0.0);
    }
}

TEST(MeshTest, OpenBoxIsNotWatertight) {
    EXPECT_FALSE(make_open_box().is_watertight());
}

TEST(MeshTest, SingleFlippedFaceBreaksWatertightness) {
    EXPECT_FALSE(make_box_with_flipped_face().is_watertight());
}

TEST(MeshTest, SplitSeparatesBodies) {
    Mesh two = make_two_bodies(20, 2);
    EXPECT_EQ(two.count_bodies(), 2u);

    auto parts = two.split();
    ASSERT_EQ(parts.size(), 2u);
    for (const Mesh& part : parts) {
        EXPECT_EQ(part.num_vertices(), 8u);
        EXPECT_EQ(part.num_faces(), 12u);
        EXPECT_TRUE(part.is_watertight());
    }
    EXPECT_NEAR(parts[0].compute_volume(), 8000.0, 1e-6);
    EXPECT_NEAR(parts[1].compute_volume(), 8.0, 1e-9);
}

TEST(MeshTest, ConcatenateRenumbersIndices) {
    Mesh a = make_box(2, 2, 2);
    Mesh b = make_box(2, 2, 2).translated(Vector3D(10, 0, 0));
    Mesh joined = Mesh::concatenate({a, b});

    EXPECT_EQ(joined.num_vertices(), 16u);
    EXPECT_EQ(joined.num_faces(), 24u);
    EXPECT_EQ(joined.get_face(12)[0], b.get_face(0)[0] + 8);
    EXPECT_TRUE(joined.is_watertight());
    EXPECT_NEAR(joined.compute_volume(), 16.0, 1e-9);
}

// ============================================
// Transforms
// ============================================

TEST(MeshTest, ScaledMultipliesVolumeByCube) {
    Mesh cube = make_box(10, 10, 10);
    Mesh doubled = cube.scaled(2.0);
    EXPECT_NEAR(doubled.compute_volume(), 8000.0, 1e-6);
    EXPECT_NEAR(cube.compute_volume(), 1000.0, 1e-9);  // input untouched
}

TEST(MeshTest, TranslatedMovesBoundingBox) {
    Mesh moved = make_box(10, 10, 10).translated(Vector3D(5, 0, -5));
    BoundingBox3D bbox = moved.compute_bounding_box();
    EXPECT_DOUBLE_EQ(bbox.min_x, 0.0);
    EXPECT_DOUBLE_EQ(bbox.max_z, 0.0);
}

TEST(MeshTest, WithFacesKeepsVertices) {
    Mesh box = make_box(10, 10, 10);
    Mesh fewer = box.with_faces({box.get_face(0)});
    EXPECT_EQ(fewer.num_vertices(), 8u);
    EXPECT_EQ(fewer.num_faces(), 1u);
}

TEST(MeshTest, EdgeIdIsOrderIndependent) {
    EXPECT_EQ(make_edge_id(3, 9), make_edge_id(9, 3));
    EXPECT_NE(make_edge_id(3, 9), make_edge_id(3, 10));
}
