#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include "core/MeshValidator.hpp"
#include <limits>

using namespace neuroforge;
using namespace neuroforge::test;

// ============================================
// Empty geometry
// ============================================

TEST(MeshValidatorTest, EmptyMeshReportsBothMissingCategories) {
    MeshValidator validator;
    ValidationResult result;
    ASSERT_NO_THROW(result = validator.validate(Mesh()));

    EXPECT_FALSE(result.is_valid());
    ASSERT_EQ(result.errors.size(), 2u);
    EXPECT_TRUE(contains_text(result.errors, "no vertices"));
    EXPECT_TRUE(contains_text(result.errors, "no faces"));
    EXPECT_DOUBLE_EQ(result.stats.volume_mm3, 0.0);
    EXPECT_DOUBLE_EQ(result.stats.area_mm2, 0.0);
    EXPECT_FALSE(result.stats.is_watertight);
    EXPECT_EQ(result.stats.body_count, 0u);
}

TEST(MeshValidatorTest, VerticesWithoutFacesReportsOnlyFaces) {
    MeshValidator validator;
    auto result = validator.validate(Mesh({{0, 0, 0}, {1, 1, 1}}, {}));

    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_TRUE(contains_text(result.errors, "no faces"));
    EXPECT_EQ(result.stats.vertex_count, 2u);
    EXPECT_EQ(result.stats.face_count, 0u);
}

// ============================================
// Critical checks
// ============================================

TEST(MeshValidatorTest, TenMillimeterCubeIsValid) {
    MeshValidator validator;
    auto result = validator.validate(make_cuboid(10, 10, 10));

    EXPECT_TRUE(result.is_valid());
    EXPECT_TRUE(result.errors.empty());
    EXPECT_TRUE(result.warnings.empty());
    EXPECT_TRUE(result.stats.is_watertight);
    EXPECT_NEAR(result.stats.volume_mm3, 1000.0, 1e-6);
    EXPECT_NEAR(result.stats.area_mm2, 600.0, 1e-6);
    EXPECT_EQ(result.stats.vertex_count, 8u);
    EXPECT_EQ(result.stats.face_count, 12u);
    EXPECT_EQ(result.stats.body_count, 1u);
}

TEST(MeshValidatorTest, OpenMeshIsNotWatertight) {
    MeshValidator validator;
    auto result = validator.validate(make_open_box());

    EXPECT_FALSE(result.is_valid());
    EXPECT_FALSE(result.stats.is_watertight);
    EXPECT_TRUE(contains_text(result.errors, "not watertight"));
    EXPECT_GT(result.stats.area_mm2, 0.0);
}

TEST(MeshValidatorTest, InsideOutMeshHasInvalidVolume) {
    MeshValidator validator;
    auto result = validator.validate(make_inverted_box(10));

    EXPECT_FALSE(result.is_valid());
    EXPECT_TRUE(result.stats.is_watertight);
    EXPECT_NEAR(result.stats.volume_mm3, -1000.0, 1e-6);
    EXPECT_TRUE(contains_text(result.errors, "Invalid volume"));
}

TEST(MeshValidatorTest, FlatClosedSurfaceHasInvalidVolume) {
    // Two copies of one triangle with opposite winding: watertight but no volume
    Mesh sheet({{0, 0, 0}, {10, 0, 0}, {0, 10, 0}}, {{0, 1, 2}, {0, 2, 1}});
    MeshValidator validator;
    auto result = validator.validate(sheet);

    EXPECT_TRUE(result.stats.is_watertight);
    EXPECT_FALSE(result.is_valid());
    EXPECT_TRUE(contains_text(result.errors, "Invalid volume"));
}

TEST(MeshValidatorTest, NonFiniteCoordinatesDoNotThrow) {
    Mesh box = make_box(10, 10, 10);
    std::vector<Point3D> vertices = box.vertices();
    vertices[0] = Point3D(std::numeric_limits<double>::quiet_NaN(), 0, 0);
    Mesh broken(vertices, box.faces());

    MeshValidator validator;
    ValidationResult result;
    ASSERT_NO_THROW(result = validator.validate(broken));

    EXPECT_FALSE(result.is_valid());
    EXPECT_TRUE(contains_text(result.errors, "Could not calculate volume"));
    EXPECT_DOUBLE_EQ(result.stats.volume_mm3, 0.0);
    EXPECT_DOUBLE_EQ(result.stats.area_mm2, 0.0);
}

// ============================================
// Warnings
// ============================================

TEST(MeshValidatorTest, MultipleBodiesWarnButStayValid) {
    MeshValidator validator;
    auto result = validator.validate(make_two_bodies());

    EXPECT_TRUE(result.is_valid());
    EXPECT_EQ(result.stats.body_count, 2u);
    EXPECT_TRUE(contains_text(result.warnings, "2 disconnected components"));
}

TEST(MeshValidatorTest, TinyVolumeWarns) {
    MeshValidator validator;
    auto result = validator.validate(make_box(0.5, 0.5, 0.5));

    EXPECT_TRUE(result.is_valid());
    EXPECT_NEAR(result.stats.volume_mm3, 0.125, 1e-9);
    EXPECT_TRUE(contains_text(result.warnings, "Very small volume"));
}

TEST(MeshValidatorTest, DegenerateFacesWarn) {
    Mesh box = make_box(10, 10, 10);
    std::vector<Face> faces = box.faces();
    faces.emplace_back(0, 1, 1);
    MeshValidator validator;
    auto result = validator.validate(box.with_faces(faces));

    EXPECT_TRUE(contains_text(result.warnings, "1 degenerate"));
}

TEST(MeshValidatorTest, HighPolygonCountWarns) {
    Mesh dense = make_cylinder(50.0, 20.0, 125001);
    ASSERT_GT(dense.num_faces(), MeshValidator::HIGH_POLY_FACE_COUNT);

    MeshValidator validator;
    auto result = validator.validate(dense);

    EXPECT_TRUE(result.is_valid());
    EXPECT_TRUE(contains_text(result.warnings, "High polygon count"));
}

// ============================================
// Logging
// ============================================

TEST(MeshValidatorTest, OutcomeGoesToObserver) {
    LogCapture capture;
    MeshValidator validator(capture.observer());

    validator.validate(make_box(10, 10, 10));
    EXPECT_TRUE(capture.contains("Mesh validation passed"));

    validator.validate(make_open_box());
    EXPECT_EQ(capture.count(LogLevel::ERROR), 1u);
    EXPECT_TRUE(capture.contains("Mesh validation failed"));

    for (const auto& record : capture.records()) {
        EXPECT_EQ(record.component, "MeshValidator");
    }
}
