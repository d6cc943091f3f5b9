#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include "core/ProcessingPipeline.hpp"
#include <filesystem>
#include <fstream>
#include <thread>

using namespace neuroforge;
using namespace neuroforge::test;

namespace {

PipelineConfig config_with(double target, bool auto_repair, bool auto_scale) {
    PipelineConfig config;
    config.target_size_mm = target;
    config.auto_repair = auto_repair;
    config.auto_scale = auto_scale;
    return config;
}

} // namespace

// ============================================
// Scenarios
// ============================================

TEST(ProcessingPipelineTest, ScalesLargeCubeDownToTarget) {
    ProcessingPipeline pipeline(config_with(100.0, true, true));
    PipelineResult result = pipeline.process(make_cuboid(200, 200, 200));

    EXPECT_TRUE(result.is_valid());
    EXPECT_TRUE(result.scaled);
    EXPECT_FALSE(result.repaired);
    EXPECT_NEAR(result.mesh.compute_bounding_box().max_extent(), 100.0, 1e-6);
    EXPECT_NEAR(result.stats.volume_mm3, 1000000.0, 1e-3);
    EXPECT_FALSE(result.output_path.has_value());
}

TEST(ProcessingPipelineTest, ScalingDisabledKeepsSize) {
    ProcessingPipeline pipeline(config_with(100.0, true, false));
    PipelineResult result = pipeline.process(make_cuboid(200, 200, 200));

    EXPECT_TRUE(result.is_valid());
    EXPECT_FALSE(result.scaled);
    EXPECT_NEAR(result.mesh.compute_bounding_box().max_extent(), 200.0, 1e-9);
    EXPECT_NEAR(result.stats.volume_mm3, 8000000.0, 1e-3);
}

TEST(ProcessingPipelineTest, ScaledMeshIsCentered) {
    ProcessingPipeline pipeline;
    PipelineResult result = pipeline.process(make_cuboid(40, 20, 10));
    Point3D c = result.mesh.compute_centroid();
    EXPECT_NEAR(c.x(), 0.0, 1e-3);
    EXPECT_NEAR(c.y(), 0.0, 1e-3);
    EXPECT_NEAR(c.z(), 0.0, 1e-3);
}

TEST(ProcessingPipelineTest, EmptyMeshIsNeverWritten) {
    TempDir dir("pipeline_empty");
    std::string path = dir.file("nested/empty.stl");

    ProcessingPipeline pipeline;
    PipelineResult result;
    ASSERT_NO_THROW(result = pipeline.process(Mesh(), path));

    EXPECT_FALSE(result.is_valid());
    EXPECT_FALSE(result.output_path.has_value());
    EXPECT_FALSE(std::filesystem::exists(path));
    EXPECT_TRUE(contains_text(result.errors, "no faces"));
}

TEST(ProcessingPipelineTest, VerticesOnlyMeshIsRejected) {
    ProcessingPipeline pipeline;
    PipelineResult result = pipeline.process(Mesh({{0, 0, 0}, {1, 0, 0}, {0, 1, 0}}, {}));
    EXPECT_FALSE(result.is_valid());
    EXPECT_TRUE(contains_text(result.errors, "no faces"));
}

TEST(ProcessingPipelineTest, RepairsAndWritesOpenMesh) {
    TempDir dir("pipeline_repair");
    std::string path = dir.file("out/fixed.stl");

    ProcessingPipeline pipeline(config_with(50.0, true, true));
    PipelineResult result = pipeline.process(make_open_box(10.0), path);

    EXPECT_TRUE(result.is_valid());
    EXPECT_TRUE(result.repaired);
    EXPECT_TRUE(result.scaled);
    EXPECT_TRUE(result.stats.is_watertight);
    EXPECT_NEAR(result.stats.volume_mm3, 125000.0, 1e-3);
    ASSERT_TRUE(result.output_path.has_value());
    EXPECT_EQ(*result.output_path, path);
    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_EQ(std::filesystem::file_size(path), 84u + 50u * 12u);
}

TEST(ProcessingPipelineTest, RepairDisabledRejectsOpenMesh) {
    TempDir dir("pipeline_norepair");
    std::string path = dir.file("open.stl");

    ProcessingPipeline pipeline(config_with(100.0, false, true));
    PipelineResult result = pipeline.process(make_open_box(), path);

    EXPECT_FALSE(result.is_valid());
    EXPECT_FALSE(result.repaired);
    EXPECT_FALSE(result.stats.is_watertight);
    EXPECT_FALSE(result.output_path.has_value());
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST(ProcessingPipelineTest, WatertightButInvertedMeshIsRejected) {
    // Watertight input skips repair, so the inverted winding reaches validation
    TempDir dir("pipeline_inverted");
    std::string path = dir.file("inverted.stl");

    ProcessingPipeline pipeline;
    PipelineResult result = pipeline.process(make_inverted_box(), path);

    EXPECT_FALSE(result.is_valid());
    EXPECT_FALSE(result.repaired);
    EXPECT_TRUE(contains_text(result.errors, "Invalid volume"));
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST(ProcessingPipelineTest, FlatTriangleStaysRejectedAfterRepair) {
    TempDir dir("pipeline_flat");
    std::string path = dir.file("flat.stl");

    ProcessingPipeline pipeline;
    PipelineResult result = pipeline.process(make_single_triangle(), path);

    EXPECT_TRUE(result.repaired);
    EXPECT_FALSE(result.is_valid());
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST(ProcessingPipelineTest, InputMeshIsNotModified) {
    Mesh open = make_open_box(10.0);
    ProcessingPipeline pipeline;
    pipeline.process(open);
    EXPECT_EQ(open.num_faces(), 10u);
    EXPECT_NEAR(open.compute_bounding_box().max_extent(), 10.0, 1e-12);
}

// ============================================
// Configuration
// ============================================

TEST(ProcessingPipelineTest, InvalidTargetIsContractViolation) {
    EXPECT_THROW(ProcessingPipeline(config_with(0.0, true, true)), MeshContractViolation);
    EXPECT_THROW(ProcessingPipeline(config_with(-10.0, true, true)), MeshContractViolation);
    EXPECT_NO_THROW(ProcessingPipeline(config_with(0.0, true, false)));
}

TEST(ProcessingPipelineTest, AsciiEncodingFromConfig) {
    TempDir dir("pipeline_ascii");
    std::string path = dir.file("cube.stl");

    PipelineConfig config;
    config.stl_encoding = StlEncoding::ASCII;
    ProcessingPipeline pipeline(config);
    pipeline.process(make_box(10, 10, 10), path);

    std::ifstream file(path);
    std::string first_word;
    file >> first_word;
    EXPECT_EQ(first_word, "solid");
}

TEST(ProcessingPipelineTest, ObjExtensionWritesObj) {
    TempDir dir("pipeline_obj");
    std::string path = dir.file("cube.obj");

    ProcessingPipeline pipeline;
    PipelineResult result = pipeline.process(make_box(10, 10, 10), path);

    ASSERT_TRUE(result.output_path.has_value());
    std::ifstream file(path);
    std::string line;
    size_t vertex_lines = 0;
    while (std::getline(file, line)) {
        if (line.rfind("v ", 0) == 0) vertex_lines++;
    }
    EXPECT_EQ(vertex_lines, 8u);
}

TEST(ProcessingPipelineTest, UnsupportedExtensionPropagates) {
    TempDir dir("pipeline_badext");
    ProcessingPipeline pipeline;
    EXPECT_THROW(pipeline.process(make_box(10, 10, 10), dir.file("cube.3mf")), MeshContractViolation);
}

// ============================================
// Logging and reentrancy
// ============================================

TEST(ProcessingPipelineTest, StepsAreReportedToObserver) {
    LogCapture capture;
    ProcessingPipeline pipeline(PipelineConfig(), capture.observer());
    pipeline.process(make_open_box());

    EXPECT_TRUE(capture.contains("Step 1/3: Repairing mesh"));
    EXPECT_TRUE(capture.contains("Step 2/3: Normalizing scale"));
    EXPECT_TRUE(capture.contains("Step 3/3: Validating mesh"));

    bool saw_repairer = false;
    for (const auto& record : capture.records()) {
        if (record.component == "MeshRepairer") saw_repairer = true;
    }
    EXPECT_TRUE(saw_repairer);
}

TEST(ProcessingPipelineTest, ConcurrentCallsOnDistinctMeshes) {
    ProcessingPipeline pipeline(config_with(100.0, true, true));
    std::vector<PipelineResult> results(4);
    std::vector<std::thread> workers;

    for (size_t i = 0; i < results.size(); ++i) {
        workers.emplace_back([&, i] {
            Mesh input = (i % 2 == 0) ? make_open_box(10.0 + i) : make_icosphere(5.0 + i, 2);
            results[i] = pipeline.process(input);
        });
    }
    for (auto& worker : workers) worker.join();

    for (const auto& result : results) {
        EXPECT_TRUE(result.is_valid());
        EXPECT_NEAR(result.mesh.compute_bounding_box().max_extent(), 100.0, 1e-6);
    }
}
