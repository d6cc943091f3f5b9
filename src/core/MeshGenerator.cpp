/**
 * @file MeshGenerator.cpp
 * @brief Implementation of the generation contract
 *
 * Copyright (c) 2026 NeuroForge 3D contributors
 * Licensed under the MIT License.
 */

#include "MeshGenerator.hpp"

namespace neuroforge {

namespace {

MeshExportOptions export_options_for(const std::shared_ptr<const ProcessingPipeline>& pipeline) {
    MeshExportOptions options;
    if (pipeline) {
        options.stl_encoding = pipeline->config().stl_encoding;
    }
    return options;
}

} // namespace

MeshGenerator::MeshGenerator(std::shared_ptr<MeshSource> source,
                             std::shared_ptr<const ProcessingPipeline> pipeline,
                             LogObserver observer)
    : source_(std::move(source)),
      pipeline_(std::move(pipeline)),
      logger_("MeshGenerator", observer),
      exporter_(export_options_for(pipeline_), observer) {
    if (!source_) {
        throw MeshContractViolation("MeshGenerator requires a mesh source");
    }
}

bool MeshGenerator::validate_mesh(const Mesh& mesh) const {
    bool watertight = mesh.is_watertight();

    if (!watertight) {
        logger_.warning("Mesh validation failed: mesh is not watertight. Vertices: " +
                        std::to_string(mesh.num_vertices()) + ", Faces: " +
                        std::to_string(mesh.num_faces()));
    } else {
        logger_.info("Mesh validation passed: watertight mesh with " +
                     std::to_string(mesh.num_vertices()) + " vertices and " +
                     std::to_string(mesh.num_faces()) + " faces");
    }

    return watertight;
}

GenerationResult MeshGenerator::generate(const std::string& prompt,
                                         const std::optional<std::string>& output_path) const {
    logger_.info("Starting generation with " + source_->name() + " for prompt: '" + prompt + "'");

    Mesh mesh;
    try {
        mesh = source_->generate_raw(prompt);
    } catch (const std::exception& e) {
        GenerationResult failure;
        failure.error = std::string("Generation failed: ") + e.what();
        logger_.error(*failure.error);
        return failure;
    }

    if (pipeline_) {
        return finish_with_pipeline(std::move(mesh), output_path);
    }
    return finish_standalone(std::move(mesh), output_path);
}

GenerationResult MeshGenerator::finish_standalone(Mesh mesh,
                                                  const std::optional<std::string>& output_path) const {
    GenerationResult result;
    result.is_watertight = validate_mesh(mesh);

    if (!result.is_watertight) {
        result.error = "Generated mesh is not watertight and cannot be saved. "
                       "The mesh must be repaired before it can be used for 3D printing.";
        logger_.error(*result.error);
        result.mesh = std::move(mesh);
        return result;
    }

    if (output_path) {
        exporter_.export_mesh(mesh, *output_path);
        result.output_path = output_path;
        logger_.info("Successfully saved watertight mesh to " + *output_path);
    }

    result.success = true;
    result.mesh = std::move(mesh);
    return result;
}

GenerationResult MeshGenerator::finish_with_pipeline(Mesh mesh,
                                                     const std::optional<std::string>& output_path) const {
    PipelineResult processed = pipeline_->process(mesh, output_path);

    GenerationResult result;
    result.success = processed.is_valid();
    result.is_watertight = processed.stats.is_watertight;
    result.stats = processed.stats;
    result.warnings = processed.warnings;
    result.repaired = processed.repaired;
    result.scaled = processed.scaled;
    result.output_path = processed.output_path;
    result.errors = processed.errors;
    result.mesh = std::move(processed.mesh);

    if (!result.success) {
        std::string message = "Generated mesh failed validation: ";
        for (size_t i = 0; i < processed.errors.size(); ++i) {
            if (i > 0) message += "; ";
            message += processed.errors[i];
        }
        result.error = message;
        logger_.error(message);
    }

    return result;
}

// ============================================================================
// SerializedMeshSource
// ============================================================================

SerializedMeshSource::SerializedMeshSource(std::shared_ptr<MeshSource> inner)
    : inner_(std::move(inner)) {
    if (!inner_) {
        throw MeshContractViolation("SerializedMeshSource requires a mesh source");
    }
}

Mesh SerializedMeshSource::generate_raw(const std::string& prompt) {
    std::lock_guard<std::mutex> lock(generation_mutex_);
    return inner_->generate_raw(prompt);
}

std::string SerializedMeshSource::name() const {
    return inner_->name();
}

} // namespace neuroforge
