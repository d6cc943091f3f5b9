/**
 * @file MeshGenerator.hpp
 * @brief Raw mesh sources and the golden-rule gate in front of the disk
 *
 * A MeshSource turns a text prompt into a candidate mesh. MeshGenerator
 * composes a source with an optional ProcessingPipeline and guarantees that
 * only watertight meshes (or, with a pipeline, fully validated meshes) are
 * ever written.
 *
 * Copyright (c) 2026 NeuroForge 3D contributors
 * Licensed under the MIT License.
 */

#pragma once

#include "neuroforge.hpp"
#include "Logger.hpp"
#include "Mesh.hpp"
#include "ProcessingPipeline.hpp"
#include "../export/MeshExporter.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace neuroforge {

/**
 * @brief Anything that can produce a candidate mesh from a prompt
 *
 * Implementations may throw std::exception subclasses on failure; the
 * generator turns those into a structured GenerationResult.
 */
class MeshSource {
public:
    virtual ~MeshSource() = default;

    virtual Mesh generate_raw(const std::string& prompt) = 0;
    virtual std::string name() const = 0;
};

/**
 * @brief Outcome of MeshGenerator::generate()
 */
struct GenerationResult {
    bool success = false;
    bool is_watertight = false;
    std::optional<Mesh> mesh;                ///< Present whenever a mesh was produced
    std::optional<std::string> output_path;  ///< Present only when the mesh was written
    std::optional<std::string> error;        ///< Present only on failure
    std::vector<std::string> errors;         ///< Individual validation errors from a composed pipeline
    std::optional<MeshStats> stats;          ///< Present when a pipeline was composed in
    std::vector<std::string> warnings;
    bool repaired = false;
    bool scaled = false;
};

class MeshGenerator {
public:
    /**
     * @param source Raw mesh backend (required)
     * @param pipeline Optional repair/scale/validate stage; without it only the
     *        watertightness check guards the export
     * @throws MeshContractViolation if source is null
     */
    explicit MeshGenerator(std::shared_ptr<MeshSource> source,
                           std::shared_ptr<const ProcessingPipeline> pipeline = nullptr,
                           LogObserver observer = {});

    /**
     * @brief Generate a mesh and write it if it passes the golden rule
     * @param prompt Text description handed to the source
     * @param output_path Destination; std::nullopt checks without writing
     * @throws MeshExportError or std::filesystem::filesystem_error on I/O failure
     */
    GenerationResult generate(const std::string& prompt,
                              const std::optional<std::string>& output_path) const;

    /**
     * @brief Single-criterion golden-rule check: is the mesh watertight?
     */
    bool validate_mesh(const Mesh& mesh) const;

    const MeshSource& source() const { return *source_; }

private:
    std::shared_ptr<MeshSource> source_;
    std::shared_ptr<const ProcessingPipeline> pipeline_;
    Logger logger_;
    MeshExporter exporter_;

    GenerationResult finish_with_pipeline(Mesh mesh, const std::optional<std::string>& output_path) const;
    GenerationResult finish_standalone(Mesh mesh, const std::optional<std::string>& output_path) const;
};

/**
 * @brief Decorator that admits one generate_raw() call at a time
 *
 * Slow backends (GPU inference) are not safe to run concurrently; wrapping
 * them makes parallel callers queue instead.
 */
class SerializedMeshSource : public MeshSource {
public:
    explicit SerializedMeshSource(std::shared_ptr<MeshSource> inner);

    Mesh generate_raw(const std::string& prompt) override;
    std::string name() const override;

private:
    std::shared_ptr<MeshSource> inner_;
    std::mutex generation_mutex_;
};

} // namespace neuroforge
