/**
 * @file ProcessingPipeline.hpp
 * @brief Repair -> scale -> validate -> gated export
 *
 * The pipeline owns only immutable configuration, so one instance may serve
 * concurrent process() calls on distinct meshes.
 *
 * Copyright (c) 2026 NeuroForge 3D contributors
 * Licensed under the MIT License.
 */

#pragma once

#include "neuroforge.hpp"
#include "Logger.hpp"
#include "Mesh.hpp"
#include "MeshRepairer.hpp"
#include "MeshScaler.hpp"
#include "MeshValidator.hpp"
#include "../export/MeshExporter.hpp"
#include <optional>
#include <string>

namespace neuroforge {

/**
 * @brief Validation outcome plus the processed mesh and the steps that ran
 */
struct PipelineResult : ValidationResult {
    Mesh mesh;
    bool repaired = false;
    bool scaled = false;
    std::optional<std::string> output_path;  ///< Set only when the mesh was written
};

class ProcessingPipeline {
public:
    explicit ProcessingPipeline(const PipelineConfig& config = PipelineConfig(),
                                LogObserver observer = {});

    /**
     * @brief Run the pipeline on a mesh
     * @param mesh Candidate mesh (not modified)
     * @param output_path Destination; written only if the processed mesh is valid
     * @throws MeshExportError or std::filesystem::filesystem_error on I/O failure
     * @throws MeshContractViolation for an unsupported output extension
     */
    PipelineResult process(const Mesh& mesh,
                           const std::optional<std::string>& output_path = std::nullopt) const;

    const PipelineConfig& config() const { return config_; }

private:
    const PipelineConfig config_;
    Logger logger_;
    MeshRepairer repairer_;
    MeshScaler scaler_;
    MeshValidator validator_;
    MeshExporter exporter_;
};

} // namespace neuroforge
