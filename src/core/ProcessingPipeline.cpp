/**
 * @file ProcessingPipeline.cpp
 * @brief Implementation of the mesh processing pipeline
 *
 * Copyright (c) 2026 NeuroForge 3D contributors
 * Licensed under the MIT License.
 */

#include "ProcessingPipeline.hpp"
#include <iomanip>
#include <sstream>

namespace neuroforge {

namespace {

MeshExportOptions export_options_for(const PipelineConfig& config) {
    MeshExportOptions options;
    options.stl_encoding = config.stl_encoding;
    return options;
}

std::string join(const std::vector<std::string>& items, const std::string& separator) {
    std::string joined;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) joined += separator;
        joined += items[i];
    }
    return joined;
}

const std::string RULE(60, '=');

} // namespace

ProcessingPipeline::ProcessingPipeline(const PipelineConfig& config, LogObserver observer)
    : config_(config),
      logger_("ProcessingPipeline", observer),
      repairer_(observer),
      scaler_(observer),
      validator_(observer),
      exporter_(export_options_for(config), observer) {
    if (config_.auto_scale && !(config_.target_size_mm > 0.0 && std::isfinite(config_.target_size_mm))) {
        throw MeshContractViolation("target_size_mm must be positive, got " +
                                    std::to_string(config_.target_size_mm));
    }

    std::ostringstream msg;
    msg << std::fixed << std::setprecision(1)
        << "Initialized pipeline: target_size=" << config_.target_size_mm << "mm, auto_repair="
        << (config_.auto_repair ? "true" : "false") << ", auto_scale="
        << (config_.auto_scale ? "true" : "false");
    logger_.detailed(msg.str());
}

PipelineResult ProcessingPipeline::process(const Mesh& mesh,
                                           const std::optional<std::string>& output_path) const {
    logger_.info(RULE);
    logger_.info("Starting mesh processing pipeline");
    logger_.info(RULE);

    PipelineResult result;
    result.mesh = mesh;

    // Step 1: repair
    if (config_.auto_repair) {
        if (!result.mesh.is_watertight()) {
            logger_.info("Step 1/3: Repairing mesh...");
            result.mesh = repairer_.repair(result.mesh, config_.repair);
            result.repaired = true;
        } else {
            logger_.info("Step 1/3: Repair - Skipped (already watertight)");
        }
    } else {
        logger_.info("Step 1/3: Repair - Disabled");
    }

    // Step 2: scale
    if (config_.auto_scale) {
        logger_.info("Step 2/3: Normalizing scale...");
        result.mesh = scaler_.normalize_scale(result.mesh, config_.target_size_mm,
                                              ScaleAxis::MAX, true);
        result.scaled = true;
    } else {
        logger_.info("Step 2/3: Scaling - Disabled");
    }

    // Step 3: validate
    logger_.info("Step 3/3: Validating mesh...");
    ValidationResult validation = validator_.validate(result.mesh);
    result.errors = std::move(validation.errors);
    result.warnings = std::move(validation.warnings);
    result.stats = validation.stats;

    if (!output_path) {
        if (result.is_valid()) {
            logger_.info("Pipeline completed successfully (no save path provided)");
        } else {
            logger_.warning("Pipeline completed with validation errors");
        }
        return result;
    }

    // Golden rule: nothing invalid reaches the disk
    if (!result.is_valid()) {
        logger_.error(RULE);
        logger_.error("FAILURE: Mesh validation failed, not saved");
        logger_.error("  Errors: " + join(result.errors, ", "));
        logger_.error(RULE);
        return result;
    }

    exporter_.export_mesh(result.mesh, *output_path);
    result.output_path = output_path;

    std::ostringstream stats;
    stats << std::fixed << std::setprecision(2)
          << "  Volume: " << result.stats.volume_mm3 << "mm³, Faces: " << result.stats.face_count;
    logger_.info(RULE);
    logger_.info("SUCCESS: Processed mesh saved to " + *output_path);
    logger_.info(stats.str());
    logger_.info(std::string("  Repaired: ") + (result.repaired ? "yes" : "no") +
                 ", Scaled: " + (result.scaled ? "yes" : "no"));
    logger_.info(RULE);

    return result;
}

} // namespace neuroforge
