/**
 * @file ResultReporter.hpp
 * @brief JSON reports and console summaries of processing results
 *
 * Copyright (c) 2026 NeuroForge 3D contributors
 * Licensed under the MIT License.
 */

#pragma once

#include "neuroforge.hpp"
#include "../core/Logger.hpp"
#include "../core/MeshGenerator.hpp"
#include "../core/ProcessingPipeline.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace neuroforge {

/**
 * @brief Turns pipeline and generation results into machine-readable reports
 *
 * Report layout:
 * {
 *   "is_valid": bool, "errors": [...], "warnings": [...],
 *   "stats": {"volume_mm3", "area_mm2", "vertices", "faces",
 *             "is_watertight", "body_count"},
 *   "repaired": bool, "scaled": bool, "output_path": string|null
 * }
 * Generation reports add "source" and "prompt".
 */
class ResultReporter {
public:
    explicit ResultReporter(LogObserver observer = {});

    static nlohmann::json stats_to_json(const MeshStats& stats);

    nlohmann::json build_report(const PipelineResult& result) const;

    nlohmann::json build_report(const GenerationResult& result,
                                const std::string& source_name,
                                const std::string& prompt) const;

    /**
     * @brief Write a report as indented JSON
     * @throws std::runtime_error if the file cannot be written
     */
    void write_report(const nlohmann::json& report, const std::string& path) const;

    /// Human-readable summary for the console
    static std::string format_summary(const nlohmann::json& report);

private:
    Logger logger_;
};

} // namespace neuroforge
