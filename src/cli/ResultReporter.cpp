/**
 * @file ResultReporter.cpp
 * @brief Implementation of result reports
 *
 * Copyright (c) 2026 NeuroForge 3D contributors
 * Licensed under the MIT License.
 */

#include "ResultReporter.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace neuroforge {

ResultReporter::ResultReporter(LogObserver observer)
    : logger_("ResultReporter", std::move(observer)) {}

json ResultReporter::stats_to_json(const MeshStats& stats) {
    return {
        {"volume_mm3", stats.volume_mm3},
        {"area_mm2", stats.area_mm2},
        {"vertices", stats.vertex_count},
        {"faces", stats.face_count},
        {"is_watertight", stats.is_watertight},
        {"body_count", stats.body_count}
    };
}

json ResultReporter::build_report(const PipelineResult& result) const {
    json report;
    report["is_valid"] = result.is_valid();
    report["errors"] = result.errors;
    report["warnings"] = result.warnings;
    report["stats"] = stats_to_json(result.stats);
    report["repaired"] = result.repaired;
    report["scaled"] = result.scaled;
    report["output_path"] = result.output_path ? json(*result.output_path) : json(nullptr);
    return report;
}

json ResultReporter::build_report(const GenerationResult& result,
                                  const std::string& source_name,
                                  const std::string& prompt) const {
    json report;
    report["source"] = source_name;
    report["prompt"] = prompt;
    report["is_valid"] = result.success;
    if (!result.errors.empty()) {
        report["errors"] = result.errors;
    } else {
        report["errors"] = result.error ? json::array({*result.error}) : json::array();
    }
    report["warnings"] = result.warnings;

    if (result.stats) {
        report["stats"] = stats_to_json(*result.stats);
    } else if (result.mesh) {
        // Standalone generation carries no stats; derive the basics from the mesh
        MeshStats stats;
        stats.vertex_count = result.mesh->num_vertices();
        stats.face_count = result.mesh->num_faces();
        stats.is_watertight = result.is_watertight;
        stats.body_count = result.mesh->count_bodies();
        stats.area_mm2 = result.mesh->compute_area();
        stats.volume_mm3 = result.mesh->compute_volume();
        report["stats"] = stats_to_json(stats);
    } else {
        report["stats"] = nullptr;
    }

    report["repaired"] = result.repaired;
    report["scaled"] = result.scaled;
    report["output_path"] = result.output_path ? json(*result.output_path) : json(nullptr);
    return report;
}

void ResultReporter::write_report(const json& report, const std::string& path) const {
    std::filesystem::path report_path(path);
    if (report_path.has_parent_path()) {
        std::filesystem::create_directories(report_path.parent_path());
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open report file for writing: " + path);
    }
    file << report.dump(2) << std::endl;
    file.close();
    if (file.fail()) {
        throw std::runtime_error("Failed while writing report file: " + path);
    }

    logger_.info("Wrote report to " + path);
}

std::string ResultReporter::format_summary(const json& report) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    bool valid = report.value("is_valid", false);
    oss << "Result: " << (valid ? "VALID" : "REJECTED") << "\n";

    if (report.contains("stats") && report["stats"].is_object()) {
        const json& stats = report["stats"];
        oss << "  Volume: " << stats.value("volume_mm3", 0.0) << " mm³\n";
        oss << "  Surface area: " << stats.value("area_mm2", 0.0) << " mm²\n";
        oss << "  Vertices: " << stats.value("vertices", 0) << ", Faces: " << stats.value("faces", 0) << "\n";
        oss << "  Watertight: " << (stats.value("is_watertight", false) ? "yes" : "no")
            << ", Bodies: " << stats.value("body_count", 0) << "\n";
    }

    if (report.value("repaired", false)) oss << "  Repaired: yes\n";
    if (report.value("scaled", false)) oss << "  Scaled: yes\n";

    for (const auto& error : report.value("errors", json::array())) {
        oss << "  ERROR: " << error.get<std::string>() << "\n";
    }
    for (const auto& warning : report.value("warnings", json::array())) {
        oss << "  WARNING: " << warning.get<std::string>() << "\n";
    }

    if (report.contains("output_path") && report["output_path"].is_string()) {
        oss << "  Saved to: " << report["output_path"].get<std::string>() << "\n";
    }

    return oss.str();
}

} // namespace neuroforge
