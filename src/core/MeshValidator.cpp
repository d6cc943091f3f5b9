/**
 * @file MeshValidator.cpp
 * @brief Implementation of print-readiness validation
 *
 * Copyright (c) 2026 NeuroForge 3D contributors
 * Licensed under the MIT License.
 */

#include "MeshValidator.hpp"
#include "MeshTopology.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace neuroforge {

MeshValidator::MeshValidator(LogObserver observer)
    : logger_("MeshValidator", std::move(observer)) {}

ValidationResult MeshValidator::validate(const Mesh& mesh) const {
    ValidationResult result;
    result.stats.vertex_count = mesh.num_vertices();
    result.stats.face_count = mesh.num_faces();

    // Empty geometry: report what is missing and stop before any measurement
    if (mesh.num_vertices() == 0) {
        result.errors.push_back("Mesh has no vertices");
    }
    if (mesh.num_faces() == 0) {
        result.errors.push_back("Mesh has no faces");
    }
    if (mesh.empty()) {
        log_outcome(result);
        return result;
    }

    MeshTopology topology(mesh);
    result.stats.is_watertight = topology.is_watertight();
    result.stats.body_count = topology.face_components().size();

    if (!result.stats.is_watertight) {
        logger_.debug("Open edges: " + std::to_string(topology.boundary_edge_count()) +
                      ", non-manifold edges: " + std::to_string(topology.excess_edge_count()) +
                      ", misoriented edges: " + std::to_string(topology.misoriented_edge_count()));
        result.errors.push_back(
            "Mesh is not watertight. Every edge must be shared by exactly two faces "
            "to form a closed volume suitable for 3D printing.");
    }

    double volume = mesh.compute_volume();
    if (!std::isfinite(volume)) {
        logger_.warning("Volume computation produced a non-finite value");
        result.errors.push_back("Could not calculate volume: result is not a finite number");
        volume = 0.0;
    } else {
        check_volume(volume, result);
    }
    result.stats.volume_mm3 = volume;

    double area = mesh.compute_area();
    if (!std::isfinite(area)) {
        logger_.debug("Surface area is not finite, reporting 0");
        area = 0.0;
    }
    result.stats.area_mm2 = area;

    check_advisories(mesh, result);
    log_outcome(result);
    return result;
}

void MeshValidator::check_volume(double volume, ValidationResult& result) const {
    std::ostringstream msg;
    msg << std::fixed << std::setprecision(4);

    if (volume <= 0.0) {
        msg << "Invalid volume: " << volume
            << " mm³. Volume must be positive for a valid solid object.";
        result.errors.push_back(msg.str());
    } else if (volume < MIN_PRINTABLE_VOLUME_MM3) {
        msg << "Very small volume (" << volume
            << " mm³). Model may be too small for reliable printing.";
        result.warnings.push_back(msg.str());
    }
}

void MeshValidator::check_advisories(const Mesh& mesh, ValidationResult& result) const {
    if (result.stats.body_count > 1) {
        result.warnings.push_back(
            "Mesh has " + std::to_string(result.stats.body_count) +
            " disconnected components. This may cause issues during printing "
            "or require separate prints.");
    }

    if (mesh.num_faces() > HIGH_POLY_FACE_COUNT) {
        result.warnings.push_back(
            "High polygon count (" + std::to_string(mesh.num_faces()) +
            " faces). Consider decimating the mesh to reduce file size and "
            "improve slicing performance.");
    }

    auto areas = mesh.compute_face_areas();
    size_t degenerate = std::count_if(areas.begin(), areas.end(),
        [](double a) { return a < DEGENERATE_FACE_AREA_MM2; });
    if (degenerate > 0) {
        result.warnings.push_back(
            "Found " + std::to_string(degenerate) +
            " degenerate (zero-area) faces. These should be removed.");
    }
}

void MeshValidator::log_outcome(const ValidationResult& result) const {
    if (result.is_valid()) {
        std::ostringstream msg;
        msg << std::fixed << std::setprecision(2)
            << "Mesh validation passed: watertight=" << (result.stats.is_watertight ? "true" : "false")
            << ", volume=" << result.stats.volume_mm3 << "mm³, "
            << result.stats.face_count << " faces";
        logger_.info(msg.str());
        if (!result.warnings.empty()) {
            logger_.info("Warnings: " + std::to_string(result.warnings.size()) +
                         " non-critical issues found");
        }
        return;
    }

    // First two errors only; the full list is in the result
    std::string summary = result.errors.front();
    if (result.errors.size() > 1) {
        summary += "; " + result.errors[1];
    }
    logger_.error("Mesh validation failed with " + std::to_string(result.errors.size()) +
                  " error(s): " + summary);
}

} // namespace neuroforge
