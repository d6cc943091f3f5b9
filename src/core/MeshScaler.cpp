/**
 * @file MeshScaler.cpp
 * @brief Implementation of uniform mesh scaling
 *
 * Copyright (c) 2026 NeuroForge 3D contributors
 * Licensed under the MIT License.
 */

#include "MeshScaler.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace neuroforge {

ScaleAxis parse_scale_axis(const std::string& text) {
    if (text == "max") return ScaleAxis::MAX;
    if (text == "min") return ScaleAxis::MIN;
    if (text == "x") return ScaleAxis::X;
    if (text == "y") return ScaleAxis::Y;
    if (text == "z") return ScaleAxis::Z;
    throw std::invalid_argument("Invalid dimension '" + text +
                                "'. Must be one of: max, min, x, y, z");
}

const char* to_string(ScaleAxis axis) {
    switch (axis) {
        case ScaleAxis::MAX: return "largest";
        case ScaleAxis::MIN: return "smallest";
        case ScaleAxis::X: return "X";
        case ScaleAxis::Y: return "Y";
        case ScaleAxis::Z: return "Z";
    }
    return "unknown";
}

MeshScaler::MeshScaler(LogObserver observer)
    : logger_("MeshScaler", std::move(observer)) {}

double MeshScaler::select_extent(const BoundingBox3D& bbox, ScaleAxis axis) {
    switch (axis) {
        case ScaleAxis::MAX: return bbox.max_extent();
        case ScaleAxis::MIN: return bbox.min_extent();
        case ScaleAxis::X: return bbox.extent_x();
        case ScaleAxis::Y: return bbox.extent_y();
        case ScaleAxis::Z: return bbox.extent_z();
    }
    return 0.0;
}

Mesh MeshScaler::normalize_scale(const Mesh& mesh, double target_size_mm,
                                 ScaleAxis axis, bool center) const {
    if (!std::isfinite(target_size_mm) || target_size_mm <= 0.0) {
        throw MeshContractViolation("target size must be a positive number of millimeters, got " +
                                    std::to_string(target_size_mm));
    }

    double current_size = select_extent(mesh.compute_bounding_box(), axis);
    if (current_size == 0.0) {
        logger_.warning(std::string("Current ") + to_string(axis) +
                        " dimension is 0, cannot scale. Returning original mesh.");
        return mesh;
    }

    double scale_factor = target_size_mm / current_size;

    std::ostringstream msg;
    msg << std::fixed << std::setprecision(2)
        << "Scaling mesh: " << to_string(axis) << " dimension from "
        << current_size << "mm to " << target_size_mm << "mm (factor: "
        << std::setprecision(4) << scale_factor << ")";
    logger_.info(msg.str());

    Mesh result = mesh.scaled(scale_factor);

    if (center) {
        Point3D centroid = result.compute_centroid();
        result = result.translated(-centroid.as_vector());

        std::ostringstream centred;
        centred << "Centered mesh at origin (moved from " << centroid.x() << ", "
                << centroid.y() << ", " << centroid.z() << ")";
        logger_.debug(centred.str());
    }

    auto extents = result.compute_bounding_box().extents();
    std::ostringstream final_dims;
    final_dims << std::fixed << std::setprecision(2)
               << "Final dimensions: X=" << extents[0] << "mm, Y=" << extents[1]
               << "mm, Z=" << extents[2] << "mm";
    logger_.info(final_dims.str());

    return result;
}

} // namespace neuroforge
