/**
 * @file MeshScaler.hpp
 * @brief Uniform rescaling of meshes to a target physical size
 *
 * A single scale factor is applied to all three axes, so the aspect ratio of
 * the model is always preserved.
 *
 * Copyright (c) 2026 NeuroForge 3D contributors
 * Licensed under the MIT License.
 */

#pragma once

#include "neuroforge.hpp"
#include "Logger.hpp"
#include "Mesh.hpp"
#include <string>

namespace neuroforge {

/**
 * @brief Parse "max", "min", "x", "y" or "z"
 * @throws std::invalid_argument naming the accepted values otherwise
 */
ScaleAxis parse_scale_axis(const std::string& text);

const char* to_string(ScaleAxis axis);

class MeshScaler {
public:
    explicit MeshScaler(LogObserver observer = {});

    /**
     * @brief Scale so the selected bounding-box extent equals the target
     * @param mesh Input mesh (not modified)
     * @param target_size_mm Desired extent in millimeters, must be positive
     * @param axis Which extent is matched to the target
     * @param center Translate the scaled mesh so its centroid is at the origin
     * @return Scaled copy, or an unscaled copy when the selected extent is 0
     * @throws MeshContractViolation for a non-positive or non-finite target
     */
    Mesh normalize_scale(const Mesh& mesh, double target_size_mm,
                         ScaleAxis axis = ScaleAxis::MAX, bool center = true) const;

private:
    Logger logger_;

    static double select_extent(const BoundingBox3D& bbox, ScaleAxis axis);
};

} // namespace neuroforge
