/**
 * @file MeshValidator.hpp
 * @brief Print-readiness classification of triangle meshes
 *
 * Critical checks (watertightness, positive volume, non-empty geometry) land in
 * ValidationResult::errors and make the mesh unprintable. Advisory checks
 * (several bodies, tiny volume, excessive detail, degenerate faces) land in
 * ValidationResult::warnings and never block validity.
 *
 * Copyright (c) 2026 NeuroForge 3D contributors
 * Licensed under the MIT License.
 */

#pragma once

#include "neuroforge.hpp"
#include "Logger.hpp"
#include "Mesh.hpp"

namespace neuroforge {

class MeshValidator {
public:
    // Advisory thresholds
    static constexpr double MIN_PRINTABLE_VOLUME_MM3 = 1.0;
    static constexpr size_t HIGH_POLY_FACE_COUNT = 500000;
    static constexpr double DEGENERATE_FACE_AREA_MM2 = 1e-10;

    explicit MeshValidator(LogObserver observer = {});

    /**
     * @brief Classify a mesh as print-ready or not
     *
     * Statistics are always filled in. Metrics that cannot be computed are
     * reported as 0 and logged, never thrown.
     */
    ValidationResult validate(const Mesh& mesh) const;

private:
    Logger logger_;

    void check_volume(double volume, ValidationResult& result) const;
    void check_advisories(const Mesh& mesh, ValidationResult& result) const;
    void log_outcome(const ValidationResult& result) const;
};

} // namespace neuroforge
