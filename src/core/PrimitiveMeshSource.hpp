/**
 * @file PrimitiveMeshSource.hpp
 * @brief Synthetic mesh source producing closed primitive solids
 *
 * Stands in for a neural backend in demos and tests. Every shape is
 * watertight, wound outward and centred at the origin.
 *
 * Copyright (c) 2026 NeuroForge 3D contributors
 * Licensed under the MIT License.
 */

#pragma once

#include "neuroforge.hpp"
#include "Logger.hpp"
#include "MeshGenerator.hpp"
#include <string>
#include <vector>

namespace neuroforge {

enum class PrimitiveShape { BOX, SPHERE, CYLINDER };

/**
 * @brief Parse "box", "sphere" or "cylinder"
 * @throws MeshContractViolation ("Unsupported shape ...") otherwise
 */
PrimitiveShape parse_primitive_shape(const std::string& text);

const char* to_string(PrimitiveShape shape);

std::vector<std::string> supported_shapes();

// Primitive builders
Mesh make_box(double size_x, double size_y, double size_z);
Mesh make_icosphere(double radius, int subdivisions);
Mesh make_cylinder(double radius, double height, int sections);

class PrimitiveMeshSource : public MeshSource {
public:
    static constexpr int SPHERE_SUBDIVISIONS = 3;
    static constexpr int CYLINDER_SECTIONS = 32;

    /**
     * @param shape Primitive to build
     * @param size_mm Edge length (box), diameter (sphere) or diameter and
     *        height (cylinder)
     * @throws MeshContractViolation for a non-positive size
     */
    explicit PrimitiveMeshSource(PrimitiveShape shape = PrimitiveShape::BOX,
                                 double size_mm = 50.0,
                                 LogObserver observer = {});

    /// Convenience overload taking the shape by name
    PrimitiveMeshSource(const std::string& shape, double size_mm = 50.0,
                        LogObserver observer = {});

    Mesh generate_raw(const std::string& prompt) override;
    std::string name() const override;

    PrimitiveShape shape() const { return shape_; }
    double size_mm() const { return size_mm_; }

private:
    PrimitiveShape shape_;
    double size_mm_;
    Logger logger_;
};

} // namespace neuroforge
