/**
 * @file PrimitiveMeshSource.cpp
 * @brief Implementation of the primitive solid builders
 *
 * Copyright (c) 2026 NeuroForge 3D contributors
 * Licensed under the MIT License.
 */

#include "PrimitiveMeshSource.hpp"
#include <unordered_map>

namespace neuroforge {

namespace {
constexpr double PI = 3.14159265358979323846;
}

PrimitiveShape parse_primitive_shape(const std::string& text) {
    if (text == "box") return PrimitiveShape::BOX;
    if (text == "sphere") return PrimitiveShape::SPHERE;
    if (text == "cylinder") return PrimitiveShape::CYLINDER;
    throw MeshContractViolation("Unsupported shape '" + text +
                                "'. Must be one of: box, sphere, cylinder");
}

const char* to_string(PrimitiveShape shape) {
    switch (shape) {
        case PrimitiveShape::BOX: return "box";
        case PrimitiveShape::SPHERE: return "sphere";
        case PrimitiveShape::CYLINDER: return "cylinder";
    }
    return "unknown";
}

std::vector<std::string> supported_shapes() {
    return {"box", "sphere", "cylinder"};
}

// ============================================================================
// Builders
// ============================================================================

Mesh make_box(double size_x, double size_y, double size_z) {
    const double hx = size_x / 2.0;
    const double hy = size_y / 2.0;
    const double hz = size_z / 2.0;

    std::vector<Point3D> vertices = {
        {-hx, -hy, -hz}, {hx, -hy, -hz}, {hx, hy, -hz}, {-hx, hy, -hz},
        {-hx, -hy, hz},  {hx, -hy, hz},  {hx, hy, hz},  {-hx, hy, hz}
    };

    std::vector<Face> faces = {
        {0, 2, 1}, {0, 3, 2},  // bottom
        {4, 5, 6}, {4, 6, 7},  // top
        {0, 1, 5}, {0, 5, 4},  // front
        {3, 7, 6}, {3, 6, 2},  // back
        {0, 4, 7}, {0, 7, 3},  // left
        {1, 2, 6}, {1, 6, 5}   // right
    };

    return Mesh(std::move(vertices), std::move(faces));
}

Mesh make_icosphere(double radius, int subdivisions) {
    const double t = (1.0 + std::sqrt(5.0)) / 2.0;

    std::vector<Vector3D> directions = {
        {-1, t, 0}, {1, t, 0}, {-1, -t, 0}, {1, -t, 0},
        {0, -1, t}, {0, 1, t}, {0, -1, -t}, {0, 1, -t},
        {t, 0, -1}, {t, 0, 1}, {-t, 0, -1}, {-t, 0, 1}
    };
    for (auto& d : directions) {
        d = d.normalized();
    }

    std::vector<Face> faces = {
        {0, 11, 5}, {0, 5, 1},  {0, 1, 7},   {0, 7, 10}, {0, 10, 11},
        {1, 5, 9},  {5, 11, 4}, {11, 10, 2}, {10, 7, 6}, {7, 1, 8},
        {3, 9, 4},  {3, 4, 2},  {3, 2, 6},   {3, 6, 8},  {3, 8, 9},
        {4, 9, 5},  {2, 4, 11}, {6, 2, 10},  {8, 6, 7},  {9, 8, 1}
    };

    for (int level = 0; level < subdivisions; ++level) {
        std::unordered_map<EdgeId, VertexId> midpoint_cache;
        auto midpoint = [&](VertexId a, VertexId b) {
            auto [it, inserted] = midpoint_cache.emplace(make_edge_id(a, b),
                                                         static_cast<VertexId>(directions.size()));
            if (inserted) {
                directions.push_back((directions[a] + directions[b]).normalized());
            }
            return it->second;
        };

        std::vector<Face> refined;
        refined.reserve(faces.size() * 4);
        for (const Face& face : faces) {
            VertexId ab = midpoint(face[0], face[1]);
            VertexId bc = midpoint(face[1], face[2]);
            VertexId ca = midpoint(face[2], face[0]);
            refined.emplace_back(face[0], ab, ca);
            refined.emplace_back(face[1], bc, ab);
            refined.emplace_back(face[2], ca, bc);
            refined.emplace_back(ab, bc, ca);
        }
        faces = std::move(refined);
    }

    std::vector<Point3D> vertices;
    vertices.reserve(directions.size());
    for (const auto& d : directions) {
        vertices.emplace_back(d.x() * radius, d.y() * radius, d.z() * radius);
    }

    return Mesh(std::move(vertices), std::move(faces));
}

Mesh make_cylinder(double radius, double height, int sections) {
    const double half_height = height / 2.0;
    const VertexId n = static_cast<VertexId>(sections);

    // 0: bottom centre, 1: top centre, then the bottom ring, then the top ring
    std::vector<Point3D> vertices;
    vertices.reserve(2 + 2 * n);
    vertices.emplace_back(0.0, 0.0, -half_height);
    vertices.emplace_back(0.0, 0.0, half_height);
    for (VertexId i = 0; i < n; ++i) {
        double angle = 2.0 * PI * i / n;
        vertices.emplace_back(radius * std::cos(angle), radius * std::sin(angle), -half_height);
    }
    for (VertexId i = 0; i < n; ++i) {
        double angle = 2.0 * PI * i / n;
        vertices.emplace_back(radius * std::cos(angle), radius * std::sin(angle), half_height);
    }

    auto bottom = [n](VertexId i) { return 2 + (i % n); };
    auto top = [n](VertexId i) { return 2 + n + (i % n); };

    std::vector<Face> faces;
    faces.reserve(4 * n);
    for (VertexId i = 0; i < n; ++i) {
        faces.emplace_back(0, bottom(i + 1), bottom(i));
        faces.emplace_back(1, top(i), top(i + 1));
        faces.emplace_back(bottom(i), bottom(i + 1), top(i + 1));
        faces.emplace_back(bottom(i), top(i + 1), top(i));
    }

    return Mesh(std::move(vertices), std::move(faces));
}

// ============================================================================
// PrimitiveMeshSource
// ============================================================================

PrimitiveMeshSource::PrimitiveMeshSource(PrimitiveShape shape, double size_mm, LogObserver observer)
    : shape_(shape), size_mm_(size_mm), logger_("PrimitiveMeshSource", std::move(observer)) {
    if (!(size_mm_ > 0.0) || !std::isfinite(size_mm_)) {
        throw MeshContractViolation("primitive size must be positive, got " + std::to_string(size_mm_));
    }
    logger_.detailed(std::string("Initialized primitive source: ") + to_string(shape_) +
                     ", size " + std::to_string(size_mm_) + "mm");
}

PrimitiveMeshSource::PrimitiveMeshSource(const std::string& shape, double size_mm, LogObserver observer)
    : PrimitiveMeshSource(parse_primitive_shape(shape), size_mm, std::move(observer)) {}

Mesh PrimitiveMeshSource::generate_raw(const std::string& prompt) {
    logger_.info(std::string("Generating ") + to_string(shape_) + " for prompt: '" + prompt + "'");

    switch (shape_) {
        case PrimitiveShape::BOX:
            return make_box(size_mm_, size_mm_, size_mm_);
        case PrimitiveShape::SPHERE:
            return make_icosphere(size_mm_ / 2.0, SPHERE_SUBDIVISIONS);
        case PrimitiveShape::CYLINDER:
            return make_cylinder(size_mm_ / 2.0, size_mm_, CYLINDER_SECTIONS);
    }
    throw MeshContractViolation("unknown primitive shape");
}

std::string PrimitiveMeshSource::name() const {
    return std::string("primitive:") + to_string(shape_);
}

} // namespace neuroforge
