#pragma once

/**
 * @file neuroforge.hpp
 * @brief Main header for the NeuroForge 3D print-preparation core
 *
 * Repairs, rescales and validates candidate triangle meshes so that only
 * closed, watertight solids with positive volume are ever written to disk.
 *
 * Copyright (c) 2026 NeuroForge 3D contributors
 * Licensed under the MIT License.
 */

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace neuroforge {

// ============================================================================
// Geometry Types
// ============================================================================

/**
 * @brief 3D vector for normals, offsets and directions
 */
struct Vector3D {
    double x_, y_, z_;

    Vector3D() : x_(0), y_(0), z_(0) {}
    Vector3D(double x, double y, double z) : x_(x), y_(y), z_(z) {}

    double x() const { return x_; }
    double y() const { return y_; }
    double z() const { return z_; }

    Vector3D operator+(const Vector3D& other) const {
        return Vector3D(x_ + other.x_, y_ + other.y_, z_ + other.z_);
    }

    Vector3D operator-(const Vector3D& other) const {
        return Vector3D(x_ - other.x_, y_ - other.y_, z_ - other.z_);
    }

    Vector3D operator*(double scalar) const {
        return Vector3D(x_ * scalar, y_ * scalar, z_ * scalar);
    }

    Vector3D operator-() const { return Vector3D(-x_, -y_, -z_); }

    double dot(const Vector3D& other) const {
        return x_ * other.x_ + y_ * other.y_ + z_ * other.z_;
    }

    Vector3D cross(const Vector3D& other) const {
        return Vector3D(
            y_ * other.z_ - z_ * other.y_,
            z_ * other.x_ - x_ * other.z_,
            x_ * other.y_ - y_ * other.x_
        );
    }

    double length() const {
        return std::sqrt(x_ * x_ + y_ * y_ + z_ * z_);
    }

    /// Unit vector, or the zero vector for a zero-length input
    Vector3D normalized() const {
        double len = length();
        return len > 0 ? Vector3D(x_ / len, y_ / len, z_ / len) : Vector3D();
    }
};

/**
 * @brief 3D point in millimeters
 */
struct Point3D {
    double x_, y_, z_;

    Point3D() : x_(0), y_(0), z_(0) {}
    Point3D(double x, double y, double z) : x_(x), y_(y), z_(z) {}

    double x() const { return x_; }
    double y() const { return y_; }
    double z() const { return z_; }

    Vector3D operator-(const Point3D& other) const {
        return Vector3D(x_ - other.x_, y_ - other.y_, z_ - other.z_);
    }

    Point3D operator+(const Vector3D& offset) const {
        return Point3D(x_ + offset.x(), y_ + offset.y(), z_ + offset.z());
    }

    Vector3D as_vector() const { return Vector3D(x_, y_, z_); }

    bool operator==(const Point3D& other) const {
        return x_ == other.x_ && y_ == other.y_ && z_ == other.z_;
    }
};

/**
 * @brief Unique identifiers for mesh components
 */
using VertexId = std::uint32_t;
using FaceId = std::uint32_t;
using EdgeId = std::uint64_t; // Combined vertex IDs, smaller ID in the high word

inline EdgeId make_edge_id(VertexId a, VertexId b) {
    if (a > b) std::swap(a, b);
    return (static_cast<EdgeId>(a) << 32) | b;
}

/**
 * @brief Triangle defined by three vertex indices, wound counter-clockwise
 *        when seen from outside the solid
 */
struct Face {
    std::array<VertexId, 3> vertices{0, 0, 0};

    Face() = default;
    Face(VertexId v0, VertexId v1, VertexId v2) : vertices{v0, v1, v2} {}

    VertexId operator[](int i) const { return vertices[i]; }

    EdgeId edge(int i) const {
        return make_edge_id(vertices[i], vertices[(i + 1) % 3]);
    }

    /// Same triangle with opposite winding
    Face flipped() const { return Face(vertices[0], vertices[2], vertices[1]); }

    bool operator==(const Face& other) const { return vertices == other.vertices; }
};

/**
 * @brief Axis-aligned bounding box
 */
struct BoundingBox3D {
    double min_x = 0.0, min_y = 0.0, min_z = 0.0;
    double max_x = 0.0, max_y = 0.0, max_z = 0.0;

    double extent_x() const { return max_x - min_x; }
    double extent_y() const { return max_y - min_y; }
    double extent_z() const { return max_z - min_z; }

    std::array<double, 3> extents() const { return {extent_x(), extent_y(), extent_z()}; }

    double max_extent() const { return std::max({extent_x(), extent_y(), extent_z()}); }
    double min_extent() const { return std::min({extent_x(), extent_y(), extent_z()}); }
};

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Bounding-box extent matched to the target size when scaling
 */
enum class ScaleAxis {
    MAX,  ///< Largest of the three extents
    MIN,  ///< Smallest of the three extents
    X,
    Y,
    Z
};

/**
 * @brief STL flavour written by the exporter
 */
enum class StlEncoding { BINARY, ASCII };

/**
 * @brief Sub-steps of mesh repair
 */
struct RepairOptions {
    bool fill_holes = true;
    bool fix_normals = true;
    bool remove_small_components = true;
    double min_component_ratio = 0.05;  // Fraction of total vertices a body needs to survive
};

/**
 * @brief Immutable per-pipeline configuration
 */
struct PipelineConfig {
    double target_size_mm = 100.0;
    bool auto_repair = true;
    bool auto_scale = true;
    RepairOptions repair;
    StlEncoding stl_encoding = StlEncoding::BINARY;
};

/**
 * @brief Settings of the neuroforge-prep command line tool
 *
 * Values come from defaults, then an optional JSON config file, then the
 * command line (later sources win).
 */
struct CliConfig {
    PipelineConfig pipeline;

    // Mesh source: exactly one of these
    std::optional<std::string> input_file;      ///< Existing STL/OBJ/OFF/PLY file
    std::optional<std::string> generate_shape;  ///< Synthetic primitive: box, sphere, cylinder
    double generate_size_mm = 50.0;
    std::string prompt = "primitive";

    // Outputs
    std::optional<std::string> output_file;  ///< Written only if the mesh is valid
    std::optional<std::string> report_file;  ///< JSON report of the result

    std::optional<std::string> config_file;

    // Logging: 0 = silent, 1..6 = ERROR..TRACE
    int log_level = 3;
    std::optional<std::string> log_file;
};

// ============================================================================
// Results
// ============================================================================

/**
 * @brief Geometric and topological statistics reported for every mesh
 */
struct MeshStats {
    double volume_mm3 = 0.0;
    double area_mm2 = 0.0;
    std::size_t vertex_count = 0;
    std::size_t face_count = 0;
    bool is_watertight = false;
    std::size_t body_count = 0;
};

/**
 * @brief Outcome of print-readiness validation
 *
 * Validity is derived from the error list, so a result with errors can never
 * report itself as valid.
 */
struct ValidationResult {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    MeshStats stats;

    bool is_valid() const { return errors.empty(); }
};

// ============================================================================
// Errors
// ============================================================================

/**
 * @brief Caller handed a value that breaks an API precondition
 */
class MeshContractViolation : public std::invalid_argument {
public:
    explicit MeshContractViolation(const std::string& message)
        : std::invalid_argument("Contract violation: " + message) {}
};

/**
 * @brief Mesh file could not be written
 */
class MeshExportError : public std::runtime_error {
public:
    explicit MeshExportError(const std::string& message)
        : std::runtime_error("Mesh export failed: " + message) {}
};

/**
 * @brief Mesh file could not be read
 */
class MeshImportError : public std::runtime_error {
public:
    explicit MeshImportError(const std::string& message)
        : std::runtime_error("Mesh import failed: " + message) {}
};

} // namespace neuroforge
