#pragma once

/**
 * @file Mesh.hpp
 * @brief Triangle mesh value type with on-demand geometric properties
 *
 * A Mesh owns its vertex and face buffers outright. Nothing derived from the
 * buffers (volume, watertightness, bodies...) is cached, so every query
 * reflects the current geometry.
 *
 * Copyright (c) 2026 NeuroForge 3D contributors
 * Licensed under the MIT License.
 */

#include "neuroforge.hpp"
#include <vector>

namespace neuroforge {

class Mesh {
public:
    Mesh() = default;

    /**
     * @brief Build a mesh from raw buffers
     * @throws MeshContractViolation if a face references a missing vertex
     */
    Mesh(std::vector<Point3D> vertices, std::vector<Face> faces);

    // Accessors
    const std::vector<Point3D>& vertices() const { return vertices_; }
    const std::vector<Face>& faces() const { return faces_; }

    const Point3D& get_vertex(VertexId vertex_id) const;
    const Face& get_face(FaceId face_id) const;

    size_t num_vertices() const { return vertices_.size(); }
    size_t num_faces() const { return faces_.size(); }

    /// True when there is nothing printable: no vertices or no faces
    bool empty() const { return vertices_.empty() || faces_.empty(); }

    // Geometry
    BoundingBox3D compute_bounding_box() const;
    double compute_face_area(FaceId face_id) const;
    Vector3D compute_face_normal(FaceId face_id) const;
    std::vector<double> compute_face_areas() const;

    /**
     * @brief Signed enclosed volume (divergence theorem)
     *
     * Positive for a closed surface with outward-facing normals, negative when
     * the winding is inverted. Meaningless for open surfaces.
     */
    double compute_volume() const;
    double compute_area() const;

    /**
     * @brief Area-weighted average of face centroids
     *
     * Falls back to the vertex average when the surface has no area.
     */
    Point3D compute_centroid() const;

    // Topology
    bool is_watertight() const;
    size_t count_bodies() const;

    /**
     * @brief One sub-mesh per connected body, vertex buffers compacted
     *
     * Bodies are ordered by their lowest face index.
     */
    std::vector<Mesh> split() const;

    /**
     * @brief Merge meshes into one, renumbering face indices
     */
    static Mesh concatenate(const std::vector<Mesh>& parts);

    // Transformations (return new meshes)
    Mesh scaled(double factor) const;
    Mesh translated(const Vector3D& offset) const;
    Mesh with_faces(std::vector<Face> faces) const;

private:
    std::vector<Point3D> vertices_;
    std::vector<Face> faces_;
};

} // namespace neuroforge
