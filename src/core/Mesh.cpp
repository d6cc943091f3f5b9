/**
 * @file Mesh.cpp
 * @brief Implementation of the triangle mesh value type
 *
 * Copyright (c) 2026 NeuroForge 3D contributors
 * Licensed under the MIT License.
 */

#include "Mesh.hpp"
#include "MeshTopology.hpp"
#include <functional>
#include <numeric>
#include <unordered_map>

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/parallel_reduce.h>

namespace neuroforge {

namespace {

// Below this many faces the reductions run in one chunk
constexpr size_t REDUCTION_GRAIN_SIZE = 4096;

// Six times the signed volume of the tetrahedron (origin, a, b, c)
inline double signed_tetra_volume6(const Point3D& a, const Point3D& b, const Point3D& c) {
    return a.as_vector().dot(b.as_vector().cross(c.as_vector()));
}

inline Vector3D face_cross(const Point3D& a, const Point3D& b, const Point3D& c) {
    return (b - a).cross(c - a);
}

} // namespace

Mesh::Mesh(std::vector<Point3D> vertices, std::vector<Face> faces)
    : vertices_(std::move(vertices)), faces_(std::move(faces)) {
    for (size_t f = 0; f < faces_.size(); ++f) {
        for (int i = 0; i < 3; ++i) {
            if (faces_[f][i] >= vertices_.size()) {
                throw MeshContractViolation(
                    "Face " + std::to_string(f) + " references vertex " +
                    std::to_string(faces_[f][i]) + " but mesh has " +
                    std::to_string(vertices_.size()) + " vertices");
            }
        }
    }
}

const Point3D& Mesh::get_vertex(VertexId vertex_id) const {
    if (vertex_id >= vertices_.size()) {
        throw std::out_of_range("Vertex ID " + std::to_string(vertex_id) + " out of range");
    }
    return vertices_[vertex_id];
}

const Face& Mesh::get_face(FaceId face_id) const {
    if (face_id >= faces_.size()) {
        throw std::out_of_range("Face ID " + std::to_string(face_id) + " out of range");
    }
    return faces_[face_id];
}

BoundingBox3D Mesh::compute_bounding_box() const {
    if (vertices_.empty()) {
        return BoundingBox3D();
    }

    auto minmax_x = std::minmax_element(vertices_.begin(), vertices_.end(),
        [](const Point3D& a, const Point3D& b) { return a.x() < b.x(); });
    auto minmax_y = std::minmax_element(vertices_.begin(), vertices_.end(),
        [](const Point3D& a, const Point3D& b) { return a.y() < b.y(); });
    auto minmax_z = std::minmax_element(vertices_.begin(), vertices_.end(),
        [](const Point3D& a, const Point3D& b) { return a.z() < b.z(); });

    BoundingBox3D bbox;
    bbox.min_x = minmax_x.first->x();
    bbox.max_x = minmax_x.second->x();
    bbox.min_y = minmax_y.first->y();
    bbox.max_y = minmax_y.second->y();
    bbox.min_z = minmax_z.first->z();
    bbox.max_z = minmax_z.second->z();

    return bbox;
}

double Mesh::compute_face_area(FaceId face_id) const {
    const Face& face = get_face(face_id);
    return 0.5 * face_cross(vertices_[face[0]], vertices_[face[1]], vertices_[face[2]]).length();
}

Vector3D Mesh::compute_face_normal(FaceId face_id) const {
    const Face& face = get_face(face_id);
    return face_cross(vertices_[face[0]], vertices_[face[1]], vertices_[face[2]]).normalized();
}

std::vector<double> Mesh::compute_face_areas() const {
    std::vector<double> areas(faces_.size());
    tbb::parallel_for(tbb::blocked_range<size_t>(0, faces_.size(), REDUCTION_GRAIN_SIZE),
        [&](const tbb::blocked_range<size_t>& range) {
            for (size_t f = range.begin(); f != range.end(); ++f) {
                const Face& face = faces_[f];
                areas[f] = 0.5 * face_cross(vertices_[face[0]], vertices_[face[1]],
                                            vertices_[face[2]]).length();
            }
        });
    return areas;
}

double Mesh::compute_volume() const {
    double volume6 = tbb::parallel_deterministic_reduce(
        tbb::blocked_range<size_t>(0, faces_.size(), REDUCTION_GRAIN_SIZE),
        0.0,
        [&](const tbb::blocked_range<size_t>& range, double partial) {
            for (size_t f = range.begin(); f != range.end(); ++f) {
                const Face& face = faces_[f];
                partial += signed_tetra_volume6(vertices_[face[0]], vertices_[face[1]],
                                                vertices_[face[2]]);
            }
            return partial;
        },
        std::plus<double>());
    return volume6 / 6.0;
}

double Mesh::compute_area() const {
    return tbb::parallel_deterministic_reduce(
        tbb::blocked_range<size_t>(0, faces_.size(), REDUCTION_GRAIN_SIZE),
        0.0,
        [&](const tbb::blocked_range<size_t>& range, double partial) {
            for (size_t f = range.begin(); f != range.end(); ++f) {
                const Face& face = faces_[f];
                partial += 0.5 * face_cross(vertices_[face[0]], vertices_[face[1]],
                                            vertices_[face[2]]).length();
            }
            return partial;
        },
        std::plus<double>());
}

Point3D Mesh::compute_centroid() const {
    if (vertices_.empty()) {
        return Point3D();
    }

    double total_area = 0.0;
    Vector3D weighted_sum;
    for (const Face& face : faces_) {
        const Point3D& a = vertices_[face[0]];
        const Point3D& b = vertices_[face[1]];
        const Point3D& c = vertices_[face[2]];
        double area = 0.5 * face_cross(a, b, c).length();
        Vector3D face_centroid = (a.as_vector() + b.as_vector() + c.as_vector()) * (1.0 / 3.0);
        weighted_sum = weighted_sum + face_centroid * area;
        total_area += area;
    }

    if (total_area > 0.0) {
        Vector3D c = weighted_sum * (1.0 / total_area);
        return Point3D(c.x(), c.y(), c.z());
    }

    // No surface area: average the vertices instead
    Vector3D vertex_sum;
    for (const Point3D& v : vertices_) {
        vertex_sum = vertex_sum + v.as_vector();
    }
    Vector3D mean = vertex_sum * (1.0 / static_cast<double>(vertices_.size()));
    return Point3D(mean.x(), mean.y(), mean.z());
}

bool Mesh::is_watertight() const {
    return MeshTopology(*this).is_watertight();
}

size_t Mesh::count_bodies() const {
    if (faces_.empty()) return 0;
    return MeshTopology(*this).face_components().size();
}

std::vector<Mesh> Mesh::split() const {
    std::vector<Mesh> bodies;
    auto components = MeshTopology(*this).face_components();
    bodies.reserve(components.size());

    for (const auto& component : components) {
        std::unordered_map<VertexId, VertexId> remap;
        std::vector<Point3D> body_vertices;
        std::vector<Face> body_faces;
        body_faces.reserve(component.size());

        for (FaceId f : component) {
            const Face& face = faces_[f];
            std::array<VertexId, 3> local{};
            for (int i = 0; i < 3; ++i) {
                auto [it, inserted] = remap.emplace(face[i], static_cast<VertexId>(body_vertices.size()));
                if (inserted) {
                    body_vertices.push_back(vertices_[face[i]]);
                }
                local[i] = it->second;
            }
            body_faces.emplace_back(local[0], local[1], local[2]);
        }

        bodies.emplace_back(std::move(body_vertices), std::move(body_faces));
    }

    return bodies;
}

Mesh Mesh::concatenate(const std::vector<Mesh>& parts) {
    size_t total_vertices = 0;
    size_t total_faces = 0;
    for (const Mesh& part : parts) {
        total_vertices += part.num_vertices();
        total_faces += part.num_faces();
    }

    std::vector<Point3D> vertices;
    std::vector<Face> faces;
    vertices.reserve(total_vertices);
    faces.reserve(total_faces);

    for (const Mesh& part : parts) {
        VertexId offset = static_cast<VertexId>(vertices.size());
        vertices.insert(vertices.end(), part.vertices_.begin(), part.vertices_.end());
        for (const Face& face : part.faces_) {
            faces.emplace_back(face[0] + offset, face[1] + offset, face[2] + offset);
        }
    }

    return Mesh(std::move(vertices), std::move(faces));
}

Mesh Mesh::scaled(double factor) const {
    std::vector<Point3D> vertices(vertices_.size());
    tbb::parallel_for(tbb::blocked_range<size_t>(0, vertices_.size(), REDUCTION_GRAIN_SIZE),
        [&](const tbb::blocked_range<size_t>& range) {
            for (size_t i = range.begin(); i != range.end(); ++i) {
                const Point3D& p = vertices_[i];
                vertices[i] = Point3D(p.x() * factor, p.y() * factor, p.z() * factor);
            }
        });
    return Mesh(std::move(vertices), faces_);
}

Mesh Mesh::translated(const Vector3D& offset) const {
    std::vector<Point3D> vertices;
    vertices.reserve(vertices_.size());
    for (const Point3D& p : vertices_) {
        vertices.push_back(p + offset);
    }
    return Mesh(std::move(vertices), faces_);
}

Mesh Mesh::with_faces(std::vector<Face> faces) const {
    return Mesh(vertices_, std::move(faces));
}

} // namespace neuroforge
