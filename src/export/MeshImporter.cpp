/**
 * @file MeshImporter.cpp
 * @brief Implementation of mesh file import
 *
 * Copyright (c) 2026 NeuroForge 3D contributors
 * Licensed under the MIT License.
 */

#include "MeshImporter.hpp"
#include "MeshExporter.hpp"
#include <filesystem>

#include <Eigen/Core>
#include <igl/read_triangle_mesh.h>
#include <igl/remove_duplicate_vertices.h>

namespace neuroforge {

MeshImporter::MeshImporter(LogObserver observer)
    : logger_("MeshImporter", std::move(observer)) {}

Mesh MeshImporter::import_mesh(const std::string& path) const {
    if (!std::filesystem::exists(path)) {
        throw MeshImportError("File not found: " + path);
    }

    Eigen::MatrixXd V;
    Eigen::MatrixXi F;
    if (!igl::read_triangle_mesh(path, V, F)) {
        throw MeshImportError("Could not parse " + path);
    }
    if (F.rows() > 0 && F.cols() != 3) {
        throw MeshImportError(path + " contains non-triangular faces");
    }

    if (format_from_path(path) == MeshFormat::STL) {
        Eigen::MatrixXd welded_vertices;
        Eigen::MatrixXi welded_faces;
        Eigen::VectorXi unique_to_original;
        Eigen::VectorXi original_to_unique;
        igl::remove_duplicate_vertices(V, F, 0.0, welded_vertices, unique_to_original,
                                       original_to_unique, welded_faces);
        logger_.debug("Welded " + std::to_string(V.rows()) + " STL corners into " +
                      std::to_string(welded_vertices.rows()) + " vertices");
        V = std::move(welded_vertices);
        F = std::move(welded_faces);
    }

    std::vector<Point3D> vertices;
    vertices.reserve(static_cast<size_t>(V.rows()));
    for (Eigen::Index i = 0; i < V.rows(); ++i) {
        vertices.emplace_back(V(i, 0), V(i, 1), V(i, 2));
    }

    std::vector<Face> faces;
    faces.reserve(static_cast<size_t>(F.rows()));
    for (Eigen::Index i = 0; i < F.rows(); ++i) {
        if (F(i, 0) < 0 || F(i, 1) < 0 || F(i, 2) < 0) {
            throw MeshImportError(path + " has a negative vertex index in face " + std::to_string(i));
        }
        faces.emplace_back(static_cast<VertexId>(F(i, 0)), static_cast<VertexId>(F(i, 1)),
                           static_cast<VertexId>(F(i, 2)));
    }

    logger_.info("Loaded " + path + ": " + std::to_string(vertices.size()) + " vertices, " +
                 std::to_string(faces.size()) + " faces");

    try {
        return Mesh(std::move(vertices), std::move(faces));
    } catch (const MeshContractViolation& e) {
        throw MeshImportError(path + ": " + e.what());
    }
}

} // namespace neuroforge
