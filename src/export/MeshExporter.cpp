/**
 * @file MeshExporter.cpp
 * @brief Implementation of STL and OBJ export
 *
 * Copyright (c) 2026 NeuroForge 3D contributors
 * Licensed under the MIT License.
 */

#include "MeshExporter.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>

namespace neuroforge {

namespace {

constexpr size_t STL_HEADER_SIZE = 80;

void write_u32_le(std::ofstream& out, std::uint32_t value) {
    char bytes[4] = {
        static_cast<char>(value & 0xFF),
        static_cast<char>((value >> 8) & 0xFF),
        static_cast<char>((value >> 16) & 0xFF),
        static_cast<char>((value >> 24) & 0xFF)
    };
    out.write(bytes, 4);
}

void write_f32_le(std::ofstream& out, double value) {
    float f = static_cast<float>(value);
    std::uint32_t bits;
    std::memcpy(&bits, &f, sizeof(bits));
    write_u32_le(out, bits);
}

} // namespace

std::optional<MeshFormat> format_from_path(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".stl") return MeshFormat::STL;
    if (ext == ".obj") return MeshFormat::OBJ;
    return std::nullopt;
}

MeshExporter::MeshExporter(const MeshExportOptions& options, LogObserver observer)
    : options_(options), logger_("MeshExporter", std::move(observer)) {}

void MeshExporter::export_mesh(const Mesh& mesh, const std::string& path) const {
    auto format = format_from_path(path);
    if (!format) {
        throw MeshContractViolation("unsupported mesh file extension for '" + path +
                                    "' (expected .stl or .obj)");
    }

    ensure_parent_directory(path);

    if (*format == MeshFormat::OBJ) {
        export_obj(mesh, path);
    } else {
        export_stl(mesh, path);
    }
}

void MeshExporter::ensure_parent_directory(const std::string& path) const {
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        logger_.detailed("Creating output directory: " + parent.string());
        std::filesystem::create_directories(parent);
    }
}

void MeshExporter::export_stl(const Mesh& mesh, const std::string& path) const {
    const bool binary = options_.stl_encoding == StlEncoding::BINARY;
    std::ofstream file(path, binary ? std::ios::binary : std::ios::out);
    if (!file.is_open()) {
        throw MeshExportError("Cannot open file for writing: " + path);
    }

    const auto& faces = mesh.faces();

    if (binary) {
        char header[STL_HEADER_SIZE] = {};
        std::strncpy(header, options_.header_text.c_str(), STL_HEADER_SIZE - 1);
        file.write(header, STL_HEADER_SIZE);

        write_u32_le(file, static_cast<std::uint32_t>(faces.size()));

        for (size_t f = 0; f < faces.size(); ++f) {
            Vector3D normal = mesh.compute_face_normal(static_cast<FaceId>(f));
            write_f32_le(file, normal.x());
            write_f32_le(file, normal.y());
            write_f32_le(file, normal.z());

            for (int i = 0; i < 3; ++i) {
                const Point3D& vertex = mesh.get_vertex(faces[f][i]);
                write_f32_le(file, vertex.x());
                write_f32_le(file, vertex.y());
                write_f32_le(file, vertex.z());
            }

            // Attribute byte count (always 0)
            const char attribute_count[2] = {0, 0};
            file.write(attribute_count, 2);
        }
    } else {
        file << std::setprecision(9);
        file << "solid " << options_.solid_name << "\n";

        for (size_t f = 0; f < faces.size(); ++f) {
            Vector3D normal = mesh.compute_face_normal(static_cast<FaceId>(f));
            file << "  facet normal " << normal.x() << " " << normal.y() << " " << normal.z() << "\n";
            file << "    outer loop\n";
            for (int i = 0; i < 3; ++i) {
                const Point3D& vertex = mesh.get_vertex(faces[f][i]);
                file << "      vertex " << vertex.x() << " " << vertex.y() << " " << vertex.z() << "\n";
            }
            file << "    endloop\n";
            file << "  endfacet\n";
        }

        file << "endsolid " << options_.solid_name << "\n";
    }

    file.close();
    if (file.fail()) {
        throw MeshExportError("Error while writing " + path);
    }

    logger_.info("Exported " + std::to_string(faces.size()) + " triangles to " + path +
                 (binary ? " (binary STL)" : " (ASCII STL)"));
}

void MeshExporter::export_obj(const Mesh& mesh, const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw MeshExportError("Cannot open file for writing: " + path);
    }

    file << std::setprecision(9);
    file << "# " << options_.header_text << "\n";
    file << "o " << options_.solid_name << "\n";

    for (const Point3D& v : mesh.vertices()) {
        file << "v " << v.x() << " " << v.y() << " " << v.z() << "\n";
    }

    // OBJ indices are 1-based
    for (const Face& face : mesh.faces()) {
        file << "f " << face[0] + 1 << " " << face[1] + 1 << " " << face[2] + 1 << "\n";
    }

    file.close();
    if (file.fail()) {
        throw MeshExportError("Error while writing " + path);
    }

    logger_.info("Exported " + std::to_string(mesh.num_vertices()) + " vertices and " +
                 std::to_string(mesh.num_faces()) + " faces to " + path + " (OBJ)");
}

} // namespace neuroforge
