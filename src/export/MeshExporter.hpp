/**
 * @file MeshExporter.hpp
 * @brief Triangle mesh export to STL (binary or ASCII) and OBJ
 *
 * Copyright (c) 2026 NeuroForge 3D contributors
 * Licensed under the MIT License.
 */

#pragma once

#include "neuroforge.hpp"
#include "../core/Logger.hpp"
#include "../core/Mesh.hpp"
#include <optional>
#include <string>

namespace neuroforge {

enum class MeshFormat { STL, OBJ };

/**
 * @brief Format implied by a file extension (case-insensitive)
 * @return std::nullopt for anything other than .stl or .obj
 */
std::optional<MeshFormat> format_from_path(const std::string& path);

/**
 * @brief Export configuration
 */
struct MeshExportOptions {
    StlEncoding stl_encoding = StlEncoding::BINARY;  ///< Binary or ASCII STL
    std::string solid_name = "NeuroForgeModel";      ///< ASCII solid name / OBJ object name
    std::string header_text = "Generated by NeuroForge 3D print-prep";  ///< Binary STL header
};

class MeshExporter {
public:
    explicit MeshExporter(const MeshExportOptions& options = MeshExportOptions(),
                          LogObserver observer = {});

    /**
     * @brief Write a mesh, choosing the format from the path extension
     *
     * Missing parent directories are created.
     *
     * @throws MeshContractViolation for an unsupported extension
     * @throws MeshExportError when the file cannot be written
     * @throws std::filesystem::filesystem_error when directory creation fails
     */
    void export_mesh(const Mesh& mesh, const std::string& path) const;

    void export_stl(const Mesh& mesh, const std::string& path) const;
    void export_obj(const Mesh& mesh, const std::string& path) const;

    const MeshExportOptions& options() const { return options_; }

private:
    MeshExportOptions options_;
    Logger logger_;

    void ensure_parent_directory(const std::string& path) const;
};

} // namespace neuroforge
