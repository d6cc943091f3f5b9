/**
 * @file MeshImporter.hpp
 * @brief Reads candidate meshes from STL, OBJ, OFF and PLY files via libigl
 *
 * Copyright (c) 2026 NeuroForge 3D contributors
 * Licensed under the MIT License.
 */

#pragma once

#include "neuroforge.hpp"
#include "../core/Logger.hpp"
#include "../core/Mesh.hpp"
#include <string>

namespace neuroforge {

class MeshImporter {
public:
    explicit MeshImporter(LogObserver observer = {});

    /**
     * @brief Load a triangle mesh
     *
     * STL stores every facet with its own corners, so coincident corners are
     * welded into shared vertices to recover the surface topology.
     *
     * @throws MeshImportError if the file is missing or cannot be parsed
     */
    Mesh import_mesh(const std::string& path) const;

private:
    Logger logger_;
};

} // namespace neuroforge
