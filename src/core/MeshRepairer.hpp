/**
 * @file MeshRepairer.hpp
 * @brief Best-effort conversion of open or inconsistent meshes into solids
 *
 * Repair runs up to three sub-steps on a private copy of the input:
 *   1. hole filling (boundary loops triangulated in their best-fit plane)
 *   2. normal fixing (consistent winding, outward-facing per body)
 *   3. small component removal
 * A sub-step that cannot complete is logged as a warning and the mesh moves
 * on to the next one. The result is not guaranteed to be watertight.
 *
 * Copyright (c) 2026 NeuroForge 3D contributors
 * Licensed under the MIT License.
 */

#pragma once

#include "neuroforge.hpp"
#include "Logger.hpp"
#include "Mesh.hpp"
#include <vector>

namespace neuroforge {

class MeshRepairer {
public:
    explicit MeshRepairer(LogObserver observer = {});

    /**
     * @brief Repair a mesh
     *
     * A mesh that is already watertight is returned unchanged.
     */
    Mesh repair(const Mesh& mesh, const RepairOptions& options = RepairOptions()) const;

    /**
     * @brief Close every traceable boundary loop with new triangles
     *
     * New faces reuse the loop vertices; no vertices are added.
     */
    Mesh fill_holes(const Mesh& mesh) const;

    /**
     * @brief Make face winding consistent and outward-facing
     *
     * Leaves the mesh unchanged when some body cannot be oriented.
     */
    Mesh fix_normals(const Mesh& mesh) const;

    /**
     * @brief Drop bodies with fewer than ratio x total vertices
     *
     * The largest body is always kept.
     */
    Mesh remove_small_components(const Mesh& mesh, double min_component_ratio) const;

    /**
     * @brief Vertex cycles bounding the holes of a mesh
     *
     * Each loop is ordered so that a face (loop[0], loop[i], loop[i+1]) winds
     * consistently with the faces around the hole.
     */
    std::vector<std::vector<VertexId>> find_boundary_loops(const Mesh& mesh) const;

private:
    Logger logger_;

    std::vector<Face> triangulate_loop(const Mesh& mesh, const std::vector<VertexId>& loop) const;
};

} // namespace neuroforge
