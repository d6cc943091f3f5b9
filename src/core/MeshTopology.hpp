#pragma once

/**
 * @file MeshTopology.hpp
 * @brief Edge registry and connectivity queries over a Mesh snapshot
 *
 * Built once from a mesh and discarded; it holds a reference to the mesh and
 * must not outlive it.
 *
 * Copyright (c) 2026 NeuroForge 3D contributors
 * Licensed under the MIT License.
 */

#include "neuroforge.hpp"
#include "Mesh.hpp"
#include <unordered_map>
#include <vector>

namespace neuroforge {

struct EdgeHash {
    std::size_t operator()(const EdgeId& edge_id) const noexcept {
        return std::hash<EdgeId>{}(edge_id);
    }
};

/**
 * @brief Faces incident to one undirected edge
 *
 * `forward[i]` records whether adjacent_faces[i] walks the edge from the lower
 * vertex ID to the higher one.
 */
struct EdgeInfo {
    std::vector<FaceId> adjacent_faces;
    std::vector<bool> forward;
    bool is_boundary = false;
    bool is_manifold = true;

    void add_face(FaceId face_id, bool walks_forward) {
        adjacent_faces.push_back(face_id);
        forward.push_back(walks_forward);
        is_manifold = adjacent_faces.size() <= 2;
        is_boundary = adjacent_faces.size() == 1;
    }

    /// Exactly two faces, traversing the edge in opposite directions
    bool is_closed_and_consistent() const {
        return adjacent_faces.size() == 2 && forward[0] != forward[1];
    }
};

/**
 * @brief Directed edge as walked by the face that owns it
 */
struct HalfEdge {
    VertexId from;
    VertexId to;
    FaceId face;
};

class MeshTopology {
public:
    explicit MeshTopology(const Mesh& mesh);

    const std::unordered_map<EdgeId, EdgeInfo, EdgeHash>& edges() const { return edge_registry_; }
    const EdgeInfo* find_edge(EdgeId edge_id) const;

    size_t num_edges() const { return edge_registry_.size(); }
    size_t boundary_edge_count() const { return boundary_edge_count_; }
    size_t excess_edge_count() const { return excess_edge_count_; }
    size_t misoriented_edge_count() const { return misoriented_edge_count_; }

    /**
     * @brief Every edge bordered by exactly two faces with opposite winding
     *
     * A mesh without faces is never watertight.
     */
    bool is_watertight() const;

    /**
     * @brief Half-edges of faces along open edges, in face order
     */
    std::vector<HalfEdge> boundary_half_edges() const;

    /**
     * @brief Face sets connected through shared edges
     *
     * Components are ordered by their lowest face index and list faces in
     * ascending order.
     */
    std::vector<std::vector<FaceId>> face_components() const;

private:
    const Mesh& mesh_;
    std::unordered_map<EdgeId, EdgeInfo, EdgeHash> edge_registry_;
    size_t boundary_edge_count_ = 0;
    size_t excess_edge_count_ = 0;
    size_t misoriented_edge_count_ = 0;
};

} // namespace neuroforge
