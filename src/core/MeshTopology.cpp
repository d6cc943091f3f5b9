/**
 * @file MeshTopology.cpp
 * @brief Implementation of the edge registry and connectivity queries
 *
 * Copyright (c) 2026 NeuroForge 3D contributors
 * Licensed under the MIT License.
 */

#include "MeshTopology.hpp"
#include <numeric>

namespace neuroforge {

namespace {

/**
 * @brief Disjoint-set forest over face IDs
 */
class FaceUnionFind {
public:
    explicit FaceUnionFind(size_t size) : parent_(size), rank_(size, 0) {
        std::iota(parent_.begin(), parent_.end(), FaceId{0});
    }

    FaceId find(FaceId face) {
        while (parent_[face] != face) {
            parent_[face] = parent_[parent_[face]];
            face = parent_[face];
        }
        return face;
    }

    void unite(FaceId a, FaceId b) {
        a = find(a);
        b = find(b);
        if (a == b) return;
        if (rank_[a] < rank_[b]) std::swap(a, b);
        parent_[b] = a;
        if (rank_[a] == rank_[b]) rank_[a]++;
    }

private:
    std::vector<FaceId> parent_;
    std::vector<unsigned char> rank_;
};

} // namespace

MeshTopology::MeshTopology(const Mesh& mesh) : mesh_(mesh) {
    const auto& faces = mesh_.faces();
    edge_registry_.reserve(faces.size() * 3 / 2 + 1);

    for (size_t f = 0; f < faces.size(); ++f) {
        const Face& face = faces[f];
        for (int i = 0; i < 3; ++i) {
            VertexId from = face[i];
            VertexId to = face[(i + 1) % 3];
            edge_registry_[face.edge(i)].add_face(static_cast<FaceId>(f), from < to);
        }
    }

    for (const auto& [edge_id, edge_info] : edge_registry_) {
        size_t face_count = edge_info.adjacent_faces.size();
        if (face_count == 1) {
            boundary_edge_count_++;
        } else if (face_count > 2) {
            excess_edge_count_++;
        } else if (!edge_info.is_closed_and_consistent()) {
            misoriented_edge_count_++;
        }
    }
}

const EdgeInfo* MeshTopology::find_edge(EdgeId edge_id) const {
    auto it = edge_registry_.find(edge_id);
    return it == edge_registry_.end() ? nullptr : &it->second;
}

bool MeshTopology::is_watertight() const {
    if (mesh_.num_faces() == 0) return false;
    return boundary_edge_count_ == 0 && excess_edge_count_ == 0 && misoriented_edge_count_ == 0;
}

std::vector<HalfEdge> MeshTopology::boundary_half_edges() const {
    std::vector<HalfEdge> half_edges;
    half_edges.reserve(boundary_edge_count_);

    const auto& faces = mesh_.faces();
    for (size_t f = 0; f < faces.size(); ++f) {
        const Face& face = faces[f];
        for (int i = 0; i < 3; ++i) {
            const EdgeInfo& info = edge_registry_.at(face.edge(i));
            if (info.adjacent_faces.size() == 1) {
                half_edges.push_back({face[i], face[(i + 1) % 3], static_cast<FaceId>(f)});
            }
        }
    }

    return half_edges;
}

std::vector<std::vector<FaceId>> MeshTopology::face_components() const {
    const size_t face_count = mesh_.num_faces();
    FaceUnionFind forest(face_count);

    for (const auto& [edge_id, edge_info] : edge_registry_) {
        for (size_t i = 1; i < edge_info.adjacent_faces.size(); ++i) {
            forest.unite(edge_info.adjacent_faces[0], edge_info.adjacent_faces[i]);
        }
    }

    std::vector<std::vector<FaceId>> components;
    std::unordered_map<FaceId, size_t> component_of_root;

    for (FaceId f = 0; f < face_count; ++f) {
        FaceId root = forest.find(f);
        auto [it, inserted] = component_of_root.emplace(root, components.size());
        if (inserted) {
            components.emplace_back();
        }
        components[it->second].push_back(f);
    }

    return components;
}

} // namespace neuroforge
