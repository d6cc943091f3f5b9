/**
 * @file MeshRepairer.cpp
 * @brief Implementation of hole filling, normal fixing and component pruning
 *
 * Copyright (c) 2026 NeuroForge 3D contributors
 * Licensed under the MIT License.
 */

#include "MeshRepairer.hpp"
#include "MeshTopology.hpp"
#include <algorithm>
#include <list>
#include <map>
#include <queue>
#include <unordered_map>

#include <Eigen/Dense>

// CGAL includes for hole triangulation
#include <CGAL/Exact_predicates_inexact_constructions_kernel.h>
#include <CGAL/Partition_traits_2.h>
#include <CGAL/partition_2.h>

namespace neuroforge {

namespace {

using K = CGAL::Exact_predicates_inexact_constructions_kernel;
using PartitionTraits = CGAL::Partition_traits_2<K>;
using Point_2 = PartitionTraits::Point_2;
using Polygon_2 = PartitionTraits::Polygon_2;  // std::list container, required by the partition algorithms
using Polygon_list = std::list<Polygon_2>;

constexpr size_t NO_EDGE = static_cast<size_t>(-1);

// Fan around loop[0]; matches loop order, so it closes the hole with correct winding
std::vector<Face> fan_triangulate(const std::vector<VertexId>& loop) {
    std::vector<Face> faces;
    for (size_t i = 1; i + 1 < loop.size(); ++i) {
        if (loop[0] == loop[i] || loop[i] == loop[i + 1] || loop[0] == loop[i + 1]) continue;
        faces.emplace_back(loop[0], loop[i], loop[i + 1]);
    }
    return faces;
}

double signed_volume6(const Mesh& mesh, const Face& face) {
    const Point3D& a = mesh.get_vertex(face[0]);
    const Point3D& b = mesh.get_vertex(face[1]);
    const Point3D& c = mesh.get_vertex(face[2]);
    return a.as_vector().dot(b.as_vector().cross(c.as_vector()));
}

} // namespace

MeshRepairer::MeshRepairer(LogObserver observer)
    : logger_("MeshRepairer", std::move(observer)) {}

Mesh MeshRepairer::repair(const Mesh& mesh, const RepairOptions& options) const {
    if (!(options.min_component_ratio >= 0.0 && options.min_component_ratio <= 1.0)) {
        throw MeshContractViolation("min_component_ratio must be within [0, 1], got " +
                                    std::to_string(options.min_component_ratio));
    }

    if (mesh.is_watertight()) {
        logger_.info("Mesh is already watertight, no repair needed");
        return mesh;
    }

    logger_.info("Starting mesh repair. Initial state: " +
                 std::to_string(mesh.num_vertices()) + " vertices, " +
                 std::to_string(mesh.num_faces()) + " faces, watertight=false");

    Mesh result = mesh;

    if (options.fill_holes) {
        logger_.detailed("Filling holes...");
        result = fill_holes(result);
    }

    if (options.fix_normals) {
        logger_.detailed("Fixing normals...");
        result = fix_normals(result);
    }

    if (options.remove_small_components) {
        size_t bodies = result.count_bodies();
        if (bodies > 1) {
            logger_.detailed("Mesh has " + std::to_string(bodies) + " components, filtering...");
            result = remove_small_components(result, options.min_component_ratio);
        }
    }

    logger_.info("Repair completed. Final state: " +
                 std::to_string(result.num_vertices()) + " vertices, " +
                 std::to_string(result.num_faces()) + " faces, watertight=" +
                 (result.is_watertight() ? "true" : "false"));

    return result;
}

// ============================================================================
// Hole Filling
// ============================================================================

std::vector<std::vector<VertexId>> MeshRepairer::find_boundary_loops(const Mesh& mesh) const {
    MeshTopology topology(mesh);
    auto boundary = topology.boundary_half_edges();

    // A hole runs against the faces around it: face edge a->b yields hole edge b->a
    std::vector<std::pair<VertexId, VertexId>> hole_edges;
    std::unordered_map<VertexId, std::vector<size_t>> outgoing;
    hole_edges.reserve(boundary.size());
    for (const HalfEdge& half_edge : boundary) {
        outgoing[half_edge.to].push_back(hole_edges.size());
        hole_edges.emplace_back(half_edge.to, half_edge.from);
    }

    std::vector<std::vector<VertexId>> loops;
    std::vector<bool> used(hole_edges.size(), false);

    for (size_t start = 0; start < hole_edges.size(); ++start) {
        if (used[start]) continue;

        std::vector<VertexId> loop;
        const VertexId loop_start = hole_edges[start].first;
        size_t current = start;
        bool closed = false;

        while (current != NO_EDGE) {
            used[current] = true;
            loop.push_back(hole_edges[current].first);

            VertexId next_vertex = hole_edges[current].second;
            if (next_vertex == loop_start) {
                closed = true;
                break;
            }

            size_t next = NO_EDGE;
            auto it = outgoing.find(next_vertex);
            if (it != outgoing.end()) {
                for (size_t candidate : it->second) {
                    if (!used[candidate]) {
                        next = candidate;
                        break;
                    }
                }
            }
            current = next;
        }

        if (!closed || loop.size() < 3) {
            logger_.warning("Could not trace boundary loop starting at vertex " +
                            std::to_string(loop_start) + " (" + std::to_string(loop.size()) +
                            " edges), skipping");
            continue;
        }

        logger_.debug("Boundary loop with " + std::to_string(loop.size()) + " vertices");
        loops.push_back(std::move(loop));
    }

    return loops;
}

std::vector<Face> MeshRepairer::triangulate_loop(const Mesh& mesh,
                                                 const std::vector<VertexId>& loop) const {
    if (loop.size() == 3) {
        return {Face(loop[0], loop[1], loop[2])};
    }

    // Best-fit plane: the two dominant principal directions of the loop
    const Eigen::Index n = static_cast<Eigen::Index>(loop.size());
    Eigen::MatrixX3d points(n, 3);
    for (Eigen::Index i = 0; i < n; ++i) {
        const Point3D& p = mesh.get_vertex(loop[i]);
        points.row(i) << p.x(), p.y(), p.z();
    }
    Eigen::RowVector3d mean = points.colwise().mean();
    Eigen::MatrixX3d centered = points.rowwise() - mean;
    Eigen::Matrix3d covariance = centered.transpose() * centered;

    Eigen::SelfAdjointEigenSolver<Eigen::Matrix3d> solver(covariance);
    if (solver.info() != Eigen::Success) {
        logger_.debug("Plane fit failed for loop of " + std::to_string(loop.size()) +
                      " vertices, using fan triangulation");
        return fan_triangulate(loop);
    }
    // Eigenvalues ascend, so column 0 is the plane normal
    Eigen::Vector3d u = solver.eigenvectors().col(2);
    Eigen::Vector3d v = solver.eigenvectors().col(1);

    Polygon_2 polygon;
    std::map<std::pair<double, double>, size_t> index_of;
    for (Eigen::Index i = 0; i < n; ++i) {
        double x = centered.row(i).dot(u.transpose());
        double y = centered.row(i).dot(v.transpose());
        if (!index_of.emplace(std::make_pair(x, y), static_cast<size_t>(i)).second) {
            logger_.debug("Loop projects onto itself, using fan triangulation");
            return fan_triangulate(loop);
        }
        polygon.push_back(Point_2(x, y));
    }

    // orientation() requires a simple polygon
    if (!polygon.is_simple()) {
        logger_.debug("Projected loop of " + std::to_string(loop.size()) +
                      " vertices self-intersects, using fan triangulation");
        return fan_triangulate(loop);
    }

    // CGAL emits counter-clockwise pieces; flip them back if the loop ran clockwise
    const bool loop_is_clockwise = polygon.orientation() == CGAL::CLOCKWISE;
    if (loop_is_clockwise) {
        polygon.reverse_orientation();
    }

    Polygon_list pieces;
    CGAL::approx_convex_partition_2(polygon.vertices_begin(), polygon.vertices_end(),
                                    std::back_inserter(pieces), PartitionTraits());

    std::vector<Face> faces;
    faces.reserve(loop.size() - 2);

    for (const auto& piece : pieces) {
        std::vector<size_t> indices;
        indices.reserve(piece.size());
        for (auto vit = piece.vertices_begin(); vit != piece.vertices_end(); ++vit) {
            auto it = index_of.find({CGAL::to_double(vit->x()), CGAL::to_double(vit->y())});
            if (it == index_of.end()) {
                logger_.debug("Partition produced an unknown vertex, using fan triangulation");
                return fan_triangulate(loop);
            }
            indices.push_back(it->second);
        }

        // Convex pieces: a fan is a valid triangulation
        for (size_t i = 1; i + 1 < indices.size(); ++i) {
            VertexId a = loop[indices[0]];
            VertexId b = loop[indices[i]];
            VertexId c = loop[indices[i + 1]];
            faces.push_back(loop_is_clockwise ? Face(a, c, b) : Face(a, b, c));
        }
    }

    return faces;
}

Mesh MeshRepairer::fill_holes(const Mesh& mesh) const {
    auto loops = find_boundary_loops(mesh);
    if (loops.empty()) {
        logger_.detailed("No traceable holes found");
        return mesh;
    }

    std::vector<Face> faces = mesh.faces();
    size_t filled = 0;

    for (const auto& loop : loops) {
        try {
            auto patch = triangulate_loop(mesh, loop);
            faces.insert(faces.end(), patch.begin(), patch.end());
            filled++;
            logger_.debug("Closed hole of " + std::to_string(loop.size()) + " vertices with " +
                          std::to_string(patch.size()) + " triangles");
        } catch (const std::exception& e) {
            logger_.warning("Fill holes failed for loop of " + std::to_string(loop.size()) +
                            " vertices: " + e.what());
        }
    }

    logger_.info("Filled " + std::to_string(filled) + " of " + std::to_string(loops.size()) + " holes");
    return mesh.with_faces(std::move(faces));
}

// ============================================================================
// Normal Fixing
// ============================================================================

Mesh MeshRepairer::fix_normals(const Mesh& mesh) const {
    MeshTopology topology(mesh);
    const auto& faces = mesh.faces();
    const size_t face_count = faces.size();

    // Neighbours across manifold edges; same_direction means one of the two must flip
    struct Neighbor {
        FaceId face;
        bool same_direction;
    };
    std::vector<std::vector<Neighbor>> adjacency(face_count);
    for (const auto& [edge_id, edge_info] : topology.edges()) {
        if (edge_info.adjacent_faces.size() != 2) continue;
        FaceId a = edge_info.adjacent_faces[0];
        FaceId b = edge_info.adjacent_faces[1];
        if (a == b) continue;
        bool same_direction = edge_info.forward[0] == edge_info.forward[1];
        adjacency[a].push_back({b, same_direction});
        adjacency[b].push_back({a, same_direction});
    }

    // Breadth-first propagation of flip state, one patch per seed
    std::vector<int> flip(face_count, -1);
    std::vector<std::vector<FaceId>> patches;
    size_t conflicts = 0;

    for (FaceId seed = 0; seed < face_count; ++seed) {
        if (flip[seed] != -1) continue;

        patches.emplace_back();
        std::queue<FaceId> queue;
        flip[seed] = 0;
        queue.push(seed);

        while (!queue.empty()) {
            FaceId f = queue.front();
            queue.pop();
            patches.back().push_back(f);

            for (const Neighbor& neighbor : adjacency[f]) {
                int required = flip[f] ^ (neighbor.same_direction ? 1 : 0);
                if (flip[neighbor.face] == -1) {
                    flip[neighbor.face] = required;
                    queue.push(neighbor.face);
                } else if (flip[neighbor.face] != required) {
                    conflicts++;
                }
            }
        }
    }

    if (conflicts > 0) {
        logger_.warning("Fix normals failed: surface is not orientable, leaving winding unchanged");
        return mesh;
    }

    std::vector<Face> oriented(face_count);
    for (size_t f = 0; f < face_count; ++f) {
        oriented[f] = flip[f] ? faces[f].flipped() : faces[f];
    }

    // Consistent but inside-out patches get turned around
    size_t inverted_patches = 0;
    for (const auto& patch : patches) {
        double volume6 = 0.0;
        for (FaceId f : patch) {
            volume6 += signed_volume6(mesh, oriented[f]);
        }
        if (volume6 < 0.0) {
            inverted_patches++;
            for (FaceId f : patch) {
                oriented[f] = oriented[f].flipped();
            }
        }
    }

    size_t changed = 0;
    for (size_t f = 0; f < face_count; ++f) {
        if (!(oriented[f] == faces[f])) changed++;
    }

    logger_.detailed("Oriented " + std::to_string(patches.size()) + " patch(es), " +
                     std::to_string(inverted_patches) + " turned outward");
    logger_.info("Reoriented " + std::to_string(changed) + " of " +
                 std::to_string(face_count) + " faces");

    return mesh.with_faces(std::move(oriented));
}

// ============================================================================
// Component Pruning
// ============================================================================

Mesh MeshRepairer::remove_small_components(const Mesh& mesh, double min_component_ratio) const {
    auto components = mesh.split();
    if (components.size() <= 1) {
        return mesh;
    }

    std::stable_sort(components.begin(), components.end(),
        [](const Mesh& a, const Mesh& b) { return a.num_vertices() > b.num_vertices(); });

    size_t total_vertices = 0;
    for (const Mesh& component : components) {
        total_vertices += component.num_vertices();
    }
    const size_t min_vertices = static_cast<size_t>(total_vertices * min_component_ratio);

    std::vector<Mesh> kept;
    for (const Mesh& component : components) {
        if (component.num_vertices() >= min_vertices) {
            kept.push_back(component);
        } else {
            logger_.debug("Dropping component with " + std::to_string(component.num_vertices()) +
                          " vertices (minimum " + std::to_string(min_vertices) + ")");
        }
    }

    if (kept.empty()) {
        logger_.detailed("Kept only the largest component");
        return components.front();
    }

    logger_.detailed("Kept " + std::to_string(kept.size()) + " of " +
                     std::to_string(components.size()) + " components");

    return kept.size() == 1 ? kept.front() : Mesh::concatenate(kept);
}

} // namespace neuroforge
