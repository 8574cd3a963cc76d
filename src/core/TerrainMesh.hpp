#pragma once

/**
 * @file TerrainMesh.hpp
 * @brief Triangulated terrain surface with planar-projection helpers
 *
 * Vertices are full 3D survey positions; triangles are index triples whose
 * winding is counter-clockwise in the XY projection.
 */

#include "survey_annotator.hpp"
#include <optional>
#include <utility>

namespace survey {

/**
 * @brief Signed doubled area of the XY projection (positive = counter-clockwise)
 */
inline double signed_area_2x(const Point3D& a, const Point3D& b, const Point3D& c) {
    return (b.x() - a.x()) * (c.y() - a.y()) - (c.x() - a.x()) * (b.y() - a.y());
}

/**
 * @brief Results of checking mesh invariants
 */
struct MeshValidationResult {
    size_t num_degenerate_triangles = 0;
    size_t num_oversized_triangles = 0;
    size_t num_clockwise_triangles = 0;
    size_t num_invalid_indices = 0;

    bool is_valid() const {
        return num_degenerate_triangles == 0 && num_oversized_triangles == 0 &&
               num_clockwise_triangles == 0 && num_invalid_indices == 0;
    }
};

/**
 * @brief Terrain mesh: shared vertex storage plus index triangles
 */
class TerrainMesh {
public:
    TerrainMesh();

    TerrainMesh(TerrainMesh&& other) noexcept = default;
    TerrainMesh& operator=(TerrainMesh&& other) noexcept = default;
    TerrainMesh(const TerrainMesh&) = default;
    TerrainMesh& operator=(const TerrainMesh&) = default;

    // Mesh construction
    VertexId add_vertex(const Point3D& position);
    void add_triangle(const Triangle& triangle);
    void add_triangle(VertexId v0, VertexId v1, VertexId v2);

    // Accessors (throw std::out_of_range on bad ids)
    const Point3D& get_vertex(VertexId vertex_id) const;

    const std::vector<Point3D>& vertices() const { return vertices_; }
    const std::vector<Triangle>& triangles() const { return triangles_; }

    size_t num_vertices() const { return vertices_.size(); }
    size_t num_triangles() const { return triangles_.size(); }
    bool empty() const { return triangles_.empty(); }

    // Per-triangle geometry
    double max_edge_length(const Triangle& triangle) const;
    Point3D centroid(const Triangle& triangle) const;

    // Whole-mesh queries

    /**
     * @brief Min and max Z over vertices used by at least one triangle
     */
    std::optional<std::pair<double, double>> elevation_range() const;

    /**
     * @brief Check area, edge length, winding and index invariants
     */
    MeshValidationResult validate(double max_edge_length, double area_epsilon) const;

    /**
     * @brief Put triangles in canonical order
     *
     * Each triangle is rotated (winding preserved) so its smallest index comes
     * first, then triangles are sorted lexicographically. Output order is then
     * independent of the triangulation library's iteration order.
     */
    void canonicalize();

    void reserve_vertices(size_t count) { vertices_.reserve(count); }

private:
    std::vector<Point3D> vertices_;
    std::vector<Triangle> triangles_;
};

} // namespace survey
