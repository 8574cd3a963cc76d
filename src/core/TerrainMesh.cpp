/**
 * @file TerrainMesh.cpp
 * @brief Implementation of the terrain mesh container
 */

#include "TerrainMesh.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>

namespace survey {

// ============================================================================
// TerrainMesh Implementation
// ============================================================================

TerrainMesh::TerrainMesh() = default;

VertexId TerrainMesh::add_vertex(const Point3D& position) {
    VertexId vertex_id = static_cast<VertexId>(vertices_.size());
    vertices_.push_back(position);
    return vertex_id;
}

void TerrainMesh::add_triangle(const Triangle& triangle) {
    triangles_.push_back(triangle);
}

void TerrainMesh::add_triangle(VertexId v0, VertexId v1, VertexId v2) {
    triangles_.emplace_back(v0, v1, v2);
}

const Point3D& TerrainMesh::get_vertex(VertexId vertex_id) const {
    if (vertex_id >= vertices_.size()) {
        throw std::out_of_range("Invalid vertex ID: " + std::to_string(vertex_id));
    }
    return vertices_[vertex_id];
}

double TerrainMesh::max_edge_length(const Triangle& triangle) const {
    double longest = 0.0;
    for (int i = 0; i < 3; ++i) {
        const auto& a = get_vertex(triangle.vertices[i]);
        const auto& b = get_vertex(triangle.vertices[(i + 1) % 3]);
        longest = std::max(longest, distance_2d(a, b));
    }
    return longest;
}

Point3D TerrainMesh::centroid(const Triangle& triangle) const {
    const auto& a = get_vertex(triangle.vertices[0]);
    const auto& b = get_vertex(triangle.vertices[1]);
    const auto& c = get_vertex(triangle.vertices[2]);
    return Point3D((a.x() + b.x() + c.x()) / 3.0,
                   (a.y() + b.y() + c.y()) / 3.0,
                   (a.z() + b.z() + c.z()) / 3.0);
}

std::optional<std::pair<double, double>> TerrainMesh::elevation_range() const {
    if (triangles_.empty()) {
        return std::nullopt;
    }

    double min_z = std::numeric_limits<double>::max();
    double max_z = std::numeric_limits<double>::lowest();
    for (const auto& triangle : triangles_) {
        for (VertexId id : triangle.vertices) {
            double z = get_vertex(id).z();
            min_z = std::min(min_z, z);
            max_z = std::max(max_z, z);
        }
    }
    return std::make_pair(min_z, max_z);
}

MeshValidationResult TerrainMesh::validate(double max_edge_length, double area_epsilon) const {
    MeshValidationResult result;

    for (const auto& triangle : triangles_) {
        bool indices_ok = true;
        for (VertexId id : triangle.vertices) {
            if (id >= vertices_.size()) {
                indices_ok = false;
            }
        }
        if (!indices_ok) {
            result.num_invalid_indices++;
            continue;
        }

        const auto& a = vertices_[triangle.vertices[0]];
        const auto& b = vertices_[triangle.vertices[1]];
        const auto& c = vertices_[triangle.vertices[2]];
        double doubled = signed_area_2x(a, b, c);

        if (0.5 * std::abs(doubled) <= area_epsilon) {
            result.num_degenerate_triangles++;
        } else if (doubled < 0.0) {
            result.num_clockwise_triangles++;
        }
        if (this->max_edge_length(triangle) > max_edge_length) {
            result.num_oversized_triangles++;
        }
    }

    return result;
}

void TerrainMesh::canonicalize() {
    for (auto& triangle : triangles_) {
        auto& v = triangle.vertices;
        auto smallest = std::min_element(v.begin(), v.end());
        std::rotate(v.begin(), smallest, v.end());
    }
    std::sort(triangles_.begin(), triangles_.end());
}

} // namespace survey
