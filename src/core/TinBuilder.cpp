/**
 * @file TinBuilder.cpp
 * @brief Implementation of the CGAL-based surface triangulation
 */

#include "TinBuilder.hpp"
#include "PlanarGridIndex.hpp"
#include "TextUtils.hpp"
#include <algorithm>
#include <map>
#include <utility>

#include <CGAL/Exact_predicates_inexact_constructions_kernel.h>
#include <CGAL/Delaunay_triangulation_2.h>
#include <CGAL/Triangulation_vertex_base_with_info_2.h>

namespace survey {

namespace {

using Kernel = CGAL::Exact_predicates_inexact_constructions_kernel;
using VertexBase = CGAL::Triangulation_vertex_base_with_info_2<VertexId, Kernel>;
using DataStructure = CGAL::Triangulation_data_structure_2<VertexBase>;
using Delaunay = CGAL::Delaunay_triangulation_2<Kernel, DataStructure>;
using Site = std::pair<Kernel::Point_2, VertexId>;

} // namespace

// ============================================================================
// Constructor and Point Selection
// ============================================================================

TinBuilder::TinBuilder(const TinBuildConfig& config)
    : config_(config), logger_("TinBuilder") {
}

std::vector<Point3D> TinBuilder::select_points(const std::vector<SurveyPoint>& points,
                                               const std::vector<std::string>& code_filter) {
    std::vector<std::string> filter = normalize_codes(code_filter);
    std::vector<Point3D> selected;
    selected.reserve(points.size());

    for (const auto& point : points) {
        if (!filter.empty() &&
            std::find(filter.begin(), filter.end(), normalize_code(point.code)) == filter.end()) {
            continue;
        }
        selected.push_back(point.position());
    }
    return selected;
}

// ============================================================================
// Triangulation
// ============================================================================

TerrainMesh TinBuilder::build(const std::vector<Point3D>& points,
                              const std::vector<Breakline>& breaklines) {
    auto start_time = std::chrono::high_resolution_clock::now();
    stats_ = TinBuildStats{};
    stats_.input_points = points.size();

    std::vector<Point3D> sites = merge_sites(points, breaklines);
    logger_.detailed("Triangulating " + std::to_string(sites.size()) + " sites (" +
                     std::to_string(stats_.breakline_vertices_added) + " from breaklines)");

    TerrainMesh mesh;
    if (sites.size() < 3) {
        logger_.warning("Not enough points for a surface: " + std::to_string(sites.size()) +
                        " (need at least 3)");
    } else {
        mesh = triangulate(sites);
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    stats_.computation_time = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

    logger_.info("Surface: " + std::to_string(mesh.num_vertices()) + " vertices, " +
                 std::to_string(stats_.accepted_triangles) + " triangles (" +
                 std::to_string(stats_.degenerate_triangles) + " degenerate, " +
                 std::to_string(stats_.oversized_triangles) + " oversized rejected) in " +
                 std::to_string(stats_.computation_time.count()) + " ms");
    return mesh;
}

std::vector<Point3D> TinBuilder::merge_sites(const std::vector<Point3D>& points,
                                             const std::vector<Breakline>& breaklines) {
    std::vector<Point3D> sites;
    sites.reserve(points.size());

    // Coincident survey shots: the first row keeps the position
    std::map<std::pair<double, double>, size_t> exact_xy;
    for (const auto& point : points) {
        if (!exact_xy.emplace(std::make_pair(point.x(), point.y()), sites.size()).second) {
            stats_.duplicate_points++;
            logger_.debug("Duplicate XY position (" + format_fixed(point.x(), 3) + ", " +
                          format_fixed(point.y(), 3) + "); later point ignored");
            continue;
        }
        sites.push_back(point);
    }

    PlanarGridIndex index(config_.dedup_tolerance);
    for (size_t i = 0; i < sites.size(); ++i) {
        index.insert(sites[i].x(), sites[i].y(), i);
    }

    for (const auto& line : breaklines) {
        for (const auto& vertex : line.points) {
            if (!index.query(vertex.x(), vertex.y()).empty()) {
                stats_.breakline_vertices_merged++;
                continue;
            }
            index.insert(vertex.x(), vertex.y(), sites.size());
            sites.push_back(vertex);
            stats_.breakline_vertices_added++;
        }
    }

    return sites;
}

TerrainMesh TinBuilder::triangulate(const std::vector<Point3D>& sites) {
    TerrainMesh mesh;
    mesh.reserve_vertices(sites.size());
    for (const auto& site : sites) {
        mesh.add_vertex(site);
    }

    std::vector<Site> cgal_sites;
    cgal_sites.reserve(sites.size());
    for (size_t i = 0; i < sites.size(); ++i) {
        cgal_sites.emplace_back(Kernel::Point_2(sites[i].x(), sites[i].y()), static_cast<VertexId>(i));
    }

    Delaunay triangulation;
    try {
        triangulation.insert(cgal_sites.begin(), cgal_sites.end());
    } catch (const std::exception& e) {
        logger_.warning(std::string("Triangulation failed: ") + e.what());
        return TerrainMesh();
    }

    if (triangulation.dimension() < 2) {
        logger_.warning("Surface points are collinear or coincident; no triangles produced");
        return TerrainMesh();
    }

    for (auto face = triangulation.finite_faces_begin(); face != triangulation.finite_faces_end(); ++face) {
        stats_.raw_triangles++;

        Triangle triangle(face->vertex(0)->info(), face->vertex(1)->info(), face->vertex(2)->info());
        const auto& a = mesh.get_vertex(triangle.vertices[0]);
        const auto& b = mesh.get_vertex(triangle.vertices[1]);
        const auto& c = mesh.get_vertex(triangle.vertices[2]);

        double doubled_area = signed_area_2x(a, b, c);
        if (0.5 * std::abs(doubled_area) <= config_.area_epsilon) {
            stats_.degenerate_triangles++;
            continue;
        }
        if (mesh.max_edge_length(triangle) > config_.max_edge_length) {
            stats_.oversized_triangles++;
            continue;
        }

        if (doubled_area < 0.0) {
            std::swap(triangle.vertices[1], triangle.vertices[2]);
        }
        mesh.add_triangle(triangle);
    }

    mesh.canonicalize();
    stats_.accepted_triangles = mesh.num_triangles();

    if (stats_.degenerate_triangles > 0) {
        logger_.warning("Skipped " + std::to_string(stats_.degenerate_triangles) + " degenerate triangles");
    }
    if (stats_.oversized_triangles > 0) {
        logger_.detailed("Skipped " + std::to_string(stats_.oversized_triangles) +
                         " triangles with edges over " + format_fixed(config_.max_edge_length, 1));
    }

    return mesh;
}

} // namespace survey
