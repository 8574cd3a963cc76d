/**
 * @file TinBuilder.hpp
 * @brief Delaunay triangulation of survey points into a terrain mesh
 *
 * Triangulates the XY projection of the survey points (plus breakline
 * vertices) with CGAL and maps each face back to the 3D survey positions.
 * Breakline vertices are point additions only; edges are not constrained.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "TerrainMesh.hpp"
#include "Logger.hpp"
#include <vector>
#include <string>
#include <chrono>

namespace survey {

/**
 * @brief Configuration for surface triangulation
 */
struct TinBuildConfig {
    double max_edge_length = 100.0;               ///< Longest accepted triangle edge (XY)
    double dedup_tolerance = 0.01;                ///< Breakline vertex merge distance (XY)
    double area_epsilon = 1e-9;                   ///< Smallest accepted projected area
};

/**
 * @brief Statistics from the last triangulation
 */
struct TinBuildStats {
    size_t input_points = 0;                      ///< Points handed to build()
    size_t duplicate_points = 0;                  ///< Input points sharing XY with an earlier one
    size_t breakline_vertices_added = 0;          ///< Breakline vertices that became new sites
    size_t breakline_vertices_merged = 0;         ///< Breakline vertices matched to existing sites
    size_t raw_triangles = 0;                     ///< Finite faces from the triangulation
    size_t degenerate_triangles = 0;              ///< Rejected for area <= epsilon
    size_t oversized_triangles = 0;               ///< Rejected for an edge > max_edge_length
    size_t accepted_triangles = 0;
    std::chrono::milliseconds computation_time{0};
};

/**
 * @brief Builds the triangulated irregular network
 */
class TinBuilder {
public:
    explicit TinBuilder(const TinBuildConfig& config = TinBuildConfig{});

    /**
     * @brief Positions of the points whose normalized code is in the filter
     *
     * An empty filter selects every point. Row order is preserved.
     */
    static std::vector<Point3D> select_points(const std::vector<SurveyPoint>& points,
                                              const std::vector<std::string>& code_filter);

    /**
     * @brief Triangulate points plus breakline vertices
     *
     * Fewer than three usable sites, or sites that are all collinear, produce
     * an empty mesh and a warning. Accepted triangles are counter-clockwise
     * and in canonical order (see TerrainMesh::canonicalize).
     */
    TerrainMesh build(const std::vector<Point3D>& points,
                      const std::vector<Breakline>& breaklines = {});

    const TinBuildStats& get_stats() const { return stats_; }

    void set_config(const TinBuildConfig& config) { config_ = config; }
    const TinBuildConfig& get_config() const { return config_; }

private:
    TinBuildConfig config_;
    Logger logger_;
    TinBuildStats stats_;

    /**
     * @brief Unique sites: input points (exact XY duplicates dropped) followed
     * by breakline vertices not within dedup_tolerance of an earlier site
     */
    std::vector<Point3D> merge_sites(const std::vector<Point3D>& points,
                                     const std::vector<Breakline>& breaklines);

    /**
     * @brief Run the Delaunay triangulation and apply the triangle filters
     */
    TerrainMesh triangulate(const std::vector<Point3D>& sites);
};

} // namespace survey
