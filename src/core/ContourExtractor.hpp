/**
 * @file ContourExtractor.hpp
 * @brief Contour polylines by plane-triangle intersection of a terrain mesh
 *
 * Each level plane is intersected with every triangle it crosses; the
 * resulting segments are chained into polylines by matching endpoints.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "TerrainMesh.hpp"
#include "Logger.hpp"
#include <vector>
#include <utility>
#include <chrono>

namespace survey {

/**
 * @brief Configuration for contour extraction
 */
struct ContourExtractionConfig {
    double interval = 1.0;                      ///< Spacing of emitted levels
    double base_step = 0.5;                     ///< Ladder step all levels are multiples of
    double tolerance = 0.01;                    ///< Point matching and plane slack (XY / Z)
};

/**
 * @brief One chained contour line
 */
struct ContourPolyline {
    std::vector<Point3D> points;                ///< Z of every point equals the level
    bool closed = false;                        ///< Ring without a repeated end point
};

/**
 * @brief All polylines at one elevation
 */
struct ContourLevel {
    double elevation = 0.0;
    std::vector<ContourPolyline> polylines;
};

/**
 * @brief Statistics from the last extraction
 */
struct ContourExtractionStats {
    size_t levels_requested = 0;
    size_t levels_with_contours = 0;
    size_t segments = 0;
    size_t polylines = 0;
    bool ladder_too_long = false;               ///< Height range too large; no level was sliced
    std::chrono::milliseconds computation_time{0};
};

class ContourExtractor {
public:
    explicit ContourExtractor(const ContourExtractionConfig& config = ContourExtractionConfig{});

    /**
     * @brief Ladder of contour elevations for a height range
     *
     * Levels are integer multiples of base_step from floor(min_z/step)*step up
     * to max_z; those below min_z are dropped and every Nth of the rest is kept
     * starting with the first, N = max(1, round(interval / step)).
     */
    static std::vector<double> generate_contour_levels(double min_z, double max_z,
                                                       double interval, double base_step = 0.5);

    /**
     * @brief Whether the ladder for a height range is small enough to generate
     */
    static bool ladder_within_limits(double min_z, double max_z, double base_step);

    /**
     * @brief Extract contours at every generated level of the mesh
     *
     * Levels producing no polyline are omitted from the result.
     */
    std::vector<ContourLevel> extract(const TerrainMesh& mesh);

    /**
     * @brief Segments of the level plane through the mesh, in triangle order
     */
    std::vector<std::pair<Point3D, Point3D>> slice(const TerrainMesh& mesh, double level) const;

    /**
     * @brief Chain segments into polylines by endpoint matching
     */
    std::vector<ContourPolyline> chain(const std::vector<std::pair<Point3D, Point3D>>& segments) const;

    const ContourExtractionStats& get_stats() const { return stats_; }
    const ContourExtractionConfig& get_config() const { return config_; }

private:
    ContourExtractionConfig config_;
    Logger logger_;
    ContourExtractionStats stats_;

    bool near(const Point3D& a, const Point3D& b) const {
        return distance_2d(a, b) <= config_.tolerance;
    }
};

} // namespace survey
