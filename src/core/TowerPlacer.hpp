/**
 * @file TowerPlacer.hpp
 * @brief Reconstruction of tower footprints from corner shots
 *
 * Tower corners are surveyed as separate points sharing a tower code. Nearby
 * corners are clustered, a missing fourth corner is completed from a right
 * angle, and one block is placed per footprint, rotated along its longest
 * side and scaled to its extents.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "PlacementPlan.hpp"
#include "Logger.hpp"
#include <optional>
#include <string>
#include <vector>

namespace survey {

/**
 * @brief Tower corner points grouped by tower key
 */
struct TowerGroup {
    std::string key;                      ///< Exact tower code or matched prefix
    std::vector<Point3D> points;          ///< Row order
};

class TowerPlacer {
public:
    explicit TowerPlacer(const AnnotationConfig& config);

    PlacementPlan place(const std::vector<SurveyPoint>& points, const DrawingSink& sink) const;

    /**
     * @brief Group points by tower key
     *
     * The key is the normalized code when it is a tower code, otherwise the
     * first configured prefix the code starts with. Groups are returned in
     * order of first appearance.
     */
    std::vector<TowerGroup> group_points(const std::vector<SurveyPoint>& points) const;

    /**
     * @brief Fourth corner of a rectangle from three corners
     *
     * Each point is tried as the right-angle corner, accepted when
     * |d1² + d2² - diag²| <= tolerance * diag²; the completion is
     * o1 + o2 - corner with Z the mean of the three.
     */
    static std::optional<Point3D> complete_rectangle(const std::vector<Point3D>& corners, double tolerance);

    /**
     * @brief Block placement for one complete footprint
     *
     * Returns nullopt when a side of the polar-ordered outline has zero
     * length.
     */
    std::optional<BlockPlacement> fit_footprint(const std::vector<Point3D>& corners,
                                                const BlockExtent& block_extent,
                                                const EntityAttributes& attributes) const;

private:
    const AnnotationConfig& config_;
    std::vector<std::string> codes_;
    std::vector<std::string> prefixes_;
    Logger logger_;
};

} // namespace survey
