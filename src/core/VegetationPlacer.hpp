/**
 * @file VegetationPlacer.hpp
 * @brief Vegetation outlines with block scatter or area fill
 */

#pragma once

#include "PlacementPlan.hpp"
#include "Logger.hpp"
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace survey {

/**
 * @brief One closed vegetation outline
 */
struct VegetationArea {
    std::string code;                       ///< Full normalized code, e.g. "les2"
    std::string prefix;                     ///< Vegetation class prefix
    std::vector<Point3D> boundary;          ///< Ring without a repeated end point
    EntityAttributes attributes;            ///< Layer and color of the outline
    bool forest = false;                    ///< Scattered blocks instead of a fill
    std::optional<FillStyle> fill;          ///< Set for non-forest classes
};

struct VegetationPlan {
    std::vector<VegetationArea> areas;
    PlacementPlan scatter;                  ///< Forest blocks and skipped outlines
};

/**
 * @brief Builds vegetation areas from coded outline points
 *
 * Outline points use the same "prefix + digits" coding and walk order as
 * linear features, with Cyrillic prefixes allowed. Forest classes receive
 * randomly scattered, randomly rotated blocks at least min_distance apart;
 * the generator is seeded from the configuration so output is reproducible.
 */
class VegetationPlacer {
public:
    explicit VegetationPlacer(const AnnotationConfig& config);

    VegetationPlan place(const std::vector<SurveyPoint>& points, const DrawingSink& sink) const;

    /**
     * @brief Ray-casting inside test in the XY plane
     */
    static bool point_in_polygon(double x, double y, const std::vector<Point3D>& polygon);

    /**
     * @brief Scatter positions inside a polygon
     *
     * Target count is max(1, floor(bbox_area / (2*min_distance)²)); at most
     * max_attempts uniform samples are drawn from the bounding box.
     */
    static std::vector<Point3D> scatter_points(const std::vector<Point3D>& polygon, double min_distance,
                                               int max_attempts, double z, std::mt19937& generator);

private:
    const AnnotationConfig& config_;
    std::vector<std::string> forest_markers_;
    std::vector<std::string> shrub_markers_;
    Logger logger_;
};

} // namespace survey
