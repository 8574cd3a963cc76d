/**
 * @file LineSupportPlacer.hpp
 * @brief Orientation of power-line support symbols from nearby bracing points
 */

#pragma once

#include "PlacementPlan.hpp"
#include "Logger.hpp"
#include <string>
#include <vector>

namespace survey {

/**
 * @brief Bracing point considered for one support
 */
struct BracingCandidate {
    double distance = 0.0;
    double bearing_deg = 0.0;     ///< atan2 bearing from the support, degrees
};

/**
 * @brief Places a support block oriented toward its bracing points
 *
 * Up to two bracing points within the distance threshold (inclusive) are
 * used, nearest first. The block variant is chosen by how many were found
 * (0, 1 or 2); rotation is 0, the single bearing, or the mean of the two.
 */
class LineSupportPlacer {
public:
    explicit LineSupportPlacer(const AnnotationConfig& config);

    PlacementPlan place(const std::vector<SurveyPoint>& points, const DrawingSink& sink) const;

    /**
     * @brief Bracing points around points[support_index], nearest first
     *
     * Equal distances keep row order.
     */
    std::vector<BracingCandidate> find_bracing(const std::vector<SurveyPoint>& points,
                                               size_t support_index) const;

    /**
     * @brief Rotation from the nearest (at most two) candidates
     */
    static double support_rotation(const std::vector<BracingCandidate>& candidates);

private:
    const AnnotationConfig& config_;
    std::vector<std::string> support_codes_;
    std::vector<std::string> bracing_codes_;
    Logger logger_;
};

} // namespace survey
