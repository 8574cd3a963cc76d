/**
 * @file PointAnnotator.hpp
 * @brief Point markers and their number/code/elevation/comment labels
 */

#pragma once

#include "survey_annotator.hpp"
#include "../export/DrawingSink.hpp"
#include "Logger.hpp"
#include <vector>

namespace survey {

/**
 * @brief Counts of emitted point annotation entities
 */
struct PointAnnotationStats {
    size_t markers = 0;
    size_t labels = 0;
};

/**
 * @brief Emits a marker per survey point and up to four labels beside it
 *
 * Label offsets relative to the point (multiplied by the scale factor):
 * number (0.5, 1.5), elevation (0.5, 0), code (0.5, -1.5),
 * comment (0.5, -3.0).
 */
class PointAnnotator {
public:
    explicit PointAnnotator(const AnnotationConfig& config);

    /**
     * @brief Labels for one point (markers excluded)
     */
    std::vector<TextAnnotation> labels_for(const SurveyPoint& point) const;

    PointAnnotationStats annotate(const std::vector<SurveyPoint>& points, DrawingSink& sink) const;

private:
    const AnnotationConfig& config_;
    Logger logger_;

    std::string layer(const char* separated_name) const {
        return config_.layer_separation ? std::string(separated_name) : std::string("0");
    }
};

} // namespace survey
