/**
 * @file PointAnnotator.cpp
 * @brief Implementation of point markers and labels
 */

#include "PointAnnotator.hpp"
#include "TextUtils.hpp"

namespace survey {

PointAnnotator::PointAnnotator(const AnnotationConfig& config)
    : config_(config), logger_("PointAnnotator") {
}

std::vector<TextAnnotation> PointAnnotator::labels_for(const SurveyPoint& point) const {
    const auto& labels = config_.labels;
    const double sf = config_.effective_scale_factor();
    std::vector<TextAnnotation> result;

    auto make_label = [&](const std::string& text, double dx, double dy, const char* layer_name, int color) {
        TextAnnotation label;
        label.text = text;
        label.position = Point3D(point.x + dx * sf, point.y + dy * sf, point.z);
        label.height = labels.text_height;
        label.attributes = EntityAttributes(layer(layer_name), color);
        result.push_back(std::move(label));
    };

    if (labels.show_points) {
        make_label(point.id, 0.5, 1.5, "Name", labels.numbers_color);
    }
    if (labels.show_codes) {
        make_label(point.code, 0.5, -1.5, "Codes", labels.codes_color);
    }
    if (labels.show_elevations) {
        make_label(format_fixed(point.z, 3), 0.5, 0.0, "Elevations", labels.elevations_color);
    }
    std::string comment = trim(point.comment);
    if (labels.show_comments && !comment.empty()) {
        make_label(comment, 0.5, -3.0, "Comments", labels.comments_color);
    }
    return result;
}

PointAnnotationStats PointAnnotator::annotate(const std::vector<SurveyPoint>& points, DrawingSink& sink) const {
    PointAnnotationStats stats;
    const EntityAttributes marker_attributes(layer("Point"), config_.labels.numbers_color);

    for (const auto& point : points) {
        if (config_.labels.show_points) {
            sink.add_point(point.position(), marker_attributes);
            stats.markers++;
        }
        for (const auto& label : labels_for(point)) {
            sink.add_text(label);
            stats.labels++;
        }
    }

    logger_.detailed("Annotated " + std::to_string(points.size()) + " points: " +
                     std::to_string(stats.markers) + " markers, " + std::to_string(stats.labels) + " labels");
    return stats;
}

} // namespace survey
