/**
 * @file LineSupportPlacer.cpp
 * @brief Implementation of line-support orientation
 */

#include "LineSupportPlacer.hpp"
#include "TextUtils.hpp"
#include <algorithm>

namespace survey {

namespace {

constexpr double kRadiansToDegrees = 180.0 / M_PI;

bool contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

} // namespace

LineSupportPlacer::LineSupportPlacer(const AnnotationConfig& config)
    : config_(config),
      support_codes_(normalize_codes(config.line_support.codes)),
      bracing_codes_(normalize_codes(config.line_support.bracing_codes)),
      logger_("LineSupportPlacer") {
}

std::vector<BracingCandidate> LineSupportPlacer::find_bracing(const std::vector<SurveyPoint>& points,
                                                              size_t support_index) const {
    std::vector<BracingCandidate> candidates;
    const SurveyPoint& support = points.at(support_index);

    for (size_t j = 0; j < points.size(); ++j) {
        if (j == support_index || !contains(bracing_codes_, normalize_code(points[j].code))) {
            continue;
        }

        double dx = points[j].x - support.x;
        double dy = points[j].y - support.y;
        double distance = std::hypot(dx, dy);
        if (distance <= config_.line_support.distance_threshold) {
            candidates.push_back(BracingCandidate{distance, std::atan2(dy, dx) * kRadiansToDegrees});
        }
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const BracingCandidate& a, const BracingCandidate& b) {
                         return a.distance < b.distance;
                     });
    return candidates;
}

double LineSupportPlacer::support_rotation(const std::vector<BracingCandidate>& candidates) {
    if (candidates.empty()) {
        return 0.0;
    }
    if (candidates.size() == 1) {
        return candidates[0].bearing_deg;
    }
    return (candidates[0].bearing_deg + candidates[1].bearing_deg) / 2.0;
}

PlacementPlan LineSupportPlacer::place(const std::vector<SurveyPoint>& points, const DrawingSink& sink) const {
    PlacementPlan plan;
    const double scale_factor = config_.effective_scale_factor();

    for (size_t i = 0; i < points.size(); ++i) {
        if (!contains(support_codes_, normalize_code(points[i].code))) {
            continue;
        }

        auto candidates = find_bracing(points, i);
        size_t count = std::min<size_t>(candidates.size(), 2);
        const std::string& block_name = config_.line_support.blocks[count];
        if (block_name.empty()) {
            logger_.debug("No support block configured for " + std::to_string(count) + " bracing points");
            continue;
        }

        double scale = resolve_scale(config_.line_support.scale, points[i].z) * scale_factor;

        BlockPlacement placement;
        placement.block_name = block_name;
        placement.position = points[i].position();
        placement.scale = {scale, scale, scale};
        placement.rotation_deg = support_rotation(candidates);
        placement.attributes = resolve_block_attributes(sink, block_name, config_);

        logger_.trace("Support " + points[i].id + ": " + std::to_string(count) + " bracing, rotation " +
                      format_fixed(placement.rotation_deg, 2));
        plan.blocks.push_back(std::move(placement));
    }

    logger_.detailed("Placed " + std::to_string(plan.blocks.size()) + " line supports");
    return plan;
}

} // namespace survey
