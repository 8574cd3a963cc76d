/**
 * @file VegetationPlacer.cpp
 * @brief Implementation of vegetation outlines, scatter and fills
 */

#include "VegetationPlacer.hpp"
#include "BreaklineExtractor.hpp"
#include "TextUtils.hpp"
#include <algorithm>

namespace survey {

VegetationPlacer::VegetationPlacer(const AnnotationConfig& config)
    : config_(config),
      forest_markers_(normalize_codes(config.vegetation.forest_markers)),
      shrub_markers_(normalize_codes(config.vegetation.shrub_markers)),
      logger_("VegetationPlacer") {
}

// ============================================================================
// Polygon Helpers
// ============================================================================

bool VegetationPlacer::point_in_polygon(double x, double y, const std::vector<Point3D>& polygon) {
    const size_t n = polygon.size();
    if (n < 3) {
        return false;
    }

    bool inside = false;
    double p1x = polygon[0].x();
    double p1y = polygon[0].y();
    for (size_t i = 1; i <= n; ++i) {
        double p2x = polygon[i % n].x();
        double p2y = polygon[i % n].y();
        if (y > std::min(p1y, p2y) && y <= std::max(p1y, p2y) && x <= std::max(p1x, p2x)) {
            // p1y != p2y here: y lies strictly above the lower end and at most the upper one
            double x_intersection = (y - p1y) * (p2x - p1x) / (p2y - p1y) + p1x;
            if (p1x == p2x || x <= x_intersection) {
                inside = !inside;
            }
        }
        p1x = p2x;
        p1y = p2y;
    }
    return inside;
}

std::vector<Point3D> VegetationPlacer::scatter_points(const std::vector<Point3D>& polygon, double min_distance,
                                                      int max_attempts, double z, std::mt19937& generator) {
    std::vector<Point3D> placed;
    if (polygon.size() < 3 || min_distance <= 0.0) {
        return placed;
    }

    BoundingBox bounds = compute_bounding_box(polygon);
    double cell = 2.0 * min_distance;
    size_t target = std::max<size_t>(1, static_cast<size_t>(bounds.area() / (cell * cell)));

    std::uniform_real_distribution<double> sample_x(bounds.min_x, bounds.max_x);
    std::uniform_real_distribution<double> sample_y(bounds.min_y, bounds.max_y);

    for (int attempt = 0; attempt < max_attempts && placed.size() < target; ++attempt) {
        double x = sample_x(generator);
        double y = sample_y(generator);
        if (!point_in_polygon(x, y, polygon)) {
            continue;
        }

        Point3D candidate(x, y, z);
        bool too_close = std::any_of(placed.begin(), placed.end(), [&](const Point3D& other) {
            return distance_2d(candidate, other) < min_distance;
        });
        if (!too_close) {
            placed.push_back(candidate);
        }
    }
    return placed;
}

// ============================================================================
// Placement
// ============================================================================

VegetationPlan VegetationPlacer::place(const std::vector<SurveyPoint>& points, const DrawingSink& sink) const {
    VegetationPlan plan;
    const auto& vegetation = config_.vegetation;
    const double scale_factor = config_.effective_scale_factor();

    std::mt19937 generator(config_.random_seed);
    std::uniform_real_distribution<double> sample_rotation(0.0, 360.0);

    auto groups = BreaklineExtractor::group_by_code(points, vegetation.prefixes, true);
    for (const auto& group : groups) {
        if (group.indices.size() < 3) {
            plan.scatter.geometry_defects.push_back("Vegetation outline " + group.code + " has only " +
                                                    std::to_string(group.indices.size()) + " points");
            logger_.warning(plan.scatter.geometry_defects.back());
            continue;
        }

        VegetationArea area;
        area.code = group.code;
        area.prefix = group.prefix;
        for (size_t index : BreaklineExtractor::order_by_nearest_neighbour(points, group.indices)) {
            area.boundary.push_back(points[index].position());
        }
        if (distance_2d(area.boundary.front(), area.boundary.back()) <= vegetation.close_tolerance) {
            area.boundary.pop_back();
        }
        if (area.boundary.size() < 3) {
            plan.scatter.geometry_defects.push_back("Vegetation outline " + group.code +
                                                    " collapses to fewer than 3 points");
            logger_.warning(plan.scatter.geometry_defects.back());
            continue;
        }

        auto mapped_layer = config_.polyline_layers.find(group.prefix);
        std::string layer = mapped_layer != config_.polyline_layers.end() ? mapped_layer->second
                                                                          : vegetation.default_layer;
        int color = 7;
        if (auto layer_definition = sink.layer_exists(layer)) {
            color = layer_definition->color;
        }
        area.attributes = EntityAttributes(layer, color);
        area.forest = contains_any(group.prefix, forest_markers_);

        if (!area.forest) {
            if (contains_any(group.prefix, shrub_markers_)) {
                area.fill = FillStyle::pattern_fill(vegetation.shrub_pattern,
                                                    vegetation.shrub_pattern_scale * scale_factor);
            } else {
                area.fill = FillStyle::solid_fill();
            }
            logger_.debug("Vegetation outline " + group.code + ": " + std::to_string(area.boundary.size()) +
                          " points on layer " + layer);
            plan.areas.push_back(std::move(area));
            continue;
        }

        if (!sink.has_block(vegetation.forest_block)) {
            plan.scatter.template_defects.push_back("Block " + vegetation.forest_block +
                                                    " is not present in the drawing template; forest " +
                                                    group.code + " left unfilled");
            logger_.warning(plan.scatter.template_defects.back());
            plan.areas.push_back(std::move(area));
            continue;
        }

        double mean_z = 0.0;
        for (const auto& p : area.boundary) {
            mean_z += p.z();
        }
        mean_z /= static_cast<double>(area.boundary.size());

        EntityAttributes block_attributes(layer, 7);
        if (auto properties = sink.block_properties(vegetation.forest_block)) {
            block_attributes = *properties;
        }

        auto positions = scatter_points(area.boundary, vegetation.min_distance, vegetation.max_attempts,
                                        mean_z, generator);
        for (const auto& position : positions) {
            BlockPlacement placement;
            placement.block_name = vegetation.forest_block;
            placement.position = position;
            placement.scale = {scale_factor, scale_factor, scale_factor};
            placement.rotation_deg = sample_rotation(generator);
            placement.attributes = block_attributes;
            plan.scatter.blocks.push_back(std::move(placement));
        }

        logger_.info("Placed " + std::to_string(positions.size()) + " '" + vegetation.forest_block +
                     "' blocks in forest outline " + group.code);
        plan.areas.push_back(std::move(area));
    }

    return plan;
}

} // namespace survey
