/**
 * @file TowerPlacer.cpp
 * @brief Implementation of tower footprint reconstruction
 */

#include "TowerPlacer.hpp"
#include "PointClustering.hpp"
#include "TextUtils.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <unordered_map>

namespace survey {

namespace {

Eigen::Vector2d planar(const Point3D& p) {
    return Eigen::Vector2d(p.x(), p.y());
}

bool starts_with(const std::string& text, const std::string& prefix) {
    return !prefix.empty() && text.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

TowerPlacer::TowerPlacer(const AnnotationConfig& config)
    : config_(config),
      codes_(normalize_codes(config.tower.codes)),
      prefixes_(normalize_codes(config.tower.prefixes)),
      logger_("TowerPlacer") {
}

// ============================================================================
// Grouping and Completion
// ============================================================================

std::vector<TowerGroup> TowerPlacer::group_points(const std::vector<SurveyPoint>& points) const {
    std::vector<TowerGroup> groups;
    std::unordered_map<std::string, size_t> index_by_key;

    for (const auto& point : points) {
        std::string code = normalize_code(point.code);
        if (code.empty()) {
            continue;
        }

        std::string key;
        if (std::find(codes_.begin(), codes_.end(), code) != codes_.end()) {
            key = code;
        } else {
            for (const auto& prefix : prefixes_) {
                if (starts_with(code, prefix)) {
                    key = prefix;
                    break;
                }
            }
        }
        if (key.empty()) {
            continue;
        }

        auto it = index_by_key.find(key);
        if (it == index_by_key.end()) {
            index_by_key.emplace(key, groups.size());
            groups.push_back(TowerGroup{key, {point.position()}});
        } else {
            groups[it->second].points.push_back(point.position());
        }
    }
    return groups;
}

std::optional<Point3D> TowerPlacer::complete_rectangle(const std::vector<Point3D>& corners, double tolerance) {
    if (corners.size() != 3) {
        return std::nullopt;
    }

    for (size_t i = 0; i < 3; ++i) {
        Eigen::Vector2d corner = planar(corners[i]);
        Eigen::Vector2d o1 = planar(corners[(i + 1) % 3]);
        Eigen::Vector2d o2 = planar(corners[(i + 2) % 3]);

        double d1_sq = (corner - o1).squaredNorm();
        double d2_sq = (corner - o2).squaredNorm();
        double diag_sq = (o1 - o2).squaredNorm();
        if (diag_sq == 0.0) {
            continue;
        }

        if (std::abs(d1_sq + d2_sq - diag_sq) <= tolerance * diag_sq) {
            Eigen::Vector2d fourth = o1 + o2 - corner;
            double z = (corners[0].z() + corners[1].z() + corners[2].z()) / 3.0;
            return Point3D(fourth.x(), fourth.y(), z);
        }
    }
    return std::nullopt;
}

// ============================================================================
// Footprint Fitting
// ============================================================================

std::optional<BlockPlacement> TowerPlacer::fit_footprint(const std::vector<Point3D>& corners,
                                                         const BlockExtent& block_extent,
                                                         const EntityAttributes& attributes) const {
    const size_t n = corners.size();
    if (n < 2) {
        return std::nullopt;
    }

    Eigen::Vector2d center = Eigen::Vector2d::Zero();
    double center_z = 0.0;
    for (const auto& corner : corners) {
        center += planar(corner);
        center_z += corner.z();
    }
    center /= static_cast<double>(n);
    center_z /= static_cast<double>(n);

    std::vector<Eigen::Vector2d> outline;
    outline.reserve(n);
    for (const auto& corner : corners) {
        outline.push_back(planar(corner));
    }
    std::stable_sort(outline.begin(), outline.end(),
                     [&center](const Eigen::Vector2d& a, const Eigen::Vector2d& b) {
                         return std::atan2(a.y() - center.y(), a.x() - center.x()) <
                                std::atan2(b.y() - center.y(), b.x() - center.x());
                     });

    std::vector<Eigen::Vector2d> edges;
    edges.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        edges.push_back(outline[(i + 1) % n] - outline[i]);
    }

    size_t major = 0;
    for (size_t i = 1; i < n; ++i) {
        if (edges[i].norm() > edges[major].norm()) {
            major = i;
        }
    }

    // Major side, its neighbours and the opposite side must all have length
    for (size_t offset = 0; offset < 4; ++offset) {
        if (edges[(major + offset) % n].norm() <= 0.0) {
            return std::nullopt;
        }
    }

    Eigen::Vector2d u = edges[major].normalized();
    Eigen::Vector2d v(-u.y(), u.x());

    double min_u = 0.0, max_u = 0.0, min_v = 0.0, max_v = 0.0;
    for (size_t i = 0; i < n; ++i) {
        Eigen::Vector2d offset = planar(corners[i]) - center;
        double pu = offset.dot(u);
        double pv = offset.dot(v);
        if (i == 0) {
            min_u = max_u = pu;
            min_v = max_v = pv;
        } else {
            min_u = std::min(min_u, pu);
            max_u = std::max(max_u, pu);
            min_v = std::min(min_v, pv);
            max_v = std::max(max_v, pv);
        }
    }

    const auto& tower = config_.tower;
    BlockPlacement placement;
    placement.block_name = tower.block_name;
    placement.position = Point3D(center.x(), center.y(), center_z);
    placement.rotation_deg = std::atan2(edges[major].y(), edges[major].x()) * 180.0 / M_PI;
    placement.scale = {std::max((max_u - min_u) / block_extent.width, tower.min_scale),
                       std::max((max_v - min_v) / block_extent.height, tower.min_scale),
                       tower.zscale};
    placement.attributes = attributes;
    return placement;
}

// ============================================================================
// Placement
// ============================================================================

PlacementPlan TowerPlacer::place(const std::vector<SurveyPoint>& points, const DrawingSink& sink) const {
    PlacementPlan plan;
    const auto& tower = config_.tower;

    std::vector<TowerGroup> groups = group_points(points);
    if (groups.empty()) {
        return plan;
    }

    if (tower.block_name.empty()) {
        plan.template_defects.push_back("Tower block name is not configured; towers skipped");
        logger_.warning(plan.template_defects.back());
        return plan;
    }
    if (!sink.has_block(tower.block_name)) {
        plan.template_defects.push_back("Block " + tower.block_name +
                                        " is not present in the drawing template; towers skipped");
        logger_.warning(plan.template_defects.back());
        return plan;
    }

    const size_t group_size = static_cast<size_t>(std::max(2, tower.group_size));
    const size_t min_points = std::min(group_size, static_cast<size_t>(std::max(0, tower.min_points)));

    BlockExtent extent{tower.base_width > 0.0 ? tower.base_width : 1.0,
                       tower.base_height > 0.0 ? tower.base_height : 1.0};
    if (auto template_extent = sink.get_block_bounding_box(tower.block_name)) {
        if (template_extent->width > 0.0) extent.width = template_extent->width;
        if (template_extent->height > 0.0) extent.height = template_extent->height;
    }

    EntityAttributes attributes(config_.default_block_layer, 7);
    if (auto properties = sink.block_properties(tower.block_name)) {
        attributes = *properties;
    }
    if (!tower.layer.empty()) {
        attributes.layer = tower.layer;
    }
    if (tower.color) {
        attributes.color = *tower.color;
    }

    for (const auto& group : groups) {
        for (const auto& component : cluster_by_distance(group.points, tower.max_span)) {
            if (component.size() < min_points || component.size() > group_size) {
                plan.geometry_defects.push_back("Tower group " + group.key + " has " +
                                                std::to_string(component.size()) + " points (expected " +
                                                std::to_string(min_points) + "-" +
                                                std::to_string(group_size) + ")");
                logger_.warning(plan.geometry_defects.back());
                continue;
            }

            std::vector<Point3D> corners;
            for (size_t index : component) {
                corners.push_back(group.points[index]);
            }

            if (corners.size() == 3 && min_points <= 3 && group_size >= 4) {
                auto fourth = complete_rectangle(corners, tower.right_angle_tolerance);
                if (!fourth) {
                    plan.geometry_defects.push_back("Cannot infer fourth tower point for " + group.key);
                    logger_.warning(plan.geometry_defects.back());
                    continue;
                }
                corners.push_back(*fourth);
            }

            if (corners.size() != group_size) {
                plan.geometry_defects.push_back("Tower group " + group.key + " resolved to " +
                                                std::to_string(corners.size()) + " points; skipped");
                logger_.warning(plan.geometry_defects.back());
                continue;
            }

            auto placement = fit_footprint(corners, extent, attributes);
            if (!placement) {
                plan.geometry_defects.push_back("Tower " + group.key + " has degenerate geometry");
                logger_.warning(plan.geometry_defects.back());
                continue;
            }

            logger_.debug("Tower " + group.key + " at (" + format_fixed(placement->position.x(), 3) + ", " +
                          format_fixed(placement->position.y(), 3) + ") scale " +
                          format_fixed(placement->scale[0], 3) + "x" + format_fixed(placement->scale[1], 3));
            plan.blocks.push_back(std::move(*placement));
        }
    }

    logger_.info("Placed " + std::to_string(plan.blocks.size()) + " tower blocks");
    return plan;
}

} // namespace survey
