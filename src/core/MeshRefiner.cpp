/**
 * @file MeshRefiner.cpp
 * @brief Implementation of centroid-injection refinement
 */

#include "MeshRefiner.hpp"
#include "TextUtils.hpp"
#include <cstdlib>
#include <iterator>
#include <set>
#include <tuple>

namespace survey {

MeshRefiner::MeshRefiner(const std::map<int, double>& distance_by_scale,
                         const TinBuildConfig& tin_config)
    : distance_by_scale_(distance_by_scale), tin_config_(tin_config), logger_("MeshRefiner") {
}

double MeshRefiner::threshold_for_scale(int scale) const {
    if (distance_by_scale_.empty()) {
        return 0.0;
    }

    auto exact = distance_by_scale_.find(scale);
    if (exact != distance_by_scale_.end()) {
        return exact->second;
    }

    // Keys ascend, so strict < keeps the smaller key on a tie
    auto best = distance_by_scale_.begin();
    long long best_diff = std::llabs(static_cast<long long>(best->first) - scale);
    for (auto it = std::next(best); it != distance_by_scale_.end(); ++it) {
        long long diff = std::llabs(static_cast<long long>(it->first) - scale);
        if (diff < best_diff) {
            best = it;
            best_diff = diff;
        }
    }
    return best->second;
}

std::vector<Point3D> MeshRefiner::find_refinement_points(const TerrainMesh& mesh, double threshold) {
    std::vector<Point3D> centroids;
    if (threshold <= 0.0) {
        return centroids;
    }

    std::set<std::tuple<long long, long long, long long>> seen;
    for (const auto& triangle : mesh.triangles()) {
        if (mesh.max_edge_length(triangle) <= threshold) {
            continue;
        }

        Point3D c = mesh.centroid(triangle);
        auto key = std::make_tuple(std::llround(c.x() * 1000.0),
                                   std::llround(c.y() * 1000.0),
                                   std::llround(c.z() * 1000.0));
        if (seen.insert(key).second) {
            centroids.push_back(c);
        }
    }
    return centroids;
}

RefinementResult MeshRefiner::refine(const TerrainMesh& base_mesh,
                                     const std::vector<Point3D>& points,
                                     const std::vector<Breakline>& breaklines,
                                     int scale) {
    RefinementResult result;
    result.threshold = threshold_for_scale(scale);

    if (base_mesh.empty()) {
        logger_.detailed("No base surface; refinement skipped");
        return result;
    }
    if (result.threshold <= 0.0) {
        logger_.detailed("Refinement disabled for scale 1:" + std::to_string(scale));
        return result;
    }

    result.added_points = find_refinement_points(base_mesh, result.threshold);
    if (result.added_points.empty()) {
        logger_.info("No triangle edges above " + format_fixed(result.threshold, 1) +
                     "; base surface kept");
        return result;
    }

    std::vector<Point3D> combined = points;
    combined.insert(combined.end(), result.added_points.begin(), result.added_points.end());

    TinBuilder builder(tin_config_);
    result.mesh = builder.build(combined, breaklines);
    result.refined = true;

    logger_.info("Refined surface at 1:" + std::to_string(scale) + " (threshold " +
                 format_fixed(result.threshold, 1) + "): " + std::to_string(result.added_points.size()) +
                 " points added, " + std::to_string(result.mesh.num_triangles()) + " triangles");
    return result;
}

} // namespace survey
