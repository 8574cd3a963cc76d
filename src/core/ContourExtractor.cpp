/**
 * @file ContourExtractor.cpp
 * @brief Implementation of mesh slicing and segment chaining
 */

#include "ContourExtractor.hpp"
#include "PlanarGridIndex.hpp"
#include "TextUtils.hpp"
#include <algorithm>
#include <deque>
#include <limits>

namespace survey {

namespace {

// Cap on the number of ladder steps for absurd height ranges
constexpr double kMaxLadderSteps = 200000.0;

// Ladder indices stay exactly representable in both double and long long
constexpr double kMaxLadderIndex = 9.0e15;

} // namespace

ContourExtractor::ContourExtractor(const ContourExtractionConfig& config)
    : config_(config), logger_("ContourExtractor") {
}

// ============================================================================
// Level Generation
// ============================================================================

std::vector<double> ContourExtractor::generate_contour_levels(double min_z, double max_z,
                                                              double interval, double base_step) {
    std::vector<double> levels;
    if (!std::isfinite(min_z) || !std::isfinite(max_z) || max_z < min_z || base_step <= 0.0) {
        return levels;
    }

    if (!ladder_within_limits(min_z, max_z, base_step)) {
        return levels;
    }

    long long every_nth = std::max(1LL, std::llround(interval / base_step));
    long long first = static_cast<long long>(std::floor(min_z / base_step));
    long long last = static_cast<long long>(std::floor(max_z / base_step));

    long long kept = 0;
    for (long long k = first; k <= last; ++k) {
        double level = static_cast<double>(k) * base_step;
        if (level < min_z || level > max_z) {
            continue;
        }
        if (kept++ % every_nth == 0) {
            levels.push_back(level);
        }
    }
    return levels;
}

bool ContourExtractor::ladder_within_limits(double min_z, double max_z, double base_step) {
    if (base_step <= 0.0) {
        return false;
    }
    double first = std::floor(min_z / base_step);
    double last = std::floor(max_z / base_step);
    // NaN fails every comparison below
    return std::abs(first) <= kMaxLadderIndex && std::abs(last) <= kMaxLadderIndex &&
           last - first <= kMaxLadderSteps;
}

// ============================================================================
// Slicing
// ============================================================================

std::vector<std::pair<Point3D, Point3D>> ContourExtractor::slice(const TerrainMesh& mesh, double level) const {
    std::vector<std::pair<Point3D, Point3D>> segments;
    PlanarGridIndex endpoints(config_.tolerance);

    for (const auto& triangle : mesh.triangles()) {
        const Point3D* corners[3] = {&mesh.get_vertex(triangle.vertices[0]),
                                     &mesh.get_vertex(triangle.vertices[1]),
                                     &mesh.get_vertex(triangle.vertices[2])};

        bool all_above = true;
        bool all_below = true;
        for (const Point3D* corner : corners) {
            if (corner->z() <= level + config_.tolerance) all_above = false;
            if (corner->z() >= level - config_.tolerance) all_below = false;
        }
        if (all_above || all_below) {
            continue;
        }

        std::vector<Point3D> crossings;
        for (int i = 0; i < 3; ++i) {
            const Point3D& a = *corners[i];
            const Point3D& b = *corners[(i + 1) % 3];
            bool straddles = (a.z() <= level && b.z() >= level) || (a.z() >= level && b.z() <= level);
            if (!straddles || (a.z() == level && b.z() == level)) {
                continue;
            }

            double t = (level - a.z()) / (b.z() - a.z());
            Point3D crossing(a.x() + t * (b.x() - a.x()), a.y() + t * (b.y() - a.y()), level);

            bool duplicate = std::any_of(crossings.begin(), crossings.end(),
                                         [&](const Point3D& p) { return near(p, crossing); });
            if (!duplicate) {
                crossings.push_back(crossing);
            }
        }

        if (crossings.size() != 2) {
            continue;
        }

        const Point3D& p = crossings[0];
        const Point3D& q = crossings[1];

        // Shared edges lying on the plane are reported by both neighbours
        bool seen = false;
        for (size_t id : endpoints.query(p.x(), p.y())) {
            const auto& other = segments[id / 2];
            const Point3D& opposite = (id % 2 == 0) ? other.second : other.first;
            if (near(opposite, q)) {
                seen = true;
                break;
            }
        }
        if (seen) {
            continue;
        }

        size_t index = segments.size();
        endpoints.insert(p.x(), p.y(), index * 2);
        endpoints.insert(q.x(), q.y(), index * 2 + 1);
        segments.emplace_back(p, q);
    }

    return segments;
}

// ============================================================================
// Chaining
// ============================================================================

std::vector<ContourPolyline> ContourExtractor::chain(
    const std::vector<std::pair<Point3D, Point3D>>& segments) const {
    std::vector<ContourPolyline> polylines;
    std::vector<bool> used(segments.size(), false);

    PlanarGridIndex endpoints(config_.tolerance);
    for (size_t i = 0; i < segments.size(); ++i) {
        endpoints.insert(segments[i].first.x(), segments[i].first.y(), i * 2);
        endpoints.insert(segments[i].second.x(), segments[i].second.y(), i * 2 + 1);
    }

    // Lowest-index unused segment with an endpoint at p; the matched end is reported
    auto find_match = [&](const Point3D& p, bool& matched_first) -> std::optional<size_t> {
        for (size_t id : endpoints.query(p.x(), p.y())) {
            size_t seg = id / 2;
            if (!used[seg]) {
                matched_first = (id % 2 == 0);
                return seg;
            }
        }
        return std::nullopt;
    };

    for (size_t start = 0; start < segments.size(); ++start) {
        if (used[start]) {
            continue;
        }
        used[start] = true;

        std::deque<Point3D> chain_points{segments[start].first, segments[start].second};
        while (true) {
            if (chain_points.size() >= 4 && near(chain_points.front(), chain_points.back())) {
                break;
            }

            bool matched_first = false;
            if (auto seg = find_match(chain_points.back(), matched_first)) {
                used[*seg] = true;
                chain_points.push_back(matched_first ? segments[*seg].second : segments[*seg].first);
                continue;
            }
            if (auto seg = find_match(chain_points.front(), matched_first)) {
                used[*seg] = true;
                chain_points.push_front(matched_first ? segments[*seg].second : segments[*seg].first);
                continue;
            }
            break;
        }

        ContourPolyline polyline;
        polyline.points.assign(chain_points.begin(), chain_points.end());
        if (polyline.points.size() >= 4 && near(polyline.points.front(), polyline.points.back())) {
            polyline.points.pop_back();
            polyline.closed = true;
        }

        if (polyline.points.size() < 2) {
            continue;
        }
        polylines.push_back(std::move(polyline));
    }

    return polylines;
}

// ============================================================================
// Extraction
// ============================================================================

std::vector<ContourLevel> ContourExtractor::extract(const TerrainMesh& mesh) {
    auto start_time = std::chrono::high_resolution_clock::now();
    stats_ = ContourExtractionStats{};

    std::vector<ContourLevel> result;
    auto range = mesh.elevation_range();
    if (!range) {
        logger_.warning("Contours requested on an empty surface; nothing extracted");
        return result;
    }

    if (!ladder_within_limits(range->first, range->second, config_.base_step)) {
        stats_.ladder_too_long = true;
        logger_.warning("Elevation range " + format_fixed(range->first, 3) + " to " +
                        format_fixed(range->second, 3) + " exceeds the contour ladder limit; contours skipped");
        return result;
    }

    std::vector<double> levels = generate_contour_levels(range->first, range->second,
                                                         config_.interval, config_.base_step);
    stats_.levels_requested = levels.size();
    logger_.detailed("Elevation range " + format_fixed(range->first, 3) + " to " +
                     format_fixed(range->second, 3) + ", " + std::to_string(levels.size()) + " levels");

    for (double level : levels) {
        auto segments = slice(mesh, level);
        stats_.segments += segments.size();
        if (segments.empty()) {
            logger_.debug("No intersections at " + format_fixed(level, 2));
            continue;
        }

        ContourLevel contour_level;
        contour_level.elevation = level;
        contour_level.polylines = chain(segments);
        if (contour_level.polylines.empty()) {
            continue;
        }

        stats_.polylines += contour_level.polylines.size();
        logger_.trace("Level " + format_fixed(level, 2) + ": " + std::to_string(segments.size()) +
                      " segments, " + std::to_string(contour_level.polylines.size()) + " polylines");
        result.push_back(std::move(contour_level));
    }

    stats_.levels_with_contours = result.size();
    auto end_time = std::chrono::high_resolution_clock::now();
    stats_.computation_time = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

    logger_.info("Generated " + std::to_string(stats_.polylines) + " contour polylines on " +
                 std::to_string(result.size()) + " of " + std::to_string(levels.size()) + " levels in " +
                 std::to_string(stats_.computation_time.count()) + " ms");
    return result;
}

} // namespace survey
