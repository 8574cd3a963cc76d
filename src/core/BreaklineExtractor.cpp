/**
 * @file BreaklineExtractor.cpp
 * @brief Implementation of coded linear feature grouping
 */

#include "BreaklineExtractor.hpp"
#include "TextUtils.hpp"
#include <algorithm>
#include <unordered_map>
#include <limits>

namespace survey {

BreaklineExtractor::BreaklineExtractor(const std::vector<std::string>& allowed_prefixes)
    : allowed_prefixes_(normalize_codes(allowed_prefixes)), logger_("BreaklineExtractor") {
}

std::vector<CodedGroup> BreaklineExtractor::group_by_code(
    const std::vector<SurveyPoint>& points,
    const std::vector<std::string>& allowed_prefixes,
    bool allow_cyrillic) {

    std::vector<std::string> prefixes = normalize_codes(allowed_prefixes);
    std::vector<CodedGroup> groups;
    std::unordered_map<std::string, size_t> group_index;

    for (size_t i = 0; i < points.size(); ++i) {
        std::string code = normalize_code(points[i].code);
        auto coded = split_coded_name(code, allow_cyrillic);
        if (!coded) {
            continue;
        }
        if (std::find(prefixes.begin(), prefixes.end(), coded->prefix) == prefixes.end()) {
            continue;
        }

        auto it = group_index.find(code);
        if (it == group_index.end()) {
            group_index.emplace(code, groups.size());
            groups.push_back(CodedGroup{code, coded->prefix, {i}});
        } else {
            groups[it->second].indices.push_back(i);
        }
    }

    // Table order normally equals row order; sort anyway so row_index rules
    for (auto& group : groups) {
        std::stable_sort(group.indices.begin(), group.indices.end(),
                         [&points](size_t a, size_t b) {
                             return points[a].row_index < points[b].row_index;
                         });
    }
    std::stable_sort(groups.begin(), groups.end(),
                     [&points](const CodedGroup& a, const CodedGroup& b) {
                         return points[a.indices.front()].row_index < points[b.indices.front()].row_index;
                     });

    return groups;
}

std::vector<size_t> BreaklineExtractor::order_by_nearest_neighbour(
    const std::vector<SurveyPoint>& points,
    const std::vector<size_t>& group) {

    if (group.empty()) {
        return {};
    }

    std::vector<size_t> ordered;
    ordered.reserve(group.size());
    ordered.push_back(group.front());

    std::vector<size_t> remaining(group.begin() + 1, group.end());
    Point3D current = points[group.front()].position();

    while (!remaining.empty()) {
        size_t best = 0;
        double best_distance = std::numeric_limits<double>::infinity();
        for (size_t r = 0; r < remaining.size(); ++r) {
            double d = distance_2d(current, points[remaining[r]].position());
            if (d < best_distance) {   // strict: earliest candidate wins ties
                best_distance = d;
                best = r;
            }
        }

        ordered.push_back(remaining[best]);
        current = points[remaining[best]].position();
        remaining.erase(remaining.begin() + static_cast<std::ptrdiff_t>(best));
    }

    return ordered;
}

std::vector<Breakline> BreaklineExtractor::extract(const std::vector<SurveyPoint>& points) const {
    std::vector<Breakline> breaklines;

    for (const auto& group : group_by_code(points, allowed_prefixes_, false)) {
        if (group.indices.size() < 2) {
            logger_.debug("Linear feature " + group.code + " has a single point; skipped");
            continue;
        }

        Breakline line;
        line.code = group.code;
        line.prefix = group.prefix;
        for (size_t index : order_by_nearest_neighbour(points, group.indices)) {
            line.points.push_back(points[index].position());
            line.comments.push_back(trim(points[index].comment));
        }

        logger_.trace("Breakline " + line.code + ": " + std::to_string(line.points.size()) + " points");
        breaklines.push_back(std::move(line));
    }

    logger_.detailed("Extracted " + std::to_string(breaklines.size()) + " breaklines");
    return breaklines;
}

std::vector<TextAnnotation> BreaklineExtractor::segment_labels(const Breakline& line, double scale_factor,
                                                               const LabelConfig& labels,
                                                               const EntityAttributes& attributes) {
    std::vector<TextAnnotation> result;

    for (size_t i = 0; i + 1 < line.points.size(); ++i) {
        const std::string comment = i < line.comments.size() ? trim(line.comments[i]) : std::string();
        if (comment.empty()) {
            continue;
        }

        const Point3D& a = line.points[i];
        const Point3D& b = line.points[i + 1];
        double dx = b.x() - a.x();
        double dy = b.y() - a.y();
        double length = std::hypot(dx, dy);
        if (length == 0.0) {
            continue;
        }

        double shift = labels.line_label_offset * scale_factor;
        TextAnnotation label;
        label.text = comment;
        label.position = Point3D((a.x() + b.x()) / 2.0 - dy / length * shift,
                                 (a.y() + b.y()) / 2.0 + dx / length * shift, 0.0);
        label.height = labels.line_label_height * scale_factor;
        label.rotation_deg = std::atan2(dy, dx) * 180.0 / M_PI;
        label.attributes = attributes;
        result.push_back(std::move(label));
    }
    return result;
}

} // namespace survey
