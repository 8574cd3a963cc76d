/**
 * @file BreaklineExtractor.hpp
 * @brief Grouping of coded survey points into ordered linear features
 *
 * Points coded "prefix + digits" (gaz1, gaz2, k15) belong to one linear
 * feature per full code. Each group is ordered by a greedy nearest-neighbour
 * walk starting at its first row, which yields the polyline drawn on the
 * plan and the breakline fed to the triangulation.
 */

#pragma once

#include "survey_annotator.hpp"
#include "Logger.hpp"
#include <string>
#include <vector>

namespace survey {

/**
 * @brief Points sharing one full code, in original row order
 */
struct CodedGroup {
    std::string code;                 ///< Full normalized code, e.g. "gaz1"
    std::string prefix;               ///< Letter prefix, e.g. "gaz"
    std::vector<size_t> indices;      ///< Indices into the point table
};

/**
 * @brief Extracts breaklines from the point table
 */
class BreaklineExtractor {
public:
    /**
     * @param allowed_prefixes Prefixes accepted as linear features (any case)
     */
    explicit BreaklineExtractor(const std::vector<std::string>& allowed_prefixes);

    /**
     * @brief Group and order all linear features
     *
     * Groups are returned in order of their first row; groups with fewer
     * than two points produce nothing.
     */
    std::vector<Breakline> extract(const std::vector<SurveyPoint>& points) const;

    /**
     * @brief Group points whose code is "allowed prefix + digits"
     *
     * @param allow_cyrillic Accept Cyrillic letters in the prefix
     */
    static std::vector<CodedGroup> group_by_code(const std::vector<SurveyPoint>& points,
                                                 const std::vector<std::string>& allowed_prefixes,
                                                 bool allow_cyrillic);

    /**
     * @brief Greedy nearest-neighbour walk over a group
     *
     * Starts at the lowest row index and repeatedly moves to the closest
     * unvisited point (2D). Equidistant candidates resolve to the one that
     * comes first in row order.
     *
     * @return Group indices (into the point table) in walk order
     */
    static std::vector<size_t> order_by_nearest_neighbour(const std::vector<SurveyPoint>& points,
                                                          const std::vector<size_t>& group);

    /**
     * @brief Comment labels along a drawn breakline
     *
     * A segment whose start point carries a comment gets that comment at its
     * midpoint, shifted along the left normal and rotated to the segment
     * bearing. Zero-length segments are skipped.
     */
    static std::vector<TextAnnotation> segment_labels(const Breakline& line, double scale_factor,
                                                      const LabelConfig& labels,
                                                      const EntityAttributes& attributes);

private:
    std::vector<std::string> allowed_prefixes_;
    Logger logger_;
};

} // namespace survey
