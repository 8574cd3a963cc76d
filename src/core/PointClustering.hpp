/**
 * @file PointClustering.hpp
 * @brief Connected components of points under a distance threshold
 */

#pragma once

#include "survey_annotator.hpp"
#include <vector>

namespace survey {

/**
 * @brief Group points into connected components
 *
 * Two points are adjacent when their planar distance is <= threshold
 * (inclusive). Components are found by breadth-first search over an
 * adjacency list built once; they are returned in order of their smallest
 * index, each with ascending indices into the input vector.
 */
std::vector<std::vector<size_t>> cluster_by_distance(const std::vector<Point3D>& points, double threshold);

} // namespace survey
