/**
 * @file PointClustering.cpp
 * @brief Breadth-first clustering over a distance adjacency list
 */

#include "PointClustering.hpp"
#include <algorithm>
#include <queue>

namespace survey {

std::vector<std::vector<size_t>> cluster_by_distance(const std::vector<Point3D>& points, double threshold) {
    std::vector<std::vector<size_t>> adjacency(points.size());
    for (size_t i = 0; i < points.size(); ++i) {
        for (size_t j = i + 1; j < points.size(); ++j) {
            if (distance_2d(points[i], points[j]) <= threshold) {
                adjacency[i].push_back(j);
                adjacency[j].push_back(i);
            }
        }
    }

    std::vector<std::vector<size_t>> clusters;
    std::vector<bool> visited(points.size(), false);

    for (size_t seed = 0; seed < points.size(); ++seed) {
        if (visited[seed]) {
            continue;
        }

        std::vector<size_t> component;
        std::queue<size_t> frontier;
        frontier.push(seed);
        visited[seed] = true;

        while (!frontier.empty()) {
            size_t node = frontier.front();
            frontier.pop();
            component.push_back(node);

            for (size_t neighbour : adjacency[node]) {
                if (!visited[neighbour]) {
                    visited[neighbour] = true;
                    frontier.push(neighbour);
                }
            }
        }

        std::sort(component.begin(), component.end());
        clusters.push_back(std::move(component));
    }

    return clusters;
}

} // namespace survey
