/**
 * @file MeshRefiner.hpp
 * @brief Single-pass densification of coarse surface triangles
 */

#pragma once

#include "TinBuilder.hpp"
#include <map>
#include <vector>

namespace survey {

/**
 * @brief Outcome of one refinement pass
 */
struct RefinementResult {
    TerrainMesh mesh;                   ///< Refined mesh (empty unless refined)
    std::vector<Point3D> added_points;  ///< Injected centroids in discovery order
    double threshold = 0.0;             ///< Edge length that triggered injection
    bool refined = false;
};

/**
 * @brief Adds centroids of triangles with long edges and re-triangulates once
 */
class MeshRefiner {
public:
    MeshRefiner(const std::map<int, double>& distance_by_scale,
                const TinBuildConfig& tin_config = TinBuildConfig{});

    /**
     * @brief Refinement distance for a nominal map scale
     *
     * Exact table keys map directly; other scales use the key with the
     * smallest absolute difference (the smaller key on a tie). An empty
     * table yields 0, which disables refinement.
     */
    double threshold_for_scale(int scale) const;

    /**
     * @brief Centroids of triangles having any XY edge longer than threshold
     *
     * Centroids are deduplicated on their coordinates rounded to 1/1000.
     */
    static std::vector<Point3D> find_refinement_points(const TerrainMesh& mesh, double threshold);

    /**
     * @brief Refine base_mesh built from points and breaklines
     *
     * When nothing qualifies the result is unrefined and the base mesh
     * remains the surface of record.
     */
    RefinementResult refine(const TerrainMesh& base_mesh,
                            const std::vector<Point3D>& points,
                            const std::vector<Breakline>& breaklines,
                            int scale);

private:
    std::map<int, double> distance_by_scale_;
    TinBuildConfig tin_config_;
    Logger logger_;
};

} // namespace survey
