/**
 * @file MemoryDrawingSink.hpp
 * @brief Drawing sink that records every primitive in memory
 *
 * Used for dry runs and for inspecting pipeline output. Blocks and layers
 * must be declared before use; references to undeclared blocks are refused
 * the same way a template drawing refuses them.
 */

#pragma once

#include "DrawingSink.hpp"
#include "../core/Logger.hpp"
#include <map>
#include <string>
#include <vector>

namespace survey {

class MemoryDrawingSink : public DrawingSink {
public:
    struct PointRecord {
        Point3D position;
        EntityAttributes attributes;
    };

    struct FaceRecord {
        std::array<Point3D, 3> vertices;
        EntityAttributes attributes;
    };

    struct PolylineRecord {
        std::vector<Point3D> points;
        bool closed = false;
        bool three_d = true;
        EntityAttributes attributes;
    };

    struct FillRecord {
        std::vector<Point3D> boundary;
        FillStyle style;
        EntityAttributes attributes;
    };

    struct BlockDefinition {
        BlockExtent extent;
        std::optional<EntityAttributes> first_entity;   ///< Unset for an empty definition
    };

    MemoryDrawingSink();

    // Catalog setup
    void define_block(const std::string& name, double width, double height,
                      const std::optional<EntityAttributes>& first_entity = std::nullopt);
    void define_layer(const LayerAttributes& layer);

    /**
     * @brief Record pattern fills as solid, the way the DXF sink writes them
     */
    void set_fill_patterns_supported(bool supported) { fill_patterns_supported_ = supported; }

    // DrawingSink interface
    void add_point(const Point3D& position, const EntityAttributes& attributes) override;
    void add_face(const Point3D& v1, const Point3D& v2, const Point3D& v3,
                  const EntityAttributes& attributes) override;
    void add_polyline(const std::vector<Point3D>& points, bool closed, bool three_d,
                      const EntityAttributes& attributes) override;
    void add_text(const TextAnnotation& text) override;
    PlacementResult add_block_reference(const BlockPlacement& placement) override;
    PlacementResult add_area_fill(const std::vector<Point3D>& boundary, const FillStyle& style,
                                  const EntityAttributes& attributes) override;
    bool supports_fill_patterns() const override { return fill_patterns_supported_; }

    bool has_block(const std::string& name) const override;
    std::optional<BlockExtent> get_block_bounding_box(const std::string& name) const override;
    std::optional<EntityAttributes> block_properties(const std::string& name) const override;
    std::optional<LayerAttributes> layer_exists(const std::string& name) const override;

    // Recorded output
    const std::vector<PointRecord>& points() const { return points_; }
    const std::vector<FaceRecord>& faces() const { return faces_; }
    const std::vector<PolylineRecord>& polylines() const { return polylines_; }
    const std::vector<TextAnnotation>& texts() const { return texts_; }
    const std::vector<BlockPlacement>& blocks() const { return blocks_; }
    const std::vector<FillRecord>& fills() const { return fills_; }

    /**
     * @brief Number of recorded entities on a layer (all primitive kinds)
     */
    size_t count_on_layer(const std::string& layer) const;

private:
    std::map<std::string, BlockDefinition> block_catalog_;
    std::map<std::string, LayerAttributes> layer_catalog_;

    std::vector<PointRecord> points_;
    std::vector<FaceRecord> faces_;
    std::vector<PolylineRecord> polylines_;
    std::vector<TextAnnotation> texts_;
    std::vector<BlockPlacement> blocks_;
    std::vector<FillRecord> fills_;
    bool fill_patterns_supported_ = true;

    Logger logger_;
};

} // namespace survey
