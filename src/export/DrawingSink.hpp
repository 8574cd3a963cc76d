/**
 * @file DrawingSink.hpp
 * @brief Write-only drawing interface targeted by the annotation pipeline
 *
 * The engine emits points, faces, polylines, text, area fills and block
 * references through this interface and queries the block and layer catalog
 * of the drawing template. Writes that depend on the template (blocks, fills)
 * report an explicit PlacementResult instead of throwing.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "survey_annotator.hpp"
#include <optional>
#include <string>
#include <vector>

namespace survey {

/**
 * @brief Reasons a sink refuses a write
 */
enum class PlacementError {
    MissingBlock,       ///< Block name not defined in the template
    InvalidGeometry,    ///< Boundary or transform unusable
    WriteFailed         ///< Backend rejected the entity
};

/**
 * @brief Outcome of one sink write
 */
struct PlacementResult {
    bool success = true;
    PlacementError error = PlacementError::WriteFailed;
    std::string message;

    static PlacementResult ok() { return PlacementResult{}; }

    static PlacementResult failure(PlacementError error, const std::string& message) {
        PlacementResult result;
        result.success = false;
        result.error = error;
        result.message = message;
        return result;
    }

    explicit operator bool() const { return success; }
};

/**
 * @brief Layer definition known to the drawing
 */
struct LayerAttributes {
    std::string name;
    int color = 7;
    std::string linetype = "CONTINUOUS";
};

/**
 * @brief Planar extent of a block definition in block units
 */
struct BlockExtent {
    double width = 0.0;
    double height = 0.0;
};

/**
 * @brief Area fill: solid, or a named hatch pattern at a scale
 */
struct FillStyle {
    bool solid = true;
    std::string pattern;
    double scale = 1.0;

    static FillStyle solid_fill() { return FillStyle{}; }

    static FillStyle pattern_fill(const std::string& name, double scale) {
        FillStyle style;
        style.solid = false;
        style.pattern = name;
        style.scale = scale;
        return style;
    }
};

/**
 * @brief Abstract drawing sink (single writer, append only)
 *
 * Failures of plain geometry writes are logged by the implementation;
 * template-dependent writes return a PlacementResult.
 */
class DrawingSink {
public:
    virtual ~DrawingSink() = default;

    virtual void add_point(const Point3D& position, const EntityAttributes& attributes) = 0;

    virtual void add_face(const Point3D& v1, const Point3D& v2, const Point3D& v3,
                          const EntityAttributes& attributes) = 0;

    /**
     * @param three_d Keep vertex Z; otherwise the polyline is planar at Z = 0
     */
    virtual void add_polyline(const std::vector<Point3D>& points, bool closed, bool three_d,
                              const EntityAttributes& attributes) = 0;

    virtual void add_text(const TextAnnotation& text) = 0;

    virtual PlacementResult add_block_reference(const BlockPlacement& placement) = 0;

    virtual PlacementResult add_area_fill(const std::vector<Point3D>& boundary, const FillStyle& style,
                                          const EntityAttributes& attributes) = 0;

    /**
     * @brief Whether named hatch patterns are written as such
     *
     * Sinks returning false write pattern fills as solid fills.
     */
    virtual bool supports_fill_patterns() const { return true; }

    // Template catalog queries
    virtual bool has_block(const std::string& name) const = 0;
    virtual std::optional<BlockExtent> get_block_bounding_box(const std::string& name) const = 0;

    /**
     * @brief Layer and color of the first entity of a block definition
     */
    virtual std::optional<EntityAttributes> block_properties(const std::string& name) const = 0;

    virtual std::optional<LayerAttributes> layer_exists(const std::string& name) const = 0;
};

} // namespace survey
