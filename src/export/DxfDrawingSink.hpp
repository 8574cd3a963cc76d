/**
 * @file DxfDrawingSink.hpp
 * @brief DXF output through the GDAL/OGR DXF driver
 *
 * The output drawing is created from a template DXF (HEADER creation option)
 * so the template's block definitions, layers and styles carry over. The
 * block catalog is read once from the template's "blocks" layer.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "DrawingSink.hpp"
#include "../core/Logger.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

class GDALDataset;
class OGRLayer;
class OGRFeature;
class OGRGeometry;

namespace survey {

/**
 * @brief Drawing sink writing a DXF file
 *
 * Points are written as POINT, polylines as (LW)POLYLINE with consecutive
 * duplicate vertices within vertex_tolerance removed, faces as closed 3D
 * polylines, text through an OGR LABEL style, area fills through a BRUSH
 * style (HATCH), and block references as INSERT via the BlockName,
 * BlockAngle and BlockScale fields.
 */
class DxfDrawingSink : public DrawingSink {
public:
    struct Options {
        std::optional<std::string> template_path;   ///< Template DXF with blocks and layers
        std::vector<LayerAttributes> layers;        ///< Layers known to exist in the template
        double vertex_tolerance = 0.001;            ///< Consecutive duplicate vertex distance
        std::string text_font = "Simplex";

        Options();
    };

    explicit DxfDrawingSink(const Options& options = Options());
    ~DxfDrawingSink() override;

    DxfDrawingSink(const DxfDrawingSink&) = delete;
    DxfDrawingSink& operator=(const DxfDrawingSink&) = delete;

    /**
     * @brief Create the output file and load the template block catalog
     * @return false if the driver, template or output cannot be opened
     */
    bool open(const std::string& output_path);

    /**
     * @brief Flush and close the output file
     * @return false if the file was never opened
     */
    bool close();

    bool is_open() const { return dataset_ != nullptr; }

    /**
     * @brief Number of entities OGR refused to write
     */
    size_t write_failures() const { return write_failures_; }

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
    bool supports_fill_patterns() const override { return false; }

    bool has_block(const std::string& name) const override;
    std::optional<BlockExtent> get_block_bounding_box(const std::string& name) const override;
    std::optional<EntityAttributes> block_properties(const std::string& name) const override;
    std::optional<LayerAttributes> layer_exists(const std::string& name) const override;

    // ACI color helpers (standard AutoCAD palette, 250-255 greys)
    static std::string aci_to_hex(int aci);
    static int hex_to_aci(const std::string& hex);

    /**
     * @brief Drop consecutive vertices closer than tolerance (XY)
     */
    static std::vector<Point3D> remove_duplicate_vertices(const std::vector<Point3D>& points, double tolerance);

private:
    struct BlockInfo {
        double min_x = 0.0, min_y = 0.0, max_x = 0.0, max_y = 0.0;
        bool has_extent = false;
        std::optional<EntityAttributes> first_entity;
    };

    Options options_;
    GDALDataset* dataset_ = nullptr;
    OGRLayer* layer_ = nullptr;
    std::map<std::string, BlockInfo> block_catalog_;
    std::map<std::string, LayerAttributes> layer_catalog_;
    size_t write_failures_ = 0;
    Logger logger_;

    bool load_template_blocks(const std::string& template_path);

    /**
     * @brief New feature on the output layer with its drawing layer set
     */
    OGRFeature* create_feature(const EntityAttributes& attributes) const;

    /**
     * @brief Attach geometry and style, write, and release both
     */
    bool commit_feature(OGRFeature* feature, OGRGeometry* geometry, const std::string& style,
                        const std::string& description);

    std::string pen_style(int aci) const;
};

inline DxfDrawingSink::Options::Options() = default;

} // namespace survey
