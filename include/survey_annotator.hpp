#pragma once

/**
 * @file survey_annotator.hpp
 * @brief Main header for the survey annotation engine
 *
 * Turns a table of surveyed 3D points into annotated drawing geometry:
 * a triangulated terrain surface, contour polylines, structural breaklines
 * and symbolic block placements inferred from point codes.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <algorithm>
#include <memory>
#include <utility>
#include <vector>
#include <string>
#include <map>
#include <array>
#include <optional>
#include <variant>
#include <chrono>
#include <cstdint>
#include <cmath>

namespace survey {

class DrawingSink;

// ============================================================================
// Geometry Types
// ============================================================================

/**
 * @brief 3D point with x, y, z coordinates
 */
struct Point3D {
    double x_, y_, z_;

    Point3D() : x_(0), y_(0), z_(0) {}
    Point3D(double x, double y, double z) : x_(x), y_(y), z_(z) {}

    double x() const { return x_; }
    double y() const { return y_; }
    double z() const { return z_; }

    bool operator==(const Point3D& other) const {
        return x_ == other.x_ && y_ == other.y_ && z_ == other.z_;
    }
};

/**
 * @brief Planar distance between two points (Z ignored)
 */
inline double distance_2d(const Point3D& a, const Point3D& b) {
    return std::hypot(a.x() - b.x(), a.y() - b.y());
}

using VertexId = std::uint32_t;

/**
 * @brief Triangle defined by three vertex indices
 */
struct Triangle {
    std::array<VertexId, 3> vertices;

    Triangle() : vertices{0, 0, 0} {}
    Triangle(VertexId v0, VertexId v1, VertexId v2) : vertices{v0, v1, v2} {}

    bool operator==(const Triangle& other) const { return vertices == other.vertices; }
    bool operator<(const Triangle& other) const { return vertices < other.vertices; }
};

/**
 * @brief Axis-aligned planar bounds
 */
struct BoundingBox {
    double min_x, min_y, max_x, max_y;

    BoundingBox() : min_x(0.0), min_y(0.0), max_x(0.0), max_y(0.0) {}
    BoundingBox(double minx, double miny, double maxx, double maxy)
        : min_x(minx), min_y(miny), max_x(maxx), max_y(maxy) {}

    double width() const { return max_x - min_x; }
    double height() const { return max_y - min_y; }
    double area() const { return width() * height(); }
};

/**
 * @brief Planar bounds of a point set (all zero when empty)
 */
inline BoundingBox compute_bounding_box(const std::vector<Point3D>& points) {
    if (points.empty()) {
        return BoundingBox();
    }

    BoundingBox bbox(points.front().x(), points.front().y(), points.front().x(), points.front().y());
    for (const auto& point : points) {
        bbox.min_x = std::min(bbox.min_x, point.x());
        bbox.min_y = std::min(bbox.min_y, point.y());
        bbox.max_x = std::max(bbox.max_x, point.x());
        bbox.max_y = std::max(bbox.max_y, point.y());
    }
    return bbox;
}

// ============================================================================
// Survey Data
// ============================================================================

/**
 * @brief One row of the cleaned point table
 *
 * Identity is the point id; row_index preserves the original row order,
 * which drives every "first occurrence" decision downstream.
 */
struct SurveyPoint {
    std::string id;
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
    std::string code;
    std::string comment;
    std::size_t row_index = 0;

    Point3D position() const { return Point3D(x, y, z); }
};

/**
 * @brief Ordered chain of points sharing one coded group (e.g. "gaz1")
 */
struct Breakline {
    std::string code;                 ///< Full lowercase group code
    std::string prefix;               ///< Letter prefix of the code
    std::vector<Point3D> points;
    std::vector<std::string> comments; ///< Comment of each ordered point
};

/**
 * @brief Drawing attributes of an emitted entity
 *
 * Color is an AutoCAD Color Index (1-255, 7 = white/black, 256 = ByLayer).
 */
struct EntityAttributes {
    std::string layer = "0";
    int color = 7;

    EntityAttributes() = default;
    EntityAttributes(std::string layer_name, int aci) : layer(std::move(layer_name)), color(aci) {}
};

/**
 * @brief A placed block instance handed to the drawing sink
 */
struct BlockPlacement {
    std::string block_name;
    Point3D position;
    std::array<double, 3> scale{1.0, 1.0, 1.0};
    double rotation_deg = 0.0;
    EntityAttributes attributes;
};

/**
 * @brief A single-line text annotation
 */
struct TextAnnotation {
    std::string text;
    Point3D position;
    double height = 0.5;
    double rotation_deg = 0.0;
    EntityAttributes attributes;
};

// ============================================================================
// Scale Resolution
// ============================================================================

/**
 * @brief Breakpoint of a height-dependent scale: applies from min_height upward
 */
struct ScaleBreakpoint {
    double min_height = 0.0;
    double scale = 1.0;
};

struct ConstantScale {
    double value = 1.0;
};

struct HeightPiecewiseScale {
    std::vector<ScaleBreakpoint> breakpoints;
};

/**
 * @brief Block scale as a constant or as a function of point height
 */
using ScaleResolver = std::variant<ConstantScale, HeightPiecewiseScale>;

/**
 * @brief Evaluate a scale resolver at the given height
 *
 * Piecewise breakpoints are evaluated in ascending height order: the scale of
 * the last breakpoint whose min_height <= height applies, heights below the
 * first breakpoint use the first scale, and an empty table yields 1.0.
 */
double resolve_scale(const ScaleResolver& resolver, double height);

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Triangulated surface and contour settings
 */
struct TinSettings {
    bool enabled = false;
    bool refine = false;
    bool contours = true;
    std::optional<int> scale;                   ///< Nominal map scale; derived from scale_factor when unset
    std::vector<std::string> codes;             ///< Code filter (empty = all points)
    double max_edge_length = 100.0;
    double dedup_tolerance = 0.01;              ///< Breakline vertex merge tolerance (XY)
    double contour_interval = 1.0;              ///< One of 0.5, 1, 2, 5
    std::map<int, double> refine_distance_by_scale{
        {500, 15.0}, {1000, 20.0}, {2000, 35.0}, {5000, 60.0}};

    std::string point_layer = "1 Отметки и точки реального рельефа";
    std::string surface_layer = "1 реальная поверхность";
    std::string refined_surface_layer = "2 отредактированная поверхность";
    std::string refined_point_layer = "2 пикеты добавленные";
    std::string contour_layer = "Горизонтали";
    int surface_color = 3;                      ///< Green
    int refined_color = 1;                      ///< Red
    int contour_color = 7;
};

/**
 * @brief Static code-to-block mapping entry
 */
struct BlockMappingEntry {
    std::string name;                           ///< Human-readable entry name
    std::string block;                          ///< Block name in the template
    std::vector<std::string> codes;
    ScaleResolver scale = ConstantScale{1.0};
};

/**
 * @brief Line-support (pole) orientation settings
 */
struct LineSupportConfig {
    std::vector<std::string> codes{"vl", "вл", "vlgb"};
    std::vector<std::string> bracing_codes{"оп", "op", "vlpodp"};
    std::array<std::string, 3> blocks{"115-9", "115-10", "115-10-2"}; ///< By bracing count 0/1/2
    ScaleResolver scale = ConstantScale{1.0};
    double distance_threshold = 5.0;
};

/**
 * @brief Tower quadrilateral reconstruction settings
 */
struct TowerConfig {
    std::vector<std::string> codes{"tower", "вышка"};
    std::vector<std::string> prefixes{"tower", "вышка"};
    int group_size = 4;
    int min_points = 3;
    double right_angle_tolerance = 0.05;
    double max_span = 25.0;
    std::string block_name = "Tower";
    std::string layer = "Tower";
    std::optional<int> color;
    double base_width = 1.0;
    double base_height = 1.0;
    double zscale = 1.0;
    double min_scale = 0.01;
};

/**
 * @brief Vegetation area settings
 */
struct VegetationConfig {
    std::vector<std::string> prefixes{"les", "лес", "kust", "куст", "trava", "трава", "bol", "болото"};
    std::vector<std::string> forest_markers{"les", "лес"};
    std::vector<std::string> shrub_markers{"kust", "куст"};
    std::string default_layer = "(026) Растительность";
    std::string forest_block = "368";
    double min_distance = 10.0;
    int max_attempts = 2000;
    double close_tolerance = 0.1;
    std::string shrub_pattern = "ANSI37";
    double shrub_pattern_scale = 0.5;           ///< Multiplied by scale_factor
};

/**
 * @brief Point marker and label settings
 */
struct LabelConfig {
    bool show_points = true;
    bool show_codes = true;
    bool show_elevations = true;
    bool show_comments = true;
    double text_height = 0.5;
    int numbers_color = 10;
    int codes_color = 200;
    int elevations_color = 34;
    int comments_color = 250;
    std::vector<std::string> numbered_codes{"zadv", "zad", "задв", "зад"};
    double numbered_offset = 1.5;               ///< Multiplied by scale_factor
    double line_label_height = 1.6;             ///< Multiplied by scale_factor
    double line_label_offset = 1.0;             ///< Multiplied by scale_factor
};

/**
 * @brief Immutable configuration threaded through one generation run
 */
struct AnnotationConfig {
    double scale_factor = 1.0;
    std::uint32_t random_seed = 0;
    bool layer_separation = true;

    bool show_blocks = true;
    bool show_polylines = true;
    bool show_towers = true;

    std::vector<std::string> polyline_prefixes{
        "k", "gaz", "kabsv", "neft", "tr", "elkab", "voda", "zab", "brv", "brn", "pod", "votk", "notk"};
    std::map<std::string, std::string> polyline_layers{
        {"gaz", "(036) Газопроводы"},
        {"neft", "(014) Нефтепроводы магистральные"},
        {"voda", "(017) ВодоснаБжение"}};
    std::string default_polyline_layer = "Polylines";
    std::string default_block_layer = "Blocks";

    TinSettings tin;
    LabelConfig labels;
    std::vector<BlockMappingEntry> block_mapping = default_block_mapping();
    LineSupportConfig line_support;
    TowerConfig tower;
    VegetationConfig vegetation;

    /**
     * @brief Scale factor as used by every stage (never below 0.05)
     */
    double effective_scale_factor() const { return std::max(scale_factor, 0.05); }

    /**
     * @brief Nominal map scale used for refinement threshold lookup
     */
    int effective_tin_scale() const;

    static std::vector<BlockMappingEntry> default_block_mapping();
};

// ============================================================================
// Results
// ============================================================================

/**
 * @brief Categories of skipped work
 */
enum class SkipCategory {
    INPUT,      ///< Malformed input rows
    GEOMETRY,   ///< Degenerate triangles, towers, contour levels
    TEMPLATE    ///< Blocks missing from the drawing template
};

/**
 * @brief Outcome of one generation run
 */
struct GenerationSummary {
    size_t input_points = 0;
    size_t breaklines = 0;
    size_t base_points = 0;
    size_t base_triangles = 0;
    size_t refined_points = 0;
    size_t refined_triangles = 0;
    size_t contour_levels = 0;
    size_t contour_polylines = 0;

    size_t static_blocks = 0;
    size_t support_blocks = 0;
    size_t tower_blocks = 0;
    size_t vegetation_blocks = 0;
    size_t vegetation_areas = 0;
    size_t labels = 0;
    size_t pattern_fills_as_solid = 0;          ///< Hatch patterns the sink could only write solid

    size_t skipped_input = 0;
    size_t skipped_geometry = 0;
    size_t skipped_template = 0;

    std::vector<std::string> warnings;
    std::chrono::milliseconds total_time{0};

    static constexpr size_t max_warnings = 200;

    /**
     * @brief Count skipped features and keep the message (up to max_warnings)
     */
    void record_skip(SkipCategory category, const std::string& message, size_t count = 1);

    /**
     * @brief Keep a message for output that was written in degraded form
     */
    void record_warning(const std::string& message);
    size_t total_skipped() const { return skipped_input + skipped_geometry + skipped_template; }
};

/**
 * @brief Main interface for survey annotation
 *
 * Runs the whole pipeline (point labels, blocks, breaklines, vegetation,
 * surface, refinement, contours, towers) against one drawing sink.
 */
class SurveyAnnotator {
public:
    explicit SurveyAnnotator(const AnnotationConfig& config);
    ~SurveyAnnotator();

    /**
     * @brief Run the pipeline; never throws for per-feature defects
     */
    GenerationSummary generate(const std::vector<SurveyPoint>& points, DrawingSink& sink);

    const AnnotationConfig& get_config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace survey
