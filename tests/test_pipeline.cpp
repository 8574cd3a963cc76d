/**
 * @file test_pipeline.cpp
 * @brief End-to-end annotation runs against the in-memory drawing sink
 */

#include <gtest/gtest.h>
#include "survey_annotator.hpp"
#include "core/PointAnnotator.hpp"
#include "export/MemoryDrawingSink.hpp"

using namespace survey;

namespace {

SurveyPoint coded_point(const std::string& id, double x, double y, double z,
                        const std::string& code, const std::string& comment = "") {
    static size_t row = 0;
    SurveyPoint point;
    point.id = id;
    point.x = x;
    point.y = y;
    point.z = z;
    point.code = code;
    point.comment = comment;
    point.row_index = row++;
    return point;
}

AnnotationConfig surface_only_config() {
    AnnotationConfig config;
    config.show_blocks = false;
    config.show_polylines = false;
    config.show_towers = false;
    config.tin.enabled = true;
    return config;
}

} // namespace

// ============================================================================
// Point Annotation
// ============================================================================

TEST(PointAnnotatorTest, LabelsAreOffsetByScaleFactor) {
    AnnotationConfig config;
    config.scale_factor = 2.0;
    PointAnnotator annotator(config);

    auto labels = annotator.labels_for(coded_point("7", 10, 20, 5.5, "kip", " note "));
    ASSERT_EQ(labels.size(), 4u);

    EXPECT_EQ(labels[0].text, "7");
    EXPECT_EQ(labels[0].attributes.layer, "Name");
    EXPECT_DOUBLE_EQ(labels[0].position.x(), 11.0);
    EXPECT_DOUBLE_EQ(labels[0].position.y(), 23.0);

    EXPECT_EQ(labels[1].text, "kip");
    EXPECT_EQ(labels[1].attributes.layer, "Codes");
    EXPECT_DOUBLE_EQ(labels[1].position.y(), 17.0);

    EXPECT_EQ(labels[2].text, "5.500");
    EXPECT_EQ(labels[2].attributes.layer, "Elevations");
    EXPECT_EQ(labels[2].attributes.color, config.labels.elevations_color);
    EXPECT_DOUBLE_EQ(labels[2].position.y(), 20.0);

    EXPECT_EQ(labels[3].text, "note");
    EXPECT_EQ(labels[3].attributes.layer, "Comments");
    EXPECT_DOUBLE_EQ(labels[3].position.y(), 14.0);
}

TEST(PointAnnotatorTest, HonoursVisibilityFlagsAndSingleLayer) {
    AnnotationConfig config;
    config.layer_separation = false;
    config.labels.show_codes = false;
    config.labels.show_points = false;
    PointAnnotator annotator(config);

    MemoryDrawingSink sink;
    auto stats = annotator.annotate({coded_point("1", 0, 0, 1, "kip", "")}, sink);

    EXPECT_EQ(stats.markers, 0u);
    EXPECT_EQ(stats.labels, 1u);
    ASSERT_EQ(sink.texts().size(), 1u);
    EXPECT_EQ(sink.texts()[0].text, "1.000");
    EXPECT_EQ(sink.texts()[0].attributes.layer, "0");
}

// ============================================================================
// Full Runs
// ============================================================================

TEST(SurveyAnnotatorTest, MissingTemplateBlockIsCountedAsTemplateSkip) {
    AnnotationConfig config;
    MemoryDrawingSink sink;
    sink.define_layer(LayerAttributes{"(036) Газопроводы", 30, "CONTINUOUS"});

    std::vector<SurveyPoint> points = {
        coded_point("1", 0, 0, 100, "kip"),
        coded_point("2", 10, 0, 101, "gaz1"),
        coded_point("3", 20, 0, 102, "gaz1", "d100"),
    };

    SurveyAnnotator annotator(config);
    GenerationSummary summary = annotator.generate(points, sink);

    EXPECT_EQ(summary.input_points, 3u);
    EXPECT_EQ(summary.static_blocks, 0u);
    EXPECT_EQ(summary.skipped_template, 1u);
    EXPECT_EQ(summary.skipped_geometry, 0u);
    EXPECT_EQ(summary.total_skipped(), 1u);
    EXPECT_EQ(summary.warnings.size(), 1u);
    EXPECT_TRUE(sink.blocks().empty());

    // Nine fixed labels plus one comment; the segment starting at point 2 has no comment
    EXPECT_EQ(summary.labels, 10u);
    EXPECT_EQ(sink.points().size(), 3u);

    EXPECT_EQ(summary.breaklines, 1u);
    ASSERT_EQ(sink.polylines().size(), 1u);
    const auto& polyline = sink.polylines()[0];
    EXPECT_EQ(polyline.attributes.layer, "(036) Газопроводы");
    EXPECT_EQ(polyline.attributes.color, 30);
    EXPECT_FALSE(polyline.three_d);
    EXPECT_FALSE(polyline.closed);
    EXPECT_EQ(polyline.points.size(), 2u);
}

TEST(SurveyAnnotatorTest, DefinedBlocksArePlaced) {
    AnnotationConfig config;
    config.labels.show_points = false;
    config.labels.show_codes = false;
    config.labels.show_elevations = false;

    MemoryDrawingSink sink;
    sink.define_block("129-1", 1.0, 1.0, EntityAttributes("(040) KIP", 5));
    sink.define_block("115-10", 1.0, 1.0);
    sink.define_block("Tower", 2.0, 2.0);

    std::vector<SurveyPoint> points = {
        coded_point("1", 0, 0, 100, "kip"),
        coded_point("2", 50, 50, 100, "vl"),
        coded_point("3", 52, 50, 100, "op"),
        coded_point("4", 200, 200, 90, "tower"),
        coded_point("5", 210, 200, 90, "tower"),
        coded_point("6", 210, 210, 90, "tower"),
        coded_point("7", 200, 210, 90, "tower"),
    };

    SurveyAnnotator annotator(config);
    GenerationSummary summary = annotator.generate(points, sink);

    EXPECT_EQ(summary.static_blocks, 1u);
    EXPECT_EQ(summary.support_blocks, 1u);
    EXPECT_EQ(summary.tower_blocks, 1u);
    EXPECT_EQ(summary.total_skipped(), 0u);
    EXPECT_EQ(summary.labels, 0u);
    ASSERT_EQ(sink.blocks().size(), 3u);
    EXPECT_EQ(sink.count_on_layer("(040) KIP"), 1u);
    EXPECT_EQ(sink.count_on_layer("Tower"), 1u);
}

TEST(SurveyAnnotatorTest, BuildsSurfaceAndContours) {
    AnnotationConfig config = surface_only_config();
    MemoryDrawingSink sink;

    std::vector<SurveyPoint> points = {
        coded_point("1", 0, 0, 100, "rel"),
        coded_point("2", 10, 0, 100, "rel"),
        coded_point("3", 10, 10, 100, "rel"),
        coded_point("4", 0, 10, 100, "rel"),
        coded_point("5", 5, 5, 102, "rel"),
    };

    SurveyAnnotator annotator(config);
    GenerationSummary summary = annotator.generate(points, sink);

    EXPECT_EQ(summary.base_points, 5u);
    EXPECT_EQ(summary.base_triangles, 4u);
    EXPECT_EQ(sink.faces().size(), 4u);
    EXPECT_EQ(sink.count_on_layer(config.tin.point_layer), 5u);
    EXPECT_EQ(sink.count_on_layer(config.tin.surface_layer), 4u);

    // Levels 100 and 101 are rings; 102 only touches the apex
    EXPECT_EQ(summary.contour_levels, 2u);
    EXPECT_EQ(summary.contour_polylines, 2u);
    EXPECT_EQ(sink.count_on_layer(config.tin.contour_layer), 2u);
    for (const auto& polyline : sink.polylines()) {
        if (polyline.attributes.layer == config.tin.contour_layer) {
            EXPECT_TRUE(polyline.closed);
            EXPECT_TRUE(polyline.three_d);
        }
    }
    EXPECT_EQ(summary.refined_points, 0u);
}

TEST(SurveyAnnotatorTest, RefinementEmitsAddedPointsOnTheirOwnLayer) {
    AnnotationConfig config = surface_only_config();
    config.tin.refine = true;
    config.tin.scale = 1000;
    config.tin.max_edge_length = 200.0;
    config.tin.contours = false;
    MemoryDrawingSink sink;

    std::vector<SurveyPoint> points = {
        coded_point("1", 0, 0, 10, "rel"),
        coded_point("2", 100, 0, 12, "rel"),
        coded_point("3", 100, 100, 14, "rel"),
        coded_point("4", 0, 100, 12, "rel"),
    };

    SurveyAnnotator annotator(config);
    GenerationSummary summary = annotator.generate(points, sink);

    EXPECT_EQ(summary.base_triangles, 2u);
    EXPECT_EQ(summary.refined_points, 2u);
    EXPECT_GT(summary.refined_triangles, summary.base_triangles);
    EXPECT_EQ(sink.count_on_layer(config.tin.refined_point_layer), 2u);
    EXPECT_EQ(sink.count_on_layer(config.tin.refined_surface_layer), summary.refined_triangles);
    EXPECT_EQ(summary.contour_levels, 0u);
}

TEST(SurveyAnnotatorTest, UntriangulableSurfaceIsSkipped) {
    AnnotationConfig config = surface_only_config();
    MemoryDrawingSink sink;

    std::vector<SurveyPoint> points = {
        coded_point("1", 0, 0, 10, "rel"),
        coded_point("2", 1, 1, 10, "rel"),
    };

    SurveyAnnotator annotator(config);
    GenerationSummary summary = annotator.generate(points, sink);

    EXPECT_EQ(summary.base_triangles, 0u);
    EXPECT_EQ(summary.skipped_geometry, 1u);
    EXPECT_TRUE(sink.faces().empty());
}

TEST(SurveyAnnotatorTest, OversizedHeightRangeSkipsContours) {
    AnnotationConfig config = surface_only_config();
    MemoryDrawingSink sink;

    std::vector<SurveyPoint> points = {
        coded_point("1", 0, 0, 0, "rel"),
        coded_point("2", 10, 0, 0, "rel"),
        coded_point("3", 0, 10, 1.0e7, "rel"),
    };

    SurveyAnnotator annotator(config);
    GenerationSummary summary = annotator.generate(points, sink);

    EXPECT_EQ(summary.base_triangles, 1u);
    EXPECT_EQ(summary.contour_levels, 0u);
    EXPECT_EQ(summary.skipped_geometry, 1u);
    EXPECT_EQ(sink.count_on_layer(config.tin.contour_layer), 0u);
}

TEST(SurveyAnnotatorTest, PatternFillsWrittenSolidAreReported) {
    AnnotationConfig config;
    config.show_blocks = false;
    config.show_towers = false;
    config.labels.show_points = false;
    config.labels.show_codes = false;
    config.labels.show_elevations = false;

    std::vector<SurveyPoint> points = {
        coded_point("1", 0, 0, 10, "куст1"),
        coded_point("2", 20, 0, 10, "куст1"),
        coded_point("3", 20, 20, 10, "куст1"),
        coded_point("4", 0, 20, 10, "куст1"),
    };

    MemoryDrawingSink patterned;
    SurveyAnnotator annotator(config);
    GenerationSummary full = annotator.generate(points, patterned);
    EXPECT_EQ(full.vegetation_areas, 1u);
    EXPECT_EQ(full.pattern_fills_as_solid, 0u);
    ASSERT_EQ(patterned.fills().size(), 1u);
    EXPECT_FALSE(patterned.fills()[0].style.solid);

    MemoryDrawingSink solid_only;
    solid_only.set_fill_patterns_supported(false);
    GenerationSummary degraded = annotator.generate(points, solid_only);
    EXPECT_EQ(degraded.pattern_fills_as_solid, 1u);
    EXPECT_EQ(degraded.total_skipped(), 0u);
    ASSERT_EQ(degraded.warnings.size(), 1u);
    EXPECT_NE(degraded.warnings[0].find("ANSI37"), std::string::npos);
    ASSERT_EQ(solid_only.fills().size(), 1u);
    EXPECT_TRUE(solid_only.fills()[0].style.solid);
}

TEST(GenerationSummaryTest, WarningsAreCapped) {
    GenerationSummary summary;
    for (size_t i = 0; i < GenerationSummary::max_warnings + 10; ++i) {
        summary.record_skip(SkipCategory::INPUT, "row " + std::to_string(i));
    }
    summary.record_skip(SkipCategory::GEOMETRY, "bulk", 5);

    EXPECT_EQ(summary.skipped_input, GenerationSummary::max_warnings + 10);
    EXPECT_EQ(summary.skipped_geometry, 5u);
    EXPECT_EQ(summary.warnings.size(), GenerationSummary::max_warnings);
}
