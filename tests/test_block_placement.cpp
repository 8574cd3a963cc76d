/**
 * @file test_block_placement.cpp
 * @brief Tests for scale resolution, clustering, static lookup and line supports
 */

#include <gtest/gtest.h>
#include "core/StaticBlockPlacer.hpp"
#include "core/LineSupportPlacer.hpp"
#include "core/PointClustering.hpp"
#include "export/MemoryDrawingSink.hpp"
#include <cmath>

using namespace survey;

namespace {

SurveyPoint coded_point(const std::string& id, double x, double y, double z,
                        const std::string& code, const std::string& comment = "") {
    SurveyPoint point;
    point.id = id;
    point.x = x;
    point.y = y;
    point.z = z;
    point.code = code;
    point.comment = comment;
    return point;
}

} // namespace

// ============================================================================
// Scale Resolution
// ============================================================================

TEST(ScaleResolverTest, ConstantScaleIgnoresHeight) {
    ScaleResolver resolver = ConstantScale{2.5};
    EXPECT_DOUBLE_EQ(resolve_scale(resolver, -100.0), 2.5);
    EXPECT_DOUBLE_EQ(resolve_scale(resolver, 1000.0), 2.5);
}

TEST(ScaleResolverTest, PiecewiseUsesLastBreakpointAtOrBelowHeight) {
    HeightPiecewiseScale piecewise;
    piecewise.breakpoints = {{0.0, 1.0}, {100.0, 2.0}, {50.0, 1.5}};
    ScaleResolver resolver = piecewise;

    EXPECT_DOUBLE_EQ(resolve_scale(resolver, 75.0), 1.5);
    EXPECT_DOUBLE_EQ(resolve_scale(resolver, 50.0), 1.5);
    EXPECT_DOUBLE_EQ(resolve_scale(resolver, 150.0), 2.0);
    EXPECT_DOUBLE_EQ(resolve_scale(resolver, -5.0), 1.0);
}

TEST(ScaleResolverTest, EmptyTableGivesUnitScale) {
    ScaleResolver resolver = HeightPiecewiseScale{};
    EXPECT_DOUBLE_EQ(resolve_scale(resolver, 12.0), 1.0);
}

// ============================================================================
// Clustering
// ============================================================================

TEST(PointClusteringTest, ThresholdIsInclusive) {
    std::vector<Point3D> points = {Point3D(0, 0, 0), Point3D(5, 0, 0), Point3D(10.001, 0, 0)};
    auto clusters = cluster_by_distance(points, 5.0);
    ASSERT_EQ(clusters.size(), 2u);
    EXPECT_EQ(clusters[0], (std::vector<size_t>{0, 1}));
    EXPECT_EQ(clusters[1], (std::vector<size_t>{2}));
}

TEST(PointClusteringTest, ComponentsAreTransitive) {
    std::vector<Point3D> points = {
        Point3D(10, 0, 0), Point3D(100, 100, 0), Point3D(0, 0, 0), Point3D(5, 0, 0)
    };
    auto clusters = cluster_by_distance(points, 5.0);
    ASSERT_EQ(clusters.size(), 2u);
    EXPECT_EQ(clusters[0], (std::vector<size_t>{0, 2, 3}));
    EXPECT_EQ(clusters[1], (std::vector<size_t>{1}));
}

// ============================================================================
// Static Lookup
// ============================================================================

TEST(StaticBlockPlacerTest, FirstMatchingEntryWins) {
    AnnotationConfig config;
    config.block_mapping = {
        {"Empty", "", {"kip"}},
        {"First", "A", {"kip", "est"}},
        {"Second", "B", {"kip"}},
    };
    StaticBlockPlacer placer(config);

    const BlockMappingEntry* entry = placer.find_entry("kip");
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->block, "A");
    EXPECT_EQ(placer.find_entry("nothing"), nullptr);
}

TEST(StaticBlockPlacerTest, PlacesMappedPointsWithScaleAndAttributes) {
    AnnotationConfig config;
    config.scale_factor = 2.0;
    config.block_mapping = {{"KIP", "129-1", {"kip", "кип"}, ConstantScale{1.5}}};

    MemoryDrawingSink sink;
    sink.define_block("129-1", 1.0, 1.0, EntityAttributes("(040) KIP", 5));

    std::vector<SurveyPoint> points = {
        coded_point("1", 10, 20, 100, " KIP "),
        coded_point("2", 11, 21, 101, "кип"),
        coded_point("3", 12, 22, 102, "unknown"),
        coded_point("4", 13, 23, 103, "vl"),
    };

    StaticBlockPlacer placer(config);
    PlacementPlan plan = placer.place(points, sink);

    ASSERT_EQ(plan.blocks.size(), 2u);
    EXPECT_EQ(plan.blocks[0].block_name, "129-1");
    EXPECT_DOUBLE_EQ(plan.blocks[0].position.x(), 10.0);
    EXPECT_DOUBLE_EQ(plan.blocks[0].position.z(), 100.0);
    EXPECT_DOUBLE_EQ(plan.blocks[0].scale[0], 3.0);
    EXPECT_DOUBLE_EQ(plan.blocks[0].rotation_deg, 0.0);
    EXPECT_EQ(plan.blocks[0].attributes.layer, "(040) KIP");
    EXPECT_EQ(plan.blocks[0].attributes.color, 5);
    EXPECT_TRUE(plan.labels.empty());
}

TEST(StaticBlockPlacerTest, UndefinedTemplateBlocksFallBackToDefaultLayer) {
    AnnotationConfig config;
    MemoryDrawingSink sink;

    std::vector<SurveyPoint> points = {coded_point("1", 0, 0, 0, "kip")};
    StaticBlockPlacer placer(config);
    PlacementPlan plan = placer.place(points, sink);

    ASSERT_EQ(plan.blocks.size(), 1u);
    EXPECT_EQ(plan.blocks[0].attributes.layer, config.default_block_layer);
    EXPECT_EQ(plan.blocks[0].attributes.color, 7);

    config.layer_separation = false;
    StaticBlockPlacer single_layer(config);
    EXPECT_EQ(single_layer.place(points, sink).blocks[0].attributes.layer, "0");
}

TEST(StaticBlockPlacerTest, NumberedCodesGetCommentLabel) {
    AnnotationConfig config;
    config.scale_factor = 2.0;
    MemoryDrawingSink sink;

    std::vector<SurveyPoint> points = {
        coded_point("1", 10, 20, 5, "zadv", " 12 "),
        coded_point("2", 30, 40, 5, "zadv", ""),
    };

    StaticBlockPlacer placer(config);
    PlacementPlan plan = placer.place(points, sink);

    ASSERT_EQ(plan.blocks.size(), 2u);
    EXPECT_EQ(plan.blocks[0].block_name, "26l");
    ASSERT_EQ(plan.labels.size(), 1u);
    EXPECT_EQ(plan.labels[0].text, "№12");
    EXPECT_DOUBLE_EQ(plan.labels[0].position.x(), 13.0);
    EXPECT_DOUBLE_EQ(plan.labels[0].position.y(), 20.0);
}

// ============================================================================
// Line Supports
// ============================================================================

TEST(LineSupportPlacerTest, NoBracingUsesBaseBlockUnrotated) {
    AnnotationConfig config;
    MemoryDrawingSink sink;
    std::vector<SurveyPoint> points = {
        coded_point("1", 0, 0, 0, "vl"),
        coded_point("2", 5.5, 0, 0, "op"),
    };

    LineSupportPlacer placer(config);
    PlacementPlan plan = placer.place(points, sink);

    ASSERT_EQ(plan.blocks.size(), 1u);
    EXPECT_EQ(plan.blocks[0].block_name, "115-9");
    EXPECT_DOUBLE_EQ(plan.blocks[0].rotation_deg, 0.0);
}

TEST(LineSupportPlacerTest, SingleBracingPointsTheSupport) {
    AnnotationConfig config;
    MemoryDrawingSink sink;
    std::vector<SurveyPoint> points = {
        coded_point("1", 0, 0, 0, "ВЛ"),
        coded_point("2", 0, 5, 0, "оп"),
    };

    LineSupportPlacer placer(config);
    PlacementPlan plan = placer.place(points, sink);

    ASSERT_EQ(plan.blocks.size(), 1u);
    EXPECT_EQ(plan.blocks[0].block_name, "115-10");
    EXPECT_NEAR(plan.blocks[0].rotation_deg, 90.0, 1e-9);
}

TEST(LineSupportPlacerTest, TwoNearestBracingPointsAreAveraged) {
    AnnotationConfig config;
    MemoryDrawingSink sink;
    std::vector<SurveyPoint> points = {
        coded_point("1", 0, 0, 0, "vl"),
        coded_point("2", 2, 0, 0, "op"),
        coded_point("3", 4, 0.5, 0, "vlpodp"),
        coded_point("4", 3 * std::cos(M_PI / 3), 3 * std::sin(M_PI / 3), 0, "op"),
    };

    LineSupportPlacer placer(config);
    auto candidates = placer.find_bracing(points, 0);
    ASSERT_EQ(candidates.size(), 3u);
    EXPECT_DOUBLE_EQ(candidates[0].distance, 2.0);
    EXPECT_NEAR(candidates[1].bearing_deg, 60.0, 1e-9);

    PlacementPlan plan = placer.place(points, sink);
    ASSERT_EQ(plan.blocks.size(), 1u);
    EXPECT_EQ(plan.blocks[0].block_name, "115-10-2");
    EXPECT_NEAR(plan.blocks[0].rotation_deg, 30.0, 1e-9);
}

TEST(LineSupportPlacerTest, ThresholdIsInclusive) {
    AnnotationConfig config;
    std::vector<SurveyPoint> points = {
        coded_point("1", 0, 0, 0, "vl"),
        coded_point("2", 3, 4, 0, "op"),
    };

    LineSupportPlacer placer(config);
    EXPECT_EQ(placer.find_bracing(points, 0).size(), 1u);
    EXPECT_DOUBLE_EQ(LineSupportPlacer::support_rotation({}), 0.0);
}

TEST(LineSupportPlacerTest, BearingsThirtyAndOneFiftyAverageToNinety) {
    AnnotationConfig config;
    MemoryDrawingSink sink;
    const double deg = M_PI / 180.0;

    std::vector<SurveyPoint> points = {
        coded_point("1", 0, 0, 0, "vl"),
        coded_point("2", 2 * std::cos(30 * deg), 2 * std::sin(30 * deg), 0, "op"),
    };

    LineSupportPlacer placer(config);
    PlacementPlan single = placer.place(points, sink);
    ASSERT_EQ(single.blocks.size(), 1u);
    EXPECT_NEAR(single.blocks[0].rotation_deg, 30.0, 1e-9);

    points.push_back(coded_point("3", 3 * std::cos(150 * deg), 3 * std::sin(150 * deg), 0, "op"));
    PlacementPlan pair = placer.place(points, sink);
    ASSERT_EQ(pair.blocks.size(), 1u);
    EXPECT_NEAR(pair.blocks[0].rotation_deg, 90.0, 1e-9);
}
