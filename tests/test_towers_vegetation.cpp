/**
 * @file test_towers_vegetation.cpp
 * @brief Tests for tower footprints and vegetation areas
 */

#include <gtest/gtest.h>
#include "core/TowerPlacer.hpp"
#include "core/VegetationPlacer.hpp"
#include "export/MemoryDrawingSink.hpp"

using namespace survey;

namespace {

SurveyPoint coded_point(double x, double y, double z, const std::string& code) {
    static size_t row = 0;
    SurveyPoint point;
    point.id = std::to_string(row + 1);
    point.x = x;
    point.y = y;
    point.z = z;
    point.code = code;
    point.row_index = row++;
    return point;
}

std::vector<SurveyPoint> square_outline(const std::string& code, double size) {
    return {
        coded_point(0, 0, 10, code),
        coded_point(size, 0, 12, code),
        coded_point(size, size, 14, code),
        coded_point(0, size, 12, code),
    };
}

} // namespace

// ============================================================================
// Towers
// ============================================================================

TEST(TowerPlacerTest, CompletesRightAngle) {
    auto fourth = TowerPlacer::complete_rectangle(
        {Point3D(0, 0, 0), Point3D(10, 0, 0), Point3D(10, 10, 1)}, 0.05);

    ASSERT_TRUE(fourth.has_value());
    EXPECT_DOUBLE_EQ(fourth->x(), 0.0);
    EXPECT_DOUBLE_EQ(fourth->y(), 10.0);
    EXPECT_DOUBLE_EQ(fourth->z(), 1.0 / 3.0);
}

TEST(TowerPlacerTest, RejectsCornersWithoutRightAngle) {
    auto fourth = TowerPlacer::complete_rectangle(
        {Point3D(0, 0, 0), Point3D(10, 0, 0), Point3D(5, 3, 0)}, 0.05);
    EXPECT_FALSE(fourth.has_value());
    EXPECT_FALSE(TowerPlacer::complete_rectangle({Point3D(0, 0, 0), Point3D(1, 0, 0)}, 0.05).has_value());
}

TEST(TowerPlacerTest, GroupsByExactCodeThenPrefix) {
    AnnotationConfig config;
    TowerPlacer placer(config);

    std::vector<SurveyPoint> points = {
        coded_point(0, 0, 0, "tower"),
        coded_point(1, 0, 0, "Tower2"),
        coded_point(2, 0, 0, "вышка"),
        coded_point(3, 0, 0, "tower"),
        coded_point(4, 0, 0, "gaz1"),
    };

    auto groups = placer.group_points(points);
    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups[0].key, "tower");
    EXPECT_EQ(groups[0].points.size(), 3u);
    EXPECT_EQ(groups[1].key, "вышка");
}

TEST(TowerPlacerTest, PlacesFootprintFromThreeCorners) {
    AnnotationConfig config;
    MemoryDrawingSink sink;
    sink.define_block("Tower", 2.0, 2.0, EntityAttributes("Blocks", 4));

    std::vector<SurveyPoint> points = {
        coded_point(0, 0, 0, "tower"),
        coded_point(10, 0, 0, "tower"),
        coded_point(10, 10, 1, "tower"),
    };

    TowerPlacer placer(config);
    PlacementPlan plan = placer.place(points, sink);

    ASSERT_EQ(plan.blocks.size(), 1u);
    EXPECT_TRUE(plan.geometry_defects.empty());

    const auto& block = plan.blocks[0];
    EXPECT_EQ(block.block_name, "Tower");
    EXPECT_NEAR(block.position.x(), 5.0, 1e-9);
    EXPECT_NEAR(block.position.y(), 5.0, 1e-9);
    EXPECT_NEAR(block.position.z(), (1.0 + 1.0 / 3.0) / 4.0, 1e-9);
    EXPECT_NEAR(block.rotation_deg, 0.0, 1e-9);
    EXPECT_NEAR(block.scale[0], 5.0, 1e-9);
    EXPECT_NEAR(block.scale[1], 5.0, 1e-9);
    EXPECT_DOUBLE_EQ(block.scale[2], 1.0);
    EXPECT_EQ(block.attributes.layer, "Tower");
    EXPECT_EQ(block.attributes.color, 4);
}

TEST(TowerPlacerTest, SeparatesDistantTowersAndReportsIncompleteOnes) {
    AnnotationConfig config;
    config.tower.color = 1;
    MemoryDrawingSink sink;
    sink.define_block("Tower", 1.0, 1.0);

    std::vector<SurveyPoint> points = {
        coded_point(0, 0, 0, "tower"),
        coded_point(4, 0, 0, "tower"),
        coded_point(4, 2, 0, "tower"),
        coded_point(0, 2, 0, "tower"),
        coded_point(500, 500, 0, "tower"),
        coded_point(504, 500, 0, "tower"),
    };

    TowerPlacer placer(config);
    PlacementPlan plan = placer.place(points, sink);

    ASSERT_EQ(plan.blocks.size(), 1u);
    EXPECT_NEAR(plan.blocks[0].scale[0], 4.0, 1e-9);
    EXPECT_NEAR(plan.blocks[0].scale[1], 2.0, 1e-9);
    EXPECT_EQ(plan.blocks[0].attributes.color, 1);
    EXPECT_EQ(plan.geometry_defects.size(), 1u);
}

TEST(TowerPlacerTest, MissingTemplateBlockSkipsAllTowers) {
    AnnotationConfig config;
    MemoryDrawingSink sink;

    std::vector<SurveyPoint> points = {
        coded_point(0, 0, 0, "tower"),
        coded_point(10, 0, 0, "tower"),
        coded_point(10, 10, 0, "tower"),
    };

    TowerPlacer placer(config);
    PlacementPlan plan = placer.place(points, sink);

    EXPECT_TRUE(plan.blocks.empty());
    EXPECT_EQ(plan.template_defects.size(), 1u);
}

// ============================================================================
// Vegetation
// ============================================================================

TEST(VegetationPlacerTest, PointInPolygon) {
    std::vector<Point3D> square = {Point3D(0, 0, 0), Point3D(10, 0, 0), Point3D(10, 10, 0), Point3D(0, 10, 0)};
    EXPECT_TRUE(VegetationPlacer::point_in_polygon(5, 5, square));
    EXPECT_FALSE(VegetationPlacer::point_in_polygon(15, 5, square));
    EXPECT_FALSE(VegetationPlacer::point_in_polygon(5, -1, square));
    EXPECT_FALSE(VegetationPlacer::point_in_polygon(1, 1, {Point3D(0, 0, 0), Point3D(2, 2, 0)}));
}

TEST(VegetationPlacerTest, OutlineBoundsCoverEveryVertex) {
    std::vector<Point3D> outline = {
        Point3D(-5, 2, 0), Point3D(20, -3, 0), Point3D(20, 12, 0), Point3D(4, 30, 0)
    };
    BoundingBox bounds = compute_bounding_box(outline);
    EXPECT_DOUBLE_EQ(bounds.min_x, -5.0);
    EXPECT_DOUBLE_EQ(bounds.min_y, -3.0);
    EXPECT_DOUBLE_EQ(bounds.max_x, 20.0);
    EXPECT_DOUBLE_EQ(bounds.max_y, 30.0);
    EXPECT_DOUBLE_EQ(bounds.area(), 25.0 * 33.0);
    EXPECT_DOUBLE_EQ(compute_bounding_box({}).area(), 0.0);
}

TEST(VegetationPlacerTest, ScatterStaysInsideOffsetTriangle) {
    std::vector<Point3D> triangle = {Point3D(1000, 500, 0), Point3D(1100, 500, 0), Point3D(1000, 600, 0)};
    std::mt19937 generator(3);
    auto placed = VegetationPlacer::scatter_points(triangle, 5.0, 3000, 0.0, generator);

    ASSERT_FALSE(placed.empty());
    for (const auto& point : placed) {
        EXPECT_TRUE(VegetationPlacer::point_in_polygon(point.x(), point.y(), triangle));
        EXPECT_LE(point.x() + point.y(), 1600.0 + 1e-9);
    }
}

TEST(VegetationPlacerTest, ScatterRespectsBoundaryAndSpacing) {
    std::vector<Point3D> square = {Point3D(0, 0, 0), Point3D(100, 0, 0), Point3D(100, 100, 0), Point3D(0, 100, 0)};
    std::mt19937 generator(42);
    auto placed = VegetationPlacer::scatter_points(square, 10.0, 2000, 7.0, generator);

    ASSERT_FALSE(placed.empty());
    EXPECT_LE(placed.size(), 25u);
    for (size_t i = 0; i < placed.size(); ++i) {
        EXPECT_TRUE(VegetationPlacer::point_in_polygon(placed[i].x(), placed[i].y(), square));
        EXPECT_DOUBLE_EQ(placed[i].z(), 7.0);
        for (size_t j = i + 1; j < placed.size(); ++j) {
            EXPECT_GE(distance_2d(placed[i], placed[j]), 10.0);
        }
    }
}

TEST(VegetationPlacerTest, ForestScatterIsReproducibleForASeed) {
    AnnotationConfig config;
    config.random_seed = 7;
    MemoryDrawingSink sink;
    sink.define_block("368", 1.0, 1.0);

    auto points = square_outline("les1", 60.0);

    VegetationPlacer placer(config);
    VegetationPlan first = placer.place(points, sink);
    VegetationPlan second = placer.place(points, sink);

    ASSERT_EQ(first.areas.size(), 1u);
    EXPECT_TRUE(first.areas[0].forest);
    EXPECT_FALSE(first.areas[0].fill.has_value());
    EXPECT_EQ(first.areas[0].attributes.layer, config.vegetation.default_layer);
    EXPECT_EQ(first.areas[0].boundary.size(), 4u);

    ASSERT_FALSE(first.scatter.blocks.empty());
    ASSERT_EQ(first.scatter.blocks.size(), second.scatter.blocks.size());
    for (size_t i = 0; i < first.scatter.blocks.size(); ++i) {
        EXPECT_EQ(first.scatter.blocks[i].position, second.scatter.blocks[i].position);
        EXPECT_DOUBLE_EQ(first.scatter.blocks[i].rotation_deg, second.scatter.blocks[i].rotation_deg);
        EXPECT_EQ(first.scatter.blocks[i].block_name, "368");
        EXPECT_DOUBLE_EQ(first.scatter.blocks[i].position.z(), 12.0);
    }
}

TEST(VegetationPlacerTest, ShrubsGetPatternAndGrassGetsSolidFill) {
    AnnotationConfig config;
    config.scale_factor = 2.0;
    MemoryDrawingSink sink;
    sink.define_layer(LayerAttributes{config.vegetation.default_layer, 94, "CONTINUOUS"});

    auto points = square_outline("куст1", 20.0);
    auto grass = square_outline("trava4", 20.0);
    points.insert(points.end(), grass.begin(), grass.end());

    VegetationPlacer placer(config);
    VegetationPlan plan = placer.place(points, sink);

    ASSERT_EQ(plan.areas.size(), 2u);
    EXPECT_EQ(plan.areas[0].code, "куст1");
    ASSERT_TRUE(plan.areas[0].fill.has_value());
    EXPECT_FALSE(plan.areas[0].fill->solid);
    EXPECT_EQ(plan.areas[0].fill->pattern, "ANSI37");
    EXPECT_DOUBLE_EQ(plan.areas[0].fill->scale, 1.0);
    EXPECT_EQ(plan.areas[0].attributes.color, 94);

    ASSERT_TRUE(plan.areas[1].fill.has_value());
    EXPECT_TRUE(plan.areas[1].fill->solid);
    EXPECT_TRUE(plan.scatter.blocks.empty());
}

TEST(VegetationPlacerTest, ShortOutlinesAndMissingForestBlockAreReported) {
    AnnotationConfig config;
    MemoryDrawingSink sink;

    std::vector<SurveyPoint> points = {
        coded_point(0, 0, 0, "bol1"),
        coded_point(5, 0, 0, "bol1"),
    };
    auto forest = square_outline("les2", 50.0);
    points.insert(points.end(), forest.begin(), forest.end());

    VegetationPlacer placer(config);
    VegetationPlan plan = placer.place(points, sink);

    EXPECT_EQ(plan.scatter.geometry_defects.size(), 1u);
    EXPECT_EQ(plan.scatter.template_defects.size(), 1u);
    ASSERT_EQ(plan.areas.size(), 1u);
    EXPECT_EQ(plan.areas[0].code, "les2");
    EXPECT_TRUE(plan.scatter.blocks.empty());
}
