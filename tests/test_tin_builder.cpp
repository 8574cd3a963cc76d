/**
 * @file test_tin_builder.cpp
 * @brief Tests for the Delaunay surface builder
 */

#include <gtest/gtest.h>
#include "core/TinBuilder.hpp"

using namespace survey;

namespace {

std::vector<Point3D> square_with_center() {
    return {
        Point3D(0, 0, 100.0),
        Point3D(10, 0, 101.0),
        Point3D(10, 10, 102.0),
        Point3D(0, 10, 101.0),
        Point3D(5, 5, 103.0),
    };
}

} // namespace

TEST(TinBuilderTest, TriangulatesSquareWithCenter) {
    TinBuilder builder;
    TerrainMesh mesh = builder.build(square_with_center());

    EXPECT_EQ(mesh.num_vertices(), 5u);
    EXPECT_EQ(mesh.num_triangles(), 4u);
    EXPECT_EQ(builder.get_stats().accepted_triangles, 4u);

    // Every face uses the centre vertex
    for (const auto& triangle : mesh.triangles()) {
        bool has_center = triangle.vertices[0] == 4 || triangle.vertices[1] == 4 || triangle.vertices[2] == 4;
        EXPECT_TRUE(has_center);
    }
}

TEST(TinBuilderTest, AcceptedTrianglesAreValidAndCounterClockwise) {
    std::vector<Point3D> points;
    for (int i = 0; i < 6; ++i) {
        for (int j = 0; j < 5; ++j) {
            points.emplace_back(i * 7.0 + (j % 2) * 1.3, j * 6.0 + (i % 3) * 0.7, 50.0 + i + 0.5 * j);
        }
    }

    TinBuildConfig config;
    config.max_edge_length = 12.0;
    TinBuilder builder(config);
    TerrainMesh mesh = builder.build(points);

    ASSERT_FALSE(mesh.empty());
    MeshValidationResult validation = mesh.validate(config.max_edge_length, config.area_epsilon);
    EXPECT_TRUE(validation.is_valid());
    for (const auto& triangle : mesh.triangles()) {
        const auto& a = mesh.get_vertex(triangle.vertices[0]);
        const auto& b = mesh.get_vertex(triangle.vertices[1]);
        const auto& c = mesh.get_vertex(triangle.vertices[2]);
        EXPECT_GT(signed_area_2x(a, b, c), 0.0);
        EXPECT_LE(mesh.max_edge_length(triangle), config.max_edge_length);
    }
}

TEST(TinBuilderTest, RejectsTrianglesWithLongEdges) {
    std::vector<Point3D> points = {
        Point3D(0, 0, 0), Point3D(200, 0, 0), Point3D(0, 50, 0)
    };

    TinBuilder builder;
    TerrainMesh mesh = builder.build(points);

    EXPECT_TRUE(mesh.empty());
    EXPECT_EQ(builder.get_stats().raw_triangles, 1u);
    EXPECT_EQ(builder.get_stats().oversized_triangles, 1u);
}

TEST(TinBuilderTest, CollinearPointsGiveEmptyMesh) {
    std::vector<Point3D> points = {
        Point3D(0, 0, 0), Point3D(1, 1, 0), Point3D(2, 2, 0), Point3D(3, 3, 0)
    };

    TinBuilder builder;
    EXPECT_TRUE(builder.build(points).empty());
}

TEST(TinBuilderTest, TooFewPointsGiveEmptyMesh) {
    TinBuilder builder;
    EXPECT_TRUE(builder.build({Point3D(0, 0, 0), Point3D(1, 0, 0)}).empty());
    EXPECT_TRUE(builder.build({}).empty());
}

TEST(TinBuilderTest, DropsLaterPointsWithIdenticalXY) {
    std::vector<Point3D> points = square_with_center();
    points.emplace_back(5, 5, 250.0);

    TinBuilder builder;
    TerrainMesh mesh = builder.build(points);

    EXPECT_EQ(builder.get_stats().duplicate_points, 1u);
    EXPECT_EQ(mesh.num_vertices(), 5u);
    EXPECT_DOUBLE_EQ(mesh.get_vertex(4).z(), 103.0);
}

TEST(TinBuilderTest, MergesBreaklineVerticesNearExistingSites) {
    Breakline line;
    line.code = "k1";
    line.prefix = "k";
    line.points = {
        Point3D(0.004, 0.003, 100.2),   // within 0.01 of (0, 0)
        Point3D(5, 0, 100.5),           // new site
        Point3D(5.005, 0, 100.5)        // within 0.01 of the previous vertex
    };

    TinBuilder builder;
    TerrainMesh mesh = builder.build(square_with_center(), {line});

    EXPECT_EQ(builder.get_stats().breakline_vertices_merged, 2u);
    EXPECT_EQ(builder.get_stats().breakline_vertices_added, 1u);
    EXPECT_EQ(mesh.num_vertices(), 6u);
    EXPECT_EQ(mesh.num_triangles(), 5u);
}

TEST(TinBuilderTest, RepeatedBuildsAreIdentical) {
    std::vector<Point3D> points;
    for (int i = 0; i < 40; ++i) {
        points.emplace_back((i * 37) % 23 * 1.5, (i * 11) % 17 * 2.0, i * 0.25);
    }

    TinBuilder first;
    TinBuilder second;
    TerrainMesh a = first.build(points);
    TerrainMesh b = second.build(points);

    ASSERT_EQ(a.num_triangles(), b.num_triangles());
    EXPECT_EQ(a.triangles(), b.triangles());
}

TEST(TinBuilderTest, SelectsPointsByCode) {
    std::vector<SurveyPoint> points(3);
    points[0].code = "Rel";
    points[0].x = 1;
    points[1].code = "gaz1";
    points[1].x = 2;
    points[2].code = " rel ";
    points[2].x = 3;

    auto selected = TinBuilder::select_points(points, {"rel"});
    ASSERT_EQ(selected.size(), 2u);
    EXPECT_DOUBLE_EQ(selected[0].x(), 1.0);
    EXPECT_DOUBLE_EQ(selected[1].x(), 3.0);

    EXPECT_EQ(TinBuilder::select_points(points, {}).size(), 3u);
}
