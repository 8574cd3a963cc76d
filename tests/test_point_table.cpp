/**
 * @file test_point_table.cpp
 * @brief Tests for point table column mapping and row parsing
 */

#include <gtest/gtest.h>
#include "core/PointTableReader.hpp"
#include <filesystem>
#include <fstream>

using namespace survey;

TEST(PointTableReaderTest, MapsColumnsCaseInsensitively) {
    auto columns = PointTableReader::map_columns({"POINT", " x ", "Y", "z", "Code", "Coments"});
    EXPECT_EQ(columns.point, 0);
    EXPECT_EQ(columns.x, 1);
    EXPECT_EQ(columns.y, 2);
    EXPECT_EQ(columns.z, 3);
    EXPECT_EQ(columns.code, 4);
    EXPECT_EQ(columns.comment, 5);
    EXPECT_TRUE(columns.has_coordinates());
}

TEST(PointTableReaderTest, MissingCoordinateColumnsAreReported) {
    auto columns = PointTableReader::map_columns({"Point", "X", "Y", "Code", "Comments", "Comment"});
    EXPECT_EQ(columns.z, -1);
    EXPECT_EQ(columns.comment, 4);
    EXPECT_FALSE(columns.has_coordinates());
}

TEST(PointTableReaderTest, ParsesRowsWithDecimalComma) {
    auto columns = PointTableReader::map_columns({"Point", "X", "Y", "Z", "Code", "Comment"});

    auto point = PointTableReader::parse_row({" 17 ", "100,25", "200.5", "12", " gaz1 ", " d100 "}, columns, 4);
    ASSERT_TRUE(point.has_value());
    EXPECT_EQ(point->id, "17");
    EXPECT_DOUBLE_EQ(point->x, 100.25);
    EXPECT_DOUBLE_EQ(point->y, 200.5);
    EXPECT_DOUBLE_EQ(point->z, 12.0);
    EXPECT_EQ(point->code, "gaz1");
    EXPECT_EQ(point->comment, "d100");
    EXPECT_EQ(point->row_index, 4u);
}

TEST(PointTableReaderTest, RejectsNonNumericOrMissingCoordinates) {
    auto columns = PointTableReader::map_columns({"Point", "X", "Y", "Z"});
    EXPECT_FALSE(PointTableReader::parse_row({"1", "abc", "2", "3"}, columns, 0).has_value());
    EXPECT_FALSE(PointTableReader::parse_row({"1", "1", "", "3"}, columns, 0).has_value());
    EXPECT_FALSE(PointTableReader::parse_row({"1", "1", "2"}, columns, 0).has_value());

    auto point = PointTableReader::parse_row({"1", "1", "2", "3"}, columns, 0);
    ASSERT_TRUE(point.has_value());
    EXPECT_TRUE(point->code.empty());
    EXPECT_TRUE(point->comment.empty());
}

TEST(PointTableReaderTest, LoadsCsvAndCountsSkippedRows) {
    auto path = std::filesystem::temp_directory_path() / "survey_points_test.csv";
    {
        std::ofstream file(path);
        file << "Point,X,Y,Z,Code,Coments\n";
        file << "1,\"10,5\",20,100,gaz1,d100\n";
        file << "2,abc,20,100,gaz1,\n";
        file << "3,11,21,101,,\n";
    }

    PointTableReader reader;
    std::vector<SurveyPoint> points;
    ASSERT_TRUE(reader.load(path.string(), points));

    ASSERT_EQ(points.size(), 2u);
    EXPECT_DOUBLE_EQ(points[0].x, 10.5);
    EXPECT_EQ(points[0].comment, "d100");
    EXPECT_EQ(points[0].row_index, 0u);
    EXPECT_EQ(points[1].id, "3");
    EXPECT_EQ(points[1].row_index, 2u);

    const auto& stats = reader.get_stats();
    EXPECT_EQ(stats.rows, 3u);
    EXPECT_EQ(stats.points, 2u);
    EXPECT_EQ(stats.skipped_rows, 1u);
    ASSERT_EQ(stats.skipped_messages.size(), 1u);
    EXPECT_NE(stats.skipped_messages[0].find("Row 2"), std::string::npos);

    std::filesystem::remove(path);
}

TEST(PointTableReaderTest, MissingFileFails) {
    PointTableReader reader;
    std::vector<SurveyPoint> points;
    EXPECT_FALSE(reader.load((std::filesystem::temp_directory_path() / "survey_no_such_table.csv").string(),
                             points));
}
