/**
 * @file test_breaklines.cpp
 * @brief Tests for coded linear feature grouping and ordering
 */

#include <gtest/gtest.h>
#include "core/BreaklineExtractor.hpp"

using namespace survey;

namespace {

SurveyPoint make_point(const std::string& id, double x, double y, double z,
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

} // namespace

TEST(BreaklineExtractorTest, GroupsByFullCodeInRowOrder) {
    std::vector<SurveyPoint> points = {
        make_point("1", 0, 0, 1, "gaz1"),
        make_point("2", 5, 0, 1, "k2"),
        make_point("3", 1, 0, 1, "GAZ1"),
        make_point("4", 6, 0, 1, "k2"),
        make_point("5", 2, 0, 1, "gaz2"),
        make_point("6", 3, 0, 1, "unknown1"),
    };

    auto groups = BreaklineExtractor::group_by_code(points, {"gaz", "k"}, false);
    ASSERT_EQ(groups.size(), 3u);
    EXPECT_EQ(groups[0].code, "gaz1");
    EXPECT_EQ(groups[0].prefix, "gaz");
    EXPECT_EQ(groups[0].indices, (std::vector<size_t>{0, 2}));
    EXPECT_EQ(groups[1].code, "k2");
    EXPECT_EQ(groups[2].code, "gaz2");
}

TEST(BreaklineExtractorTest, NearestNeighbourWalkStartsAtFirstRow) {
    std::vector<SurveyPoint> points = {
        make_point("1", 0, 0, 0, "gaz1"),
        make_point("2", 10, 0, 0, "gaz1"),
        make_point("3", 3, 0, 0, "gaz1"),
        make_point("4", 6, 0, 0, "gaz1"),
    };

    auto order = BreaklineExtractor::order_by_nearest_neighbour(points, {0, 1, 2, 3});
    EXPECT_EQ(order, (std::vector<size_t>{0, 2, 3, 1}));
}

TEST(BreaklineExtractorTest, EquidistantCandidatesResolveToEarlierRow) {
    std::vector<SurveyPoint> points = {
        make_point("1", 0, 0, 0, "k1"),
        make_point("2", 5, 0, 0, "k1"),
        make_point("3", -5, 0, 0, "k1"),
    };

    auto order = BreaklineExtractor::order_by_nearest_neighbour(points, {0, 1, 2});
    EXPECT_EQ(order, (std::vector<size_t>{0, 1, 2}));
}

TEST(BreaklineExtractorTest, SinglePointGroupsProduceNothing) {
    std::vector<SurveyPoint> points = {
        make_point("1", 0, 0, 0, "gaz1"),
        make_point("2", 1, 1, 0, "voda3"),
        make_point("3", 2, 1, 0, "voda3"),
    };

    BreaklineExtractor extractor({"gaz", "voda"});
    auto lines = extractor.extract(points);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].code, "voda3");
    EXPECT_EQ(lines[0].prefix, "voda");
    EXPECT_EQ(lines[0].points.size(), 2u);
}

TEST(BreaklineExtractorTest, KeepsCommentsAlongTheWalk) {
    std::vector<SurveyPoint> points = {
        make_point("1", 0, 0, 0, "tr1", " d100 "),
        make_point("2", 10, 0, 0, "tr1", ""),
        make_point("3", 4, 0, 0, "tr1", "d50"),
    };

    BreaklineExtractor extractor({"tr"});
    auto lines = extractor.extract(points);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].comments, (std::vector<std::string>{"d100", "d50", ""}));
    EXPECT_DOUBLE_EQ(lines[0].points[1].x(), 4.0);
}

TEST(BreaklineExtractorTest, SegmentLabelsSitLeftOfTheSegment) {
    Breakline line;
    line.code = "tr1";
    line.prefix = "tr";
    line.points = {Point3D(0, 0, 5), Point3D(0, 10, 5), Point3D(10, 10, 5)};
    line.comments = {"d100", "", "end"};

    LabelConfig labels;
    auto texts = BreaklineExtractor::segment_labels(line, 2.0, labels, EntityAttributes("Polylines", 7));

    ASSERT_EQ(texts.size(), 1u);
    EXPECT_EQ(texts[0].text, "d100");
    // Segment points north; the left normal points west
    EXPECT_NEAR(texts[0].position.x(), -2.0, 1e-9);
    EXPECT_NEAR(texts[0].position.y(), 5.0, 1e-9);
    EXPECT_DOUBLE_EQ(texts[0].position.z(), 0.0);
    EXPECT_NEAR(texts[0].rotation_deg, 90.0, 1e-9);
    EXPECT_DOUBLE_EQ(texts[0].height, 3.2);
    EXPECT_EQ(texts[0].attributes.layer, "Polylines");
}
