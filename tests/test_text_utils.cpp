/**
 * @file test_text_utils.cpp
 * @brief Tests for code normalization and number parsing
 */

#include <gtest/gtest.h>
#include "core/TextUtils.hpp"

using namespace survey;

TEST(TextUtilsTest, TrimRemovesSurroundingWhitespace) {
    EXPECT_EQ(trim("  gaz1\t"), "gaz1");
    EXPECT_EQ(trim("\r\n"), "");
    EXPECT_EQ(trim("a b"), "a b");
}

TEST(TextUtilsTest, LowercasesLatinAndCyrillic) {
    EXPECT_EQ(to_lower("GAZ1"), "gaz1");
    EXPECT_EQ(to_lower("ВЛ"), "вл");
    EXPECT_EQ(to_lower("Вышка"), "вышка");
    EXPECT_EQ(to_lower("ЁЛКА"), "ёлка");
    EXPECT_EQ(to_lower("№5"), "№5");
}

TEST(TextUtilsTest, NormalizeCodeTrimsAndLowercases) {
    EXPECT_EQ(normalize_code("  Tower "), "tower");
    EXPECT_EQ(normalize_codes({"VL", " vl", "", "Оп"}), (std::vector<std::string>{"vl", "оп"}));
}

TEST(TextUtilsTest, SplitsCodedNames) {
    auto coded = split_coded_name("gaz12", false);
    ASSERT_TRUE(coded.has_value());
    EXPECT_EQ(coded->prefix, "gaz");
    EXPECT_EQ(coded->number, "12");

    EXPECT_FALSE(split_coded_name("gaz", false).has_value());
    EXPECT_FALSE(split_coded_name("12", false).has_value());
    EXPECT_FALSE(split_coded_name("g-1", false).has_value());
}

TEST(TextUtilsTest, CyrillicPrefixesOnlyWhenAllowed) {
    EXPECT_FALSE(split_coded_name("лес1", false).has_value());

    auto coded = split_coded_name("лес1", true);
    ASSERT_TRUE(coded.has_value());
    EXPECT_EQ(coded->prefix, "лес");
    EXPECT_EQ(coded->number, "1");
}

TEST(TextUtilsTest, ContainsAnyMatchesSubstrings) {
    EXPECT_TRUE(contains_any("les", {"les", "лес"}));
    EXPECT_TRUE(contains_any("smeshles", {"les"}));
    EXPECT_FALSE(contains_any("kust", {"les", ""}));
}

TEST(TextUtilsTest, ParsesNumbersWithDecimalComma) {
    EXPECT_DOUBLE_EQ(parse_number("12.5").value(), 12.5);
    EXPECT_DOUBLE_EQ(parse_number(" 12,5 ").value(), 12.5);
    EXPECT_DOUBLE_EQ(parse_number("-3").value(), -3.0);
    EXPECT_FALSE(parse_number("").has_value());
    EXPECT_FALSE(parse_number("abc").has_value());
    EXPECT_FALSE(parse_number("12.5m").has_value());
    EXPECT_FALSE(parse_number("nan").has_value());
}

TEST(TextUtilsTest, FormatsFixedPrecision) {
    EXPECT_EQ(format_fixed(101.2, 3), "101.200");
    EXPECT_EQ(format_fixed(-0.5, 1), "-0.5");
}
