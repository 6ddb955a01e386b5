#include "sheetbinder/core/Worksheet.hpp"
#include "sheetbinder/summary/DateResolver.hpp"
#include <gtest/gtest.h>

using namespace sheetbinder;
using summary::DateResolver;

TEST(DateResolverTest, ParsesSupportedStringFormats) {
    auto iso = DateResolver::parseDateString("2024-01-31");
    ASSERT_TRUE(iso.has_value());
    EXPECT_EQ(utils::TimeUtils::formatCompactDate(*iso), "20240131");

    auto us = DateResolver::parseDateString("3/4/2024");
    ASSERT_TRUE(us.has_value());
    EXPECT_EQ(utils::TimeUtils::formatCompactDate(*us), "20240304");

    // 月份位置超过 12 时按 日/月/年 解析
    auto eu = DateResolver::parseDateString("25/12/2023");
    ASSERT_TRUE(eu.has_value());
    EXPECT_EQ(utils::TimeUtils::formatCompactDate(*eu), "20231225");

    auto compact = DateResolver::parseDateString("20240229");
    ASSERT_TRUE(compact.has_value());
    EXPECT_EQ(compact->day, 29);
}

TEST(DateResolverTest, RejectsPartialAndInvalidDates) {
    EXPECT_FALSE(DateResolver::parseDateString("").has_value());
    EXPECT_FALSE(DateResolver::parseDateString("Report 2024-01-31").has_value());
    EXPECT_FALSE(DateResolver::parseDateString("2024-01-31 ").has_value());
    EXPECT_FALSE(DateResolver::parseDateString("2023-02-29").has_value());
    EXPECT_FALSE(DateResolver::parseDateString("24-01-31").has_value());
    EXPECT_FALSE(DateResolver::parseDateString("13/13/2024").has_value());
    EXPECT_FALSE(DateResolver::parseDateString("2024013").has_value());
    EXPECT_FALSE(DateResolver::parseDateString("Client").has_value());
}

TEST(DateResolverTest, NativeDateWinsOverEarlierString) {
    core::Worksheet sheet("Data");
    sheet.setValue(1, 1, std::string("2023-12-31"));
    sheet.setDate(3, 2, 45292.0);   // 2024-01-01

    EXPECT_EQ(DateResolver::resolve(sheet), "20240101");
}

TEST(DateResolverTest, FirstStringInRowMajorOrder) {
    core::Worksheet sheet("Data");
    sheet.setValue(1, 1, std::string("Portfolio"));
    sheet.setValue(2, 5, std::string("02/01/2024"));
    sheet.setValue(3, 1, std::string("2024-03-01"));

    EXPECT_EQ(DateResolver::resolve(sheet), "20240201");
}

TEST(DateResolverTest, IgnoresCellsOutsideScanWindow) {
    core::Worksheet sheet("Data");
    sheet.setValue(6, 1, std::string("2024-01-01"));
    sheet.setDate(1, 6, 45292.0);
    sheet.setValue(2, 2, 45292.0);   // 普通数字不是日期

    EXPECT_FALSE(DateResolver::resolve(sheet).has_value());
    EXPECT_EQ(DateResolver::resolve(sheet, 6, 6), "20240101");
}

TEST(DateResolverTest, TimeOnlyCellIsNotADate) {
    core::Worksheet sheet("Data");
    sheet.setDate(1, 1, 0.395833);   // 09:30，没有日期部分
    sheet.setValue(2, 1, std::string("2024-03-31"));

    EXPECT_EQ(DateResolver::resolve(sheet), "20240331");
}
