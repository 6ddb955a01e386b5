#include "sheetbinder/utils/CommonUtils.hpp"
#include "sheetbinder/utils/TimeUtils.hpp"
#include <gtest/gtest.h>

using namespace sheetbinder::utils;

TEST(CommonUtilsTest, ColumnLetters) {
    EXPECT_EQ(CommonUtils::columnToLetter(1), "A");
    EXPECT_EQ(CommonUtils::columnToLetter(26), "Z");
    EXPECT_EQ(CommonUtils::columnToLetter(27), "AA");
    EXPECT_EQ(CommonUtils::columnToLetter(16384), "XFD");
}

TEST(CommonUtilsTest, CellReferenceRoundTrip) {
    EXPECT_EQ(CommonUtils::cellReference(1, 1), "A1");
    EXPECT_EQ(CommonUtils::rangeReference(3, 1, 3, 3), "A3:C3");

    auto [row, col] = CommonUtils::parseReference("AB12");
    EXPECT_EQ(row, 12);
    EXPECT_EQ(col, 28);
}

TEST(CommonUtilsTest, SheetNameRules) {
    EXPECT_TRUE(CommonUtils::isValidSheetName("20240101"));
    EXPECT_FALSE(CommonUtils::isValidSheetName(""));
    EXPECT_FALSE(CommonUtils::isValidSheetName("a/b"));
    EXPECT_FALSE(CommonUtils::isValidSheetName("'quoted"));
    EXPECT_FALSE(CommonUtils::isValidSheetName(std::string(32, 'x')));
    EXPECT_TRUE(CommonUtils::isValidSheetName(std::string(31, 'x')));
}

TEST(CommonUtilsTest, Utf8TruncateKeepsWholeCharacters) {
    const std::string text = "\xE5\xAE\xA2\xE6\x88\xB7\xE6\x8A\xA5\xE8\xA1\xA8";  // 客户报表
    EXPECT_EQ(CommonUtils::utf8Length(text), 4u);
    EXPECT_EQ(CommonUtils::utf8Truncate(text, 2), "\xE5\xAE\xA2\xE6\x88\xB7");
    EXPECT_EQ(CommonUtils::utf8Truncate("abc", 10), "abc");
}

TEST(CommonUtilsTest, Utf8HelpersNeverEmitBrokenSequences) {
    // 末尾是被截断的三字节字符
    const std::string broken = std::string(30, 'a') + "\xE5\xAE";
    std::string truncated = CommonUtils::utf8Truncate(broken, 31);
    EXPECT_EQ(truncated, std::string(30, 'a') + "\xEF\xBF\xBD");
    EXPECT_EQ(CommonUtils::utf8Length(truncated), 31u);

    EXPECT_FALSE(CommonUtils::isValidSheetName("Soci\xE9t\xE9"));
    EXPECT_EQ(CommonUtils::utf8Sanitize("ok"), "ok");
}

TEST(TimeUtilsTest, ExcelSerialConversion) {
    CivilDate date = TimeUtils::excelSerialToDate(45292.0);
    EXPECT_EQ(date.year, 2024);
    EXPECT_EQ(date.month, 1);
    EXPECT_EQ(date.day, 1);

    EXPECT_DOUBLE_EQ(TimeUtils::dateToExcelSerial(CivilDate{2024, 1, 1}), 45292.0);
    EXPECT_DOUBLE_EQ(TimeUtils::dateToExcelSerial(CivilDate{1900, 3, 1}), 61.0);
    EXPECT_EQ(TimeUtils::formatCompactDate(CivilDate{2024, 3, 4}), "20240304");
}

TEST(TimeUtilsTest, CalendarValidation) {
    EXPECT_TRUE(TimeUtils::isValidDate(2024, 2, 29));
    EXPECT_FALSE(TimeUtils::isValidDate(2023, 2, 29));
    EXPECT_FALSE(TimeUtils::isValidDate(2024, 13, 1));
    EXPECT_FALSE(TimeUtils::isValidDate(2024, 4, 31));
}
