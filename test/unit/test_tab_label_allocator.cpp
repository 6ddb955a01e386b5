#include "sheetbinder/summary/TabLabelAllocator.hpp"
#include "sheetbinder/utils/CommonUtils.hpp"
#include <gtest/gtest.h>
#include <set>

using sheetbinder::summary::TabLabelAllocator;
using sheetbinder::utils::CommonUtils;

TEST(TabLabelAllocatorTest, UnusedLabelIsReturnedAsIs) {
    EXPECT_EQ(TabLabelAllocator::allocate("20240101", {"Cover", "tab1"}), "20240101");
}

TEST(TabLabelAllocatorTest, CollisionsGetCounterSuffix) {
    std::vector<std::string> used = {"20240101"};
    EXPECT_EQ(TabLabelAllocator::allocate("20240101", used), "20240101_1");
    used.push_back("20240101_1");
    EXPECT_EQ(TabLabelAllocator::allocate("20240101", used), "20240101_2");
}

TEST(TabLabelAllocatorTest, LongLabelsKeepWholeSuffix) {
    const std::string long_name(40, 'a');
    std::vector<std::string> used;

    std::string first = TabLabelAllocator::allocate(long_name, used);
    EXPECT_EQ(first, std::string(31, 'a'));
    used.push_back(first);

    std::string second = TabLabelAllocator::allocate(long_name, used);
    EXPECT_EQ(second, std::string(29, 'a') + "_1");
}

TEST(TabLabelAllocatorTest, EmptyLabelFallsBack) {
    EXPECT_EQ(TabLabelAllocator::allocate("", {}), "Sheet");
}

TEST(TabLabelAllocatorTest, MultibyteLabelsCountCharacters) {
    std::string name;
    for (int i = 0; i < 35; ++i) name += "\xE5\xAE\xA2";   // 客
    std::string label = TabLabelAllocator::allocate(name, {});
    EXPECT_EQ(CommonUtils::utf8Length(label), 31u);
    EXPECT_TRUE(CommonUtils::isValidSheetName(label));
}

// 50 次连续分配都唯一且不超过 31 个字符
TEST(TabLabelAllocatorTest, FiftyAllocationsStayUnique) {
    std::vector<std::string> used;
    for (int i = 0; i < 50; ++i) {
        std::string label = TabLabelAllocator::allocate(std::string(31, 'x'), used);
        EXPECT_LE(CommonUtils::utf8Length(label), 31u);
        used.push_back(label);
    }
    std::set<std::string> distinct(used.begin(), used.end());
    EXPECT_EQ(distinct.size(), used.size());
    EXPECT_EQ(used.back(), std::string(28, 'x') + "_49");
}

TEST(TabLabelAllocatorTest, CollisionsIgnoreCase) {
    EXPECT_EQ(TabLabelAllocator::allocate("TAB1", {"Cover", "tab1"}), "TAB1_1");
    EXPECT_EQ(TabLabelAllocator::allocate("q1", {"Q1"}), "q1_1");
}

TEST(TabLabelAllocatorTest, InvalidUtf8IsReplaced) {
    // Latin-1 编码的 "Société_résumé"
    std::string label = TabLabelAllocator::allocate("Soci\xE9t\xE9_r\xE9sum\xE9", {});
    EXPECT_TRUE(CommonUtils::isValidSheetName(label));
    EXPECT_EQ(label.rfind("Soci\xEF\xBF\xBDt", 0), 0u);
    EXPECT_EQ(CommonUtils::utf8Length(label), 14u);
}
