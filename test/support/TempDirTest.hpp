#pragma once

#include "sheetbinder/core/Path.hpp"
#include "sheetbinder/core/StyleBuilder.hpp"
#include "sheetbinder/core/Workbook.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <string>

namespace sheetbinder {
namespace test {

/**
 * @brief 每个测试独占一个临时目录，TearDown 时删除
 */
class TempDirTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = std::string(info->test_suite_name()) + "_" + info->name();
        root_ = std::filesystem::temp_directory_path() / ("sheetbinder_" + name);
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
        std::filesystem::create_directories(root_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    core::Path path(const std::string& relative) const {
        return core::Path((root_ / relative).u8string());
    }

    std::string dir() const { return root_.u8string(); }

    std::filesystem::path root_;
};

/**
 * @brief 写出只有一张表的工作簿，A1 放报告日期字符串
 */
inline void writeDataWorkbook(const core::Path& file, const std::string& a1, double b2) {
    auto workbook = core::Workbook::create();
    auto sheet = workbook->addSheet("Data");
    sheet->setValue(1, 1, a1);
    sheet->setValue(2, 2, b2);
    ASSERT_EQ(workbook->save(file), core::ErrorCode::Ok);
}

/**
 * @brief 写出模板工作簿：Cover、tab1（A..C 列宽 10/15/20，A1 粗体）、Calculations
 */
inline void writeTemplateWorkbook(const core::Path& file) {
    auto workbook = core::Workbook::create();

    auto cover = workbook->addSheet("Cover");
    cover->setValue(1, 1, std::string("Portfolio summary"));

    auto tab1 = workbook->addSheet("tab1");
    tab1->setColumnWidth(1, 10);
    tab1->setColumnWidth(2, 15);
    tab1->setColumnWidth(3, 20);
    tab1->setValue(1, 1, std::string("Header"));
    tab1->setCellStyle(1, 1, core::StyleBuilder().bold().fontSize(14).build());
    tab1->setCellStyle(2, 2, core::StyleBuilder().numberFormat("#,##0.00").build());
    tab1->mergeCells(3, 1, 3, 3);

    auto calc = workbook->addSheet("Calculations");
    calc->setFormula(1, 1, "'[Other.xlsx]Sheet1'!A1");

    ASSERT_EQ(workbook->save(file), core::ErrorCode::Ok);
}

}} // namespace sheetbinder::test
