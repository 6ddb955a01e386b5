#include "sheetbinder/core/Exception.hpp"
#include "sheetbinder/core/StyleBuilder.hpp"
#include "sheetbinder/core/Workbook.hpp"
#include "sheetbinder/summary/FormatTransplanter.hpp"
#include <gtest/gtest.h>

using namespace sheetbinder;
using summary::FormatTransplanter;

class FormatTransplanterTest : public ::testing::Test {
protected:
    void SetUp() override {
        dest = core::Workbook::create();
        tmpl = dest->addSheet("tab1");

        header = core::StyleBuilder().bold().fill(core::Color(0xFFDDEBF7)).border(core::BorderStyle::Thin).build();
        money = core::StyleBuilder().numberFormat("#,##0.00").build();

        tmpl->setValue(1, 1, std::string("Template title"));
        tmpl->setCellStyle(1, 1, header);
        tmpl->setCellStyle(1, 2, header);
        tmpl->setCellStyle(2, 2, money);
        tmpl->setColumnWidth(1, 10);
        tmpl->setColumnWidth(2, 15);
        tmpl->setColumnWidth(3, 20);
        tmpl->setRowHeight(1, 28);
        tmpl->mergeCells(1, 1, 1, 3);

        source = core::Workbook::create();
        data = source->addSheet("Export");
        data->setValue(1, 1, std::string("Acme portfolio"));
        data->setValue(2, 2, 1250.5);
        data->setFormula(3, 2, "B2*2", 2501.0);
        data->setValue(10, 8, std::string("outside template"));
    }

    std::unique_ptr<core::Workbook> dest;
    std::unique_ptr<core::Workbook> source;
    std::shared_ptr<core::Worksheet> tmpl;
    std::shared_ptr<core::Worksheet> data;
    core::StylePtr header;
    core::StylePtr money;
};

// 样式值相等但不共享对象，重复的源样式共享同一个克隆
TEST_F(FormatTransplanterTest, StylesAreEqualButNotAliased) {
    FormatTransplanter::TransplantStats stats;
    auto sheet = FormatTransplanter::transplant(*dest, *tmpl, *data, "20240101", &stats);

    const auto& a1 = sheet->getCell(1, 1);
    const auto& b1 = sheet->getCell(1, 2);
    const auto& b2 = sheet->getCell(2, 2);
    ASSERT_TRUE(a1.hasStyle());
    EXPECT_EQ(*a1.getStyle(), *header);
    EXPECT_NE(a1.getStyle().get(), header.get());
    EXPECT_EQ(a1.getStyle().get(), b1.getStyle().get());
    EXPECT_EQ(*b2.getStyle(), *money);

    EXPECT_EQ(stats.styled_cells, 3u);
    EXPECT_EQ(stats.cloned_styles, 2u);
    EXPECT_EQ(stats.data_cells, 4u);
}

TEST_F(FormatTransplanterTest, DataValuesLandAtSameCoordinates) {
    auto sheet = FormatTransplanter::transplant(*dest, *tmpl, *data, "20240101");

    for (const auto& [position, cell] : data->getCells()) {
        const core::Cell* copied = sheet->findCell(position.first, position.second);
        ASSERT_NE(copied, nullptr);
        EXPECT_TRUE(copied->sameValueAs(cell));
    }
    EXPECT_EQ(sheet->getCell(1, 1).getStringValue(), "Acme portfolio");
    EXPECT_FALSE(sheet->getCell(10, 8).hasStyle());
    EXPECT_TRUE(sheet->getCell(1, 2).isEmpty());
}

TEST_F(FormatTransplanterTest, LayoutIsCopied) {
    auto sheet = FormatTransplanter::transplant(*dest, *tmpl, *data, "20240101");

    EXPECT_EQ(sheet->getColumnWidths(), tmpl->getColumnWidths());
    EXPECT_EQ(sheet->getRowHeights(), tmpl->getRowHeights());
    EXPECT_EQ(sheet->getMergeRanges(), tmpl->getMergeRanges());
    EXPECT_EQ(dest->getSheetNames().back(), "20240101");
}

TEST_F(FormatTransplanterTest, TemplateIsNotModified) {
    const size_t cells_before = tmpl->getCellCount();
    auto style_before = tmpl->getCell(1, 1).getStyle();

    auto sheet = FormatTransplanter::transplant(*dest, *tmpl, *data, "20240101");
    sheet->setValue(2, 2, 7.0);

    EXPECT_EQ(tmpl->getCellCount(), cells_before);
    EXPECT_EQ(tmpl->getCell(1, 1).getStringValue(), "Template title");
    EXPECT_EQ(tmpl->getCell(1, 1).getStyle(), style_before);
    EXPECT_TRUE(tmpl->getCell(2, 2).isEmpty());
}

TEST_F(FormatTransplanterTest, DuplicateNameThrowsAndLeavesWorkbookUnchanged) {
    EXPECT_THROW(FormatTransplanter::transplant(*dest, *tmpl, *data, "tab1"), core::WorksheetException);
    EXPECT_EQ(dest->getSheetCount(), 1u);
}

// 同一模板的两次移植结构相同，各自持有独立的样式与布局
TEST_F(FormatTransplanterTest, RepeatedTransplantsAreIndependent) {
    auto first = FormatTransplanter::transplant(*dest, *tmpl, *data, "20240101");
    auto second = FormatTransplanter::transplant(*dest, *tmpl, *data, "20240201");

    ASSERT_EQ(first->getCellCount(), second->getCellCount());
    for (const auto& [position, cell] : first->getCells()) {
        const core::Cell* other = second->findCell(position.first, position.second);
        ASSERT_NE(other, nullptr);
        EXPECT_TRUE(other->sameValueAs(cell));
        ASSERT_EQ(cell.hasStyle(), other->hasStyle());
        if (cell.hasStyle()) {
            EXPECT_EQ(*cell.getStyle(), *other->getStyle());
            EXPECT_NE(cell.getStyle().get(), other->getStyle().get());
        }
    }
    EXPECT_EQ(first->getColumnWidths(), second->getColumnWidths());
    EXPECT_EQ(first->getMergeRanges(), second->getMergeRanges());

    first->setCellStyle(1, 1, core::StyleBuilder().italic().build());
    first->setColumnWidth(2, 40);

    EXPECT_EQ(*second->getCell(1, 1).getStyle(), *header);
    EXPECT_DOUBLE_EQ(*second->tryGetColumnWidth(2), 15.0);
    EXPECT_DOUBLE_EQ(*tmpl->tryGetColumnWidth(2), 15.0);
    EXPECT_EQ(tmpl->getCell(1, 1).getStyle(), header);
}
