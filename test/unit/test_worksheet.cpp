#include "sheetbinder/core/Cell.hpp"
#include "sheetbinder/core/Exception.hpp"
#include "sheetbinder/core/StyleBuilder.hpp"
#include "sheetbinder/core/Workbook.hpp"
#include "sheetbinder/core/Worksheet.hpp"
#include <gtest/gtest.h>

using namespace sheetbinder::core;

class WorksheetTest : public ::testing::Test {
protected:
    void SetUp() override {
        workbook = Workbook::create();
        worksheet = workbook->addSheet("TestSheet");
    }

    void TearDown() override {
        worksheet.reset();
        workbook.reset();
    }

    std::unique_ptr<Workbook> workbook;
    std::shared_ptr<Worksheet> worksheet;
};

TEST_F(WorksheetTest, Creation) {
    ASSERT_NE(worksheet, nullptr);
    EXPECT_EQ(worksheet->getName(), "TestSheet");
    EXPECT_EQ(worksheet->getCellCount(), 0u);
    EXPECT_EQ(worksheet->getUsedRange(), std::make_pair(0, 0));
}

TEST_F(WorksheetTest, CellValues) {
    worksheet->setValue(1, 1, std::string("Hello"));
    worksheet->setValue(2, 3, 123.456);
    worksheet->setValue(4, 2, true);
    worksheet->setFormula(5, 1, "SUM(B1:B3)");
    worksheet->setDate(6, 1, 45292.0);

    EXPECT_TRUE(worksheet->getCell(1, 1).isString());
    EXPECT_EQ(worksheet->getCell(1, 1).getStringValue(), "Hello");
    EXPECT_DOUBLE_EQ(worksheet->getCell(2, 3).getNumberValue(), 123.456);
    EXPECT_TRUE(worksheet->getCell(4, 2).getBooleanValue());
    EXPECT_TRUE(worksheet->getCell(5, 1).isFormula());
    EXPECT_EQ(worksheet->getCell(5, 1).getFormula(), "SUM(B1:B3)");
    EXPECT_TRUE(worksheet->getCell(6, 1).isDate());

    EXPECT_EQ(worksheet->getUsedRange(), std::make_pair(6, 3));
    EXPECT_TRUE(worksheet->hasCellAt(2, 3));
    EXPECT_FALSE(worksheet->hasCellAt(9, 9));
    EXPECT_EQ(worksheet->findCell(9, 9), nullptr);
}

TEST_F(WorksheetTest, CellsIterateInRowMajorOrder) {
    worksheet->setValue(2, 1, 1.0);
    worksheet->setValue(1, 3, 2.0);
    worksheet->setValue(1, 1, 3.0);

    std::vector<std::pair<int, int>> order;
    for (const auto& [position, cell] : worksheet->getCells()) {
        order.push_back(position);
    }
    std::vector<std::pair<int, int>> expected = {{1, 1}, {1, 3}, {2, 1}};
    EXPECT_EQ(order, expected);
}

TEST_F(WorksheetTest, CopyValueKeepsTargetStyle) {
    StylePtr bold = StyleBuilder().bold().build();
    Cell source;
    source.setFormula("A1*2", 84.0);

    Cell target;
    target.setStyle(bold);
    target.copyValueFrom(source);

    EXPECT_TRUE(target.isFormula());
    EXPECT_DOUBLE_EQ(target.getFormulaResult(), 84.0);
    EXPECT_EQ(target.getStyle(), bold);
    EXPECT_TRUE(target.sameValueAs(source));

    target.clearValue();
    EXPECT_TRUE(target.isEmpty());
    EXPECT_TRUE(target.hasStyle());
}

TEST_F(WorksheetTest, InvalidPositionsThrow) {
    EXPECT_THROW(worksheet->getCell(0, 1), ParameterException);
    EXPECT_THROW(worksheet->getCell(1, 16385), ParameterException);
    EXPECT_THROW(worksheet->setColumnWidth(1, -2.0), ParameterException);
}

TEST_F(WorksheetTest, ColumnWidthsAndRowHeights) {
    worksheet->setColumnWidth(1, 10);
    worksheet->setColumnWidth(3, 20);
    worksheet->setRowHeight(2, 30);

    EXPECT_EQ(worksheet->getColumnWidths().size(), 2u);
    EXPECT_DOUBLE_EQ(*worksheet->tryGetColumnWidth(3), 20.0);
    EXPECT_FALSE(worksheet->tryGetColumnWidth(2).has_value());
    EXPECT_DOUBLE_EQ(*worksheet->tryGetRowHeight(2), 30.0);
}

TEST_F(WorksheetTest, MergeRanges) {
    worksheet->mergeCells(1, 1, 1, 3);
    ASSERT_EQ(worksheet->getMergeRanges().size(), 1u);
    EXPECT_EQ(worksheet->getMergeRanges()[0].toReference(), "A1:C1");

    EXPECT_THROW(worksheet->mergeCells(1, 2, 2, 2), ParameterException);
    EXPECT_THROW(worksheet->mergeCells(3, 3, 2, 2), ParameterException);
    EXPECT_EQ(worksheet->getMergeRanges().size(), 1u);
}

TEST_F(WorksheetTest, WorkbookSheetManagement) {
    workbook->addSheet("Second");
    workbook->addSheet("Third");

    EXPECT_THROW(workbook->addSheet("Second"), WorksheetException);
    EXPECT_THROW(workbook->addSheet("SECOND"), WorksheetException);
    EXPECT_TRUE(workbook->hasSheet("third"));
    EXPECT_EQ(workbook->getSheet("third"), nullptr);
    EXPECT_THROW(workbook->addSheet("bad:name"), WorksheetException);
    EXPECT_THROW(workbook->addSheet(std::string(32, 'a')), WorksheetException);

    workbook->setActiveWorksheet(2);
    EXPECT_EQ(workbook->getActiveWorksheet()->getName(), "Third");

    EXPECT_TRUE(workbook->removeSheet("Second"));
    EXPECT_FALSE(workbook->removeSheet("Second"));
    EXPECT_EQ(workbook->getActiveWorksheet()->getName(), "Third");

    std::vector<std::string> expected = {"TestSheet", "Third"};
    EXPECT_EQ(workbook->getSheetNames(), expected);
    EXPECT_THROW(workbook->setActiveWorksheet(5), ParameterException);
}

TEST_F(WorksheetTest, SaveWithoutSheetsFails) {
    auto empty = Workbook::create();
    EXPECT_EQ(empty->save(sheetbinder::core::Path("never_written.xlsx")), ErrorCode::InvalidWorkbook);
}
