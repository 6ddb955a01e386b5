#include "sheetbinder/core/Exception.hpp"
#include "sheetbinder/core/StyleBuilder.hpp"
#include "sheetbinder/core/Workbook.hpp"
#include "sheetbinder/reader/XLSXReader.hpp"
#include "support/TempDirTest.hpp"
#include <fstream>

using namespace sheetbinder;

class XLSXRoundTripTest : public test::TempDirTest {};

// 写出后再读回：值、样式属性、布局与活动工作表保持一致
TEST_F(XLSXRoundTripTest, ValuesStylesAndLayoutSurvive) {
    core::Path file = path("roundtrip.xlsx");
    {
        auto workbook = core::Workbook::create();
        auto first = workbook->addSheet("Cover");
        first->setValue(1, 1, std::string("Q1 <review> & \"notes\""));

        auto sheet = workbook->addSheet("Holdings");
        sheet->setValue(1, 1, std::string(" padded "));
        sheet->setValue(1, 2, 1250.75);
        sheet->setValue(1, 3, true);
        sheet->setFormula(2, 2, "B1*2", 2501.5);
        sheet->getCell(2, 3).setFormula("A1&\"x\"");
        sheet->getCell(2, 3).setFormulaStringResult(" paddedx");
        sheet->setDate(3, 1, 45292.0);
        sheet->getCell(3, 2).setError("#DIV/0!");

        sheet->setCellStyle(1, 2, core::StyleBuilder()
                                      .bold()
                                      .fontColor(core::Color(0xFF1F4E79))
                                      .fill(core::Color::fromTheme(4, 0.4))
                                      .bottomBorder(core::BorderStyle::Medium)
                                      .horizontalAlign(core::HorizontalAlign::Right)
                                      .numberFormat("#,##0.00")
                                      .build());
        sheet->setColumnWidth(1, 10);
        sheet->setColumnWidth(2, 15);
        sheet->setColumnWidth(3, 15);
        sheet->setRowHeight(1, 24);
        sheet->setRowHeight(8, 30);   // 只有行高的空行
        sheet->mergeCells(5, 1, 6, 3);

        workbook->setActiveWorksheet(1);
        ASSERT_EQ(workbook->save(file), core::ErrorCode::Ok);
    }

    auto loaded = core::Workbook::open(file);
    std::vector<std::string> names = {"Cover", "Holdings"};
    EXPECT_EQ(loaded->getSheetNames(), names);
    EXPECT_EQ(loaded->getActiveSheetIndex(), 1u);

    auto cover = loaded->getSheet("Cover");
    EXPECT_EQ(cover->getCell(1, 1).getStringValue(), "Q1 <review> & \"notes\"");

    auto sheet = loaded->getSheet("Holdings");
    EXPECT_EQ(sheet->getCell(1, 1).getStringValue(), " padded ");
    EXPECT_DOUBLE_EQ(sheet->getCell(1, 2).getNumberValue(), 1250.75);
    EXPECT_TRUE(sheet->getCell(1, 3).isBoolean());
    EXPECT_TRUE(sheet->getCell(1, 3).getBooleanValue());

    const auto& formula = sheet->getCell(2, 2);
    ASSERT_TRUE(formula.isFormula());
    EXPECT_EQ(formula.getFormula(), "B1*2");
    EXPECT_EQ(formula.getFormulaResultType(), core::CellType::Number);
    EXPECT_DOUBLE_EQ(formula.getFormulaResult(), 2501.5);

    const auto& text_formula = sheet->getCell(2, 3);
    ASSERT_TRUE(text_formula.isFormula());
    EXPECT_EQ(text_formula.getFormulaResultType(), core::CellType::String);
    EXPECT_EQ(text_formula.getFormulaResultText(), " paddedx");

    const auto& date = sheet->getCell(3, 1);
    ASSERT_TRUE(date.isDate());
    EXPECT_DOUBLE_EQ(date.getNumberValue(), 45292.0);
    ASSERT_TRUE(date.hasStyle());
    EXPECT_TRUE(date.getStyle()->isDateFormat());

    EXPECT_TRUE(sheet->getCell(3, 2).isError());
    EXPECT_EQ(sheet->getCell(3, 2).getStringValue(), "#DIV/0!");

    const auto& styled = sheet->getCell(1, 2);
    ASSERT_TRUE(styled.hasStyle());
    const auto& style = *styled.getStyle();
    EXPECT_TRUE(style.getFont().bold);
    EXPECT_EQ(style.getFont().color, core::Color(0xFF1F4E79));
    EXPECT_EQ(style.getFill().pattern, core::PatternType::Solid);
    EXPECT_EQ(style.getFill().fg_color, core::Color::fromTheme(4, 0.4));
    EXPECT_EQ(style.getBorder().bottom.style, core::BorderStyle::Medium);
    EXPECT_EQ(style.getAlignment().horizontal, core::HorizontalAlign::Right);
    EXPECT_EQ(style.getNumberFormat().code, "#,##0.00");
    EXPECT_FALSE(sheet->getCell(1, 1).hasStyle());

    std::map<int, double> widths = {{1, 10.0}, {2, 15.0}, {3, 15.0}};
    EXPECT_EQ(sheet->getColumnWidths(), widths);
    EXPECT_DOUBLE_EQ(*sheet->tryGetRowHeight(1), 24.0);
    EXPECT_DOUBLE_EQ(*sheet->tryGetRowHeight(8), 30.0);

    ASSERT_EQ(sheet->getMergeRanges().size(), 1u);
    EXPECT_EQ(sheet->getMergeRanges()[0].toReference(), "A5:C6");
}

TEST_F(XLSXRoundTripTest, ReaderListsSheetNames) {
    core::Path file = path("names.xlsx");
    {
        auto workbook = core::Workbook::create();
        workbook->addSheet("Alpha");
        workbook->addSheet("Beta");
        ASSERT_EQ(workbook->save(file), core::ErrorCode::Ok);
    }

    reader::XLSXReader reader(file);
    ASSERT_EQ(reader.open(), core::ErrorCode::Ok);
    std::vector<std::string> names;
    ASSERT_EQ(reader.getSheetNames(names), core::ErrorCode::Ok);
    std::vector<std::string> expected = {"Alpha", "Beta"};
    EXPECT_EQ(names, expected);
    EXPECT_EQ(reader.close(), core::ErrorCode::Ok);
}

TEST_F(XLSXRoundTripTest, ResavingKeepsContent) {
    core::Path first = path("first.xlsx");
    core::Path second = path("second.xlsx");
    test::writeTemplateWorkbook(first);

    auto loaded = core::Workbook::open(first);
    ASSERT_EQ(loaded->save(second), core::ErrorCode::Ok);
    auto again = core::Workbook::open(second);

    EXPECT_EQ(again->getSheetNames(), loaded->getSheetNames());
    auto tab1 = again->getSheet("tab1");
    EXPECT_TRUE(tab1->getCell(1, 1).getStyle()->getFont().bold);
    EXPECT_DOUBLE_EQ(tab1->getCell(1, 1).getStyle()->getFont().size, 14.0);
    EXPECT_EQ(tab1->getMergeRanges().size(), 1u);
    EXPECT_EQ(again->getSheet("Calculations")->getCell(1, 1).getFormula(), "'[Other.xlsx]Sheet1'!A1");
}

TEST_F(XLSXRoundTripTest, OpenFailuresThrowFileException) {
    EXPECT_THROW(core::Workbook::open(path("missing.xlsx")), core::FileException);

    core::Path legacy = path("legacy.xls");
    {
        std::ofstream out(legacy.string(), std::ios::binary);
        out << "\xD0\xCF\x11\xE0\xA1\xB1\x1A\xE1 binary workbook";
    }
    try {
        core::Workbook::open(legacy);
        FAIL() << "expected FileException";
    } catch (const core::FileException& e) {
        EXPECT_EQ(e.getErrorCode(), core::ErrorCode::FileCorrupted);
        EXPECT_EQ(e.getFilename(), legacy.string());
    }
}

TEST_F(XLSXRoundTripTest, SheetStateAndDefinedNamesSurvive) {
    core::Path file = path("names_state.xlsx");
    {
        auto workbook = core::Workbook::create();
        workbook->addSheet("Cover")->setFormula(1, 1, "Rate*2", 0.1);
        workbook->addSheet("Lookup")->setValue(2, 2, 0.05);
        workbook->addSheet("Scratch");
        workbook->getSheet("Lookup")->setState(core::SheetState::Hidden);
        workbook->getSheet("Scratch")->setState(core::SheetState::VeryHidden);

        auto& names = workbook->getDefinedNames();
        names.define(core::DefinedName("Rate", "Lookup!$B$2"));
        names.define(core::DefinedName("_xlnm.Print_Area", "Cover!$A$1:$C$9", "Cover"));
        names.define(core::DefinedName("Temp", "Scratch!$A$1"));

        // 活动工作表隐藏时写出第一个可见表
        workbook->setActiveWorksheet(1);
        ASSERT_EQ(workbook->save(file), core::ErrorCode::Ok);
    }

    auto loaded = core::Workbook::open(file);
    EXPECT_EQ(loaded->getActiveSheetIndex(), 0u);
    EXPECT_TRUE(loaded->getSheet("Cover")->isVisible());
    EXPECT_EQ(loaded->getSheet("Lookup")->getState(), core::SheetState::Hidden);
    EXPECT_EQ(loaded->getSheet("Scratch")->getState(), core::SheetState::VeryHidden);

    const auto& names = loaded->getDefinedNames().getAll();
    ASSERT_EQ(names.size(), 3u);
    EXPECT_EQ(names[0], core::DefinedName("Rate", "Lookup!$B$2"));
    EXPECT_EQ(names[1], core::DefinedName("_xlnm.Print_Area", "Cover!$A$1:$C$9", "Cover"));

    // 删除工作表时同时删除引用它的名称
    EXPECT_TRUE(loaded->removeSheet("Scratch"));
    ASSERT_EQ(loaded->getDefinedNames().size(), 2u);
    EXPECT_EQ(loaded->getDefinedNames().getAll()[1].scope, "Cover");
}
