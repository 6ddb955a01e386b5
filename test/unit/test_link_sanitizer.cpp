#include "sheetbinder/core/StyleBuilder.hpp"
#include "sheetbinder/core/Workbook.hpp"
#include "sheetbinder/summary/LinkSanitizer.hpp"
#include <gtest/gtest.h>

using namespace sheetbinder;
using summary::LinkSanitizer;

TEST(LinkSanitizerTest, HeuristicMatchesWorkbookReferences) {
    EXPECT_TRUE(LinkSanitizer::looksLikeExternalReference("=[Budget.xlsx]Sheet1!A1"));
    EXPECT_TRUE(LinkSanitizer::looksLikeExternalReference("='C:\\data\\[Plan.xlsm]Q1'!B2"));
    EXPECT_TRUE(LinkSanitizer::looksLikeExternalReference("=SUM('[1]Sheet 1'!A1:A3)"));
    EXPECT_TRUE(LinkSanitizer::looksLikeExternalReference("=[Book1.xlsx]Sheet1'!A1"));

    // 同一工作簿内的引用没有方括号
    EXPECT_FALSE(LinkSanitizer::looksLikeExternalReference("='Sheet 1'!A1"));
    EXPECT_FALSE(LinkSanitizer::looksLikeExternalReference("=SUM(A1:A3)"));
    // 结构化引用有方括号但既无 .xl 也无单引号
    EXPECT_FALSE(LinkSanitizer::looksLikeExternalReference("=Table1[Amount]"));
}

TEST(LinkSanitizerTest, ClearsOnlyExternalFormulas) {
    auto workbook = core::Workbook::create();
    auto sheet = workbook->addSheet("Cover");
    auto other = workbook->addSheet("Calc");

    core::StylePtr bold = core::StyleBuilder().bold().build();
    sheet->setFormula(1, 1, "[Budget.xlsx]Sheet1!A1");
    sheet->setCellStyle(1, 1, bold);
    sheet->setFormula(2, 1, "SUM(B1:B3)");
    sheet->setValue(3, 1, std::string("=see [Budget.xlsx]"));   // 文本，不是公式
    other->setFormula(1, 1, "'[Other.xlsx]Data'!C3*2");
    other->setValue(2, 2, 42.0);

    auto stats = LinkSanitizer::sanitize(*workbook);

    EXPECT_EQ(stats.cells_scanned, 5u);
    EXPECT_EQ(stats.cells_cleared, 2u);

    EXPECT_TRUE(sheet->getCell(1, 1).isEmpty());
    EXPECT_EQ(sheet->getCell(1, 1).getStyle(), bold);
    EXPECT_TRUE(sheet->getCell(2, 1).isFormula());
    EXPECT_TRUE(sheet->getCell(3, 1).isString());
    EXPECT_TRUE(other->getCell(1, 1).isEmpty());
    EXPECT_DOUBLE_EQ(other->getCell(2, 2).getNumberValue(), 42.0);
}

TEST(LinkSanitizerTest, RemovesExternalDefinedNamesOnly) {
    auto workbook = core::Workbook::create();
    workbook->addSheet("Cover");
    auto& names = workbook->getDefinedNames();
    names.define(core::DefinedName("Rate", "Cover!$B$2"));
    names.define(core::DefinedName("Linked", "[1]Rates!$A$1"));
    names.define(core::DefinedName("Budget", "'[Budget.xlsx]Sheet1'!$C$3"));
    names.define(core::DefinedName("_xlnm.Print_Area", "Cover!$A$1:$C$10", "Cover"));

    EXPECT_TRUE(LinkSanitizer::isExternalDefinedName("[1]Rates!$A$1"));
    EXPECT_FALSE(LinkSanitizer::isExternalDefinedName("Cover!$B$2"));

    auto stats = LinkSanitizer::sanitize(*workbook);

    EXPECT_EQ(stats.names_removed, 2u);
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names.getAll()[0].name, "Rate");
    EXPECT_EQ(names.getAll()[1].scope, "Cover");
}
