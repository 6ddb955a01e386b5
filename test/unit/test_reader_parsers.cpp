#include "sheetbinder/core/SharedFormula.hpp"
#include "sheetbinder/core/Worksheet.hpp"
#include "sheetbinder/reader/WorkbookParser.hpp"
#include "sheetbinder/reader/WorksheetParser.hpp"
#include "sheetbinder/utils/TimeUtils.hpp"
#include <gtest/gtest.h>

using namespace sheetbinder;

namespace {

const char* kSheetHeader =
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
    "<worksheet xmlns=\"http://schemas.openxmlformats.org/spreadsheetml/2006/main\"><sheetData>";
const char* kSheetFooter = "</sheetData></worksheet>";

bool parseSheet(const std::string& rows, core::Worksheet& sheet) {
    static const std::vector<std::string> shared_strings;
    static const std::vector<core::StylePtr> styles{nullptr};
    reader::WorksheetParser parser;
    return parser.parse(kSheetHeader + rows + kSheetFooter, sheet, shared_strings, styles);
}

} // namespace

TEST(SharedFormulaTest, AdjustsRelativeReferencesOnly) {
    using core::SharedFormula;
    EXPECT_EQ(SharedFormula::adjustFormula("B1*C1", 2, 0), "B3*C3");
    EXPECT_EQ(SharedFormula::adjustFormula("$B$1+B$1+$B1", 1, 1), "$B$1+C$1+$B2");
    EXPECT_EQ(SharedFormula::adjustFormula("SUM(A1:A3)/LOG10(A1)", 0, 1), "SUM(B1:B3)/LOG10(B1)");
    EXPECT_EQ(SharedFormula::adjustFormula("'Q1 A1'!A1&\"A1\"", 1, 0), "'Q1 A1'!A2&\"A1\"");
    // 移出表格范围的引用保持原样
    EXPECT_EQ(SharedFormula::adjustFormula("A1", -1, 0), "A1");
}

TEST(WorksheetParserTest, SharedFormulaDependentsGetOwnText) {
    core::Worksheet sheet("Data");
    ASSERT_TRUE(parseSheet(
        "<row r=\"1\"><c r=\"C1\"><f t=\"shared\" ref=\"C1:C3\" si=\"0\">A1*B1</f><v>2</v></c></row>"
        "<row r=\"2\"><c r=\"C2\"><f t=\"shared\" si=\"0\"/><v>6</v></c></row>"
        "<row r=\"3\"><c r=\"C3\"><f t=\"shared\" si=\"0\"/><v>12</v></c></row>"
        "<row r=\"4\"><c r=\"C4\"><f t=\"shared\" si=\"7\"/><v>5</v></c></row>",
        sheet));

    ASSERT_TRUE(sheet.getCell(2, 3).isFormula());
    EXPECT_EQ(sheet.getCell(2, 3).getFormula(), "A2*B2");
    EXPECT_DOUBLE_EQ(sheet.getCell(2, 3).getNumberValue(), 6.0);
    EXPECT_EQ(sheet.getCell(3, 3).getFormula(), "A3*B3");

    // 未定义的 si 只保留缓存值
    EXPECT_FALSE(sheet.getCell(4, 3).isFormula());
    EXPECT_DOUBLE_EQ(sheet.getCell(4, 3).getNumberValue(), 5.0);
}

TEST(WorksheetParserTest, IsoDateCellsBecomeDates) {
    core::Worksheet sheet("Data");
    ASSERT_TRUE(parseSheet(
        "<row r=\"1\"><c r=\"A1\" t=\"d\"><v>2024-01-31T00:00:00</v></c>"
        "<c r=\"B1\" t=\"d\"><v>2024-01-31T12:00:00Z</v></c>"
        "<c r=\"C1\" t=\"d\"><v>not a date</v></c></row>",
        sheet));

    const auto& a1 = sheet.getCell(1, 1);
    ASSERT_TRUE(a1.isDate());
    EXPECT_DOUBLE_EQ(a1.getNumberValue(), utils::TimeUtils::dateToExcelSerial(utils::CivilDate{2024, 1, 31}));
    EXPECT_DOUBLE_EQ(sheet.getCell(1, 2).getNumberValue(), a1.getNumberValue() + 0.5);
    EXPECT_TRUE(sheet.getCell(1, 3).isString());
}

TEST(WorkbookParserTest, ReadsSheetStateAndDefinedNames) {
    reader::WorkbookParser parser;
    ASSERT_TRUE(parser.parse(
        "<workbook xmlns=\"http://schemas.openxmlformats.org/spreadsheetml/2006/main\" "
        "xmlns:r=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships\">"
        "<sheets><sheet name=\"Cover\" sheetId=\"1\" r:id=\"rId1\"/>"
        "<sheet name=\"Lookup\" sheetId=\"2\" state=\"hidden\" r:id=\"rId2\"/></sheets>"
        "<definedNames><definedName name=\"Rate\">Lookup!$B$2</definedName>"
        "<definedName name=\"_xlnm.Print_Area\" localSheetId=\"0\" hidden=\"1\">Cover!$A$1:$C$9</definedName>"
        "</definedNames></workbook>"));

    ASSERT_EQ(parser.getSheets().size(), 2u);
    EXPECT_EQ(parser.getSheets()[1].state, "hidden");

    const auto& names = parser.getDefinedNames();
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0].name, "Rate");
    EXPECT_EQ(names[0].formula, "Lookup!$B$2");
    EXPECT_EQ(names[0].local_sheet_id, -1);
    EXPECT_EQ(names[1].local_sheet_id, 0);
    EXPECT_TRUE(names[1].hidden);
}

TEST(TimeUtilsTest, IsoDateTimeConversion) {
    using utils::TimeUtils;
    EXPECT_DOUBLE_EQ(TimeUtils::isoToExcelSerial("2024-01-01").value_or(-1.0), 45292.0);
    EXPECT_DOUBLE_EQ(TimeUtils::isoToExcelSerial("2024-01-01T06:00").value_or(-1.0), 45292.25);
    EXPECT_FALSE(TimeUtils::isoToExcelSerial("2024-02-30").has_value());
    EXPECT_FALSE(TimeUtils::isoToExcelSerial("2024-01-01 06:00").has_value());
    EXPECT_FALSE(TimeUtils::isoToExcelSerial("12:00:00").has_value());
}
