#include "sheetbinder/core/Workbook.hpp"
#include "sheetbinder/summary/ClientSummaryBuilder.hpp"
#include "sheetbinder/utils/TimeUtils.hpp"
#include "support/TempDirTest.hpp"
#include <fstream>

using namespace sheetbinder;
using summary::BuildState;
using summary::ClientSummaryBuilder;

class ClientSummaryTest : public test::TempDirTest {
protected:
    void SetUp() override {
        test::TempDirTest::SetUp();
        options.template_path = path("Template.xlsx").string();
        options.input_dir = path("client_portfolio").string();
        options.output_dir = path("out").string();
        options.roster_path.clear();
        ASSERT_TRUE(path("client_portfolio").createDirectories());
    }

    core::Path input(const std::string& name) const {
        return path("client_portfolio/" + name);
    }

    summary::SummaryOptions options;
};

// 原生日期单元格决定标签；落在无日期格式的模板样式上时按 yyyy-mm-dd 写出
TEST_F(ClientSummaryTest, NativeDateCellNamesTabAndKeepsDateFormat) {
    test::writeTemplateWorkbook(core::Path(options.template_path));
    const double feb_first = utils::TimeUtils::dateToExcelSerial(utils::CivilDate{2024, 2, 1});
    {
        auto workbook = core::Workbook::create();
        auto sheet = workbook->addSheet("Data");
        sheet->setDate(1, 1, feb_first);
        sheet->setValue(2, 2, 300.0);
        ASSERT_EQ(workbook->save(input("Acme_Q1.xlsx")), core::ErrorCode::Ok);
    }

    ClientSummaryBuilder builder(options);
    auto outcome = builder.build("Acme", {input("Acme_Q1.xlsx")});
    ASSERT_TRUE(outcome.success) << outcome.error.fullMessage();
    ASSERT_EQ(outcome.tab_names.size(), 1u);
    EXPECT_EQ(outcome.tab_names[0], "20240201");

    auto result = core::Workbook::open(outcome.output_path);
    auto tab = result->getSheet("20240201");
    ASSERT_NE(tab, nullptr);

    const auto& a1 = tab->getCell(1, 1);
    ASSERT_TRUE(a1.isDate());
    EXPECT_DOUBLE_EQ(a1.getNumberValue(), feb_first);
    ASSERT_TRUE(a1.hasStyle());
    EXPECT_TRUE(a1.getStyle()->getFont().bold);
    EXPECT_EQ(a1.getStyle()->getNumberFormat().code, "yyyy-mm-dd");
    EXPECT_DOUBLE_EQ(tab->getCell(2, 2).getNumberValue(), 300.0);
}

// 两个数据文件生成 [Cover, tab1, 20240101, 20240201]
TEST_F(ClientSummaryTest, AcmeEndToEnd) {
    test::writeTemplateWorkbook(core::Path(options.template_path));
    // 文件日期与表内日期都存在时表内日期优先
    test::writeDataWorkbook(input("Acme_20240201.xlsx"), "2024-02-01", 200.0);
    test::writeDataWorkbook(input("Acme_20240101.xlsx"), "Holdings", 100.0);

    ClientSummaryBuilder builder(options);
    auto outcome = builder.build("Acme", {input("Acme_20240201.xlsx"), input("Acme_20240101.xlsx")});

    ASSERT_TRUE(outcome.success) << outcome.error.fullMessage();
    EXPECT_EQ(outcome.state, BuildState::Saved);
    EXPECT_EQ(outcome.tab_count, 2u);
    EXPECT_TRUE(outcome.skipped_files.empty());
    EXPECT_EQ(outcome.output_path.filename(), "Acme_summary.xlsx");

    auto result = core::Workbook::open(outcome.output_path);
    std::vector<std::string> expected = {"Cover", "tab1", "20240101", "20240201"};
    EXPECT_EQ(result->getSheetNames(), expected);

    auto jan = result->getSheet("20240101");
    auto tab1 = result->getSheet("tab1");
    EXPECT_EQ(jan->getColumnWidths(), tab1->getColumnWidths());
    EXPECT_DOUBLE_EQ(*jan->tryGetColumnWidth(2), 15.0);
    EXPECT_EQ(jan->getMergeRanges(), tab1->getMergeRanges());

    // 数据值覆盖在模板样式之上
    EXPECT_EQ(jan->getCell(1, 1).getStringValue(), "Holdings");
    ASSERT_TRUE(jan->getCell(1, 1).hasStyle());
    EXPECT_TRUE(jan->getCell(1, 1).getStyle()->getFont().bold);
    EXPECT_DOUBLE_EQ(jan->getCell(2, 2).getNumberValue(), 100.0);
    EXPECT_EQ(jan->getCell(2, 2).getStyle()->getNumberFormat().code, "#,##0.00");

    auto feb = result->getSheet("20240201");
    EXPECT_EQ(feb->getCell(1, 1).getStringValue(), "2024-02-01");
    EXPECT_DOUBLE_EQ(feb->getCell(2, 2).getNumberValue(), 200.0);

    // 模板工作表本身不变
    EXPECT_EQ(tab1->getCell(1, 1).getStringValue(), "Header");
}

TEST_F(ClientSummaryTest, SameDateGetsSuffixedLabel) {
    test::writeTemplateWorkbook(core::Path(options.template_path));
    test::writeDataWorkbook(input("Acme_a.xlsx"), "2024-01-01", 1.0);
    test::writeDataWorkbook(input("Acme_b.xlsx"), "01/01/2024", 2.0);

    ClientSummaryBuilder builder(options);
    auto outcome = builder.build("Acme", {input("Acme_a.xlsx"), input("Acme_b.xlsx")});

    ASSERT_TRUE(outcome.success);
    std::vector<std::string> tabs = {"20240101", "20240101_1"};
    EXPECT_EQ(outcome.tab_names, tabs);
}

TEST_F(ClientSummaryTest, UnreadableFileIsSkipped) {
    test::writeTemplateWorkbook(core::Path(options.template_path));
    test::writeDataWorkbook(input("Acme_20240101.xlsx"), "Holdings", 1.0);
    {
        std::ofstream out(input("Acme_20240301.xls").string(), std::ios::binary);
        out << "\xD0\xCF\x11\xE0 legacy";
    }

    ClientSummaryBuilder builder(options);
    auto outcome = builder.build("Acme", {input("Acme_20240101.xlsx"), input("Acme_20240301.xls")});

    ASSERT_TRUE(outcome.success);
    EXPECT_EQ(outcome.tab_count, 1u);
    ASSERT_EQ(outcome.skipped_files.size(), 1u);
    EXPECT_EQ(outcome.skipped_files[0].path.filename(), "Acme_20240301.xls");
    EXPECT_EQ(outcome.skipped_files[0].error.code, core::ErrorCode::FileReadFailure);

    auto result = core::Workbook::open(outcome.output_path);
    std::vector<std::string> expected = {"Cover", "tab1", "20240101"};
    EXPECT_EQ(result->getSheetNames(), expected);
}

TEST_F(ClientSummaryTest, ExternalLinksAndPrunedSheetsAreGone) {
    {
        auto workbook = core::Workbook::create();
        auto cover = workbook->addSheet("Cover");
        cover->setFormula(1, 1, "[Budget.xlsx]Sheet1!A1", 5.0);
        cover->setFormula(2, 1, "SUM(B1:B2)", 3.0);
        workbook->addSheet("tab1");
        workbook->addSheet("Calculations");
        ASSERT_EQ(workbook->save(core::Path(options.template_path)), core::ErrorCode::Ok);
    }
    test::writeDataWorkbook(input("Acme_20240101.xlsx"), "x", 1.0);

    ClientSummaryBuilder builder(options);
    auto outcome = builder.build("Acme", {input("Acme_20240101.xlsx")});
    ASSERT_TRUE(outcome.success);

    auto result = core::Workbook::open(outcome.output_path);
    EXPECT_FALSE(result->hasSheet("Calculations"));
    auto cover = result->getSheet("Cover");
    EXPECT_TRUE(cover->getCell(1, 1).isEmpty());
    EXPECT_TRUE(cover->getCell(2, 1).isFormula());
}

TEST_F(ClientSummaryTest, MissingTemplateTabFailsClient) {
    {
        auto workbook = core::Workbook::create();
        workbook->addSheet("Cover");
        ASSERT_EQ(workbook->save(core::Path(options.template_path)), core::ErrorCode::Ok);
    }
    test::writeDataWorkbook(input("Acme_20240101.xlsx"), "x", 1.0);

    ClientSummaryBuilder builder(options);
    auto outcome = builder.build("Acme", {input("Acme_20240101.xlsx")});

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.state, BuildState::Failed);
    EXPECT_EQ(outcome.error.code, core::ErrorCode::TemplateTabMissing);
    EXPECT_FALSE(outcome.output_path.exists());
}

TEST_F(ClientSummaryTest, MissingTemplateFailsClient) {
    ClientSummaryBuilder builder(options);
    auto outcome = builder.build("Acme", {});

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error.code, core::ErrorCode::TemplateMissing);
}

TEST_F(ClientSummaryTest, NoFilesStillProducesTemplateCopy) {
    test::writeTemplateWorkbook(core::Path(options.template_path));

    ClientSummaryBuilder builder(options);
    auto outcome = builder.build("Empty", {});

    ASSERT_TRUE(outcome.success);
    EXPECT_EQ(outcome.tab_count, 0u);
    auto result = core::Workbook::open(outcome.output_path);
    std::vector<std::string> expected = {"Cover", "tab1"};
    EXPECT_EQ(result->getSheetNames(), expected);
}
