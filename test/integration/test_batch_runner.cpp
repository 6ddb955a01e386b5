#include "sheetbinder/core/Workbook.hpp"
#include "sheetbinder/summary/BatchRunner.hpp"
#include "sheetbinder/summary/RosterReader.hpp"
#include "support/TempDirTest.hpp"

using namespace sheetbinder;
using summary::BatchRunner;
using summary::RosterReader;

class BatchRunnerTest : public test::TempDirTest {
protected:
    void SetUp() override {
        test::TempDirTest::SetUp();
        options.template_path = path("Template.xlsx").string();
        options.input_dir = path("client_portfolio").string();
        options.output_dir = path("out").string();
        options.roster_path = path("account_list.xlsx").string();
        ASSERT_TRUE(path("client_portfolio").createDirectories());
    }

    void writeRoster(const std::vector<std::string>& clients) {
        auto workbook = core::Workbook::create();
        auto sheet = workbook->addSheet("Accounts");
        sheet->setValue(1, 1, std::string("Id"));
        sheet->setValue(1, 2, std::string("Client"));
        int row = 2;
        for (const auto& client : clients) {
            sheet->setValue(row, 1, static_cast<double>(row));
            sheet->setValue(row, 2, client);
            ++row;
        }
        ASSERT_EQ(workbook->save(core::Path(options.roster_path)), core::ErrorCode::Ok);
    }

    core::Path input(const std::string& name) const {
        return path("client_portfolio/" + name);
    }

    summary::SummaryOptions options;
};

TEST_F(BatchRunnerTest, RosterReaderCollectsUniqueValues) {
    writeRoster({"Acme", "Beta", "Acme", ""});

    auto roster = RosterReader::read(core::Path(options.roster_path), "Client");
    ASSERT_TRUE(roster.hasValue()) << roster.error().fullMessage();
    std::vector<std::string> expected = {"Acme", "Beta"};
    EXPECT_EQ(roster.value(), expected);

    auto ids = RosterReader::read(core::Path(options.roster_path), "Id");
    ASSERT_TRUE(ids.hasValue());
    EXPECT_EQ(ids.value().front(), "2");

    auto missing_column = RosterReader::read(core::Path(options.roster_path), "Account");
    ASSERT_FALSE(missing_column.hasValue());
    EXPECT_EQ(missing_column.error().code, core::ErrorCode::RosterUnavailable);

    auto missing_file = RosterReader::read(path("nope.xlsx"), "Client");
    EXPECT_EQ(missing_file.error().code, core::ErrorCode::RosterUnavailable);
}

TEST_F(BatchRunnerTest, RosterFiltersClients) {
    test::writeTemplateWorkbook(core::Path(options.template_path));
    writeRoster({"Acme"});
    test::writeDataWorkbook(input("Acme_20240101.xlsx"), "x", 1.0);
    test::writeDataWorkbook(input("Zeta_20240101.xlsx"), "x", 1.0);

    auto report = BatchRunner::run(options);
    ASSERT_TRUE(report.hasValue());

    EXPECT_TRUE(report->roster_applied);
    std::vector<std::string> ok = {"Acme"};
    EXPECT_EQ(report->succeeded(), ok);
    EXPECT_TRUE(report->failed().empty());
    std::vector<std::string> unlisted = {"Zeta"};
    EXPECT_EQ(report->unlisted_clients, unlisted);

    EXPECT_TRUE(path("out/Acme_summary.xlsx").exists());
    EXPECT_FALSE(path("out/Zeta_summary.xlsx").exists());
    EXPECT_NE(report->format().find("Acme_summary.xlsx"), std::string::npos);
}

TEST_F(BatchRunnerTest, MissingRosterProcessesEveryClient) {
    test::writeTemplateWorkbook(core::Path(options.template_path));
    test::writeDataWorkbook(input("Acme_20240101.xlsx"), "x", 1.0);
    test::writeDataWorkbook(input("Beta_20240101.xlsx"), "x", 1.0);

    auto report = BatchRunner::run(options);
    ASSERT_TRUE(report.hasValue());
    EXPECT_FALSE(report->roster_applied);
    std::vector<std::string> ok = {"Acme", "Beta"};
    EXPECT_EQ(report->succeeded(), ok);
}

TEST_F(BatchRunnerTest, FailedClientDoesNotStopBatch) {
    {
        auto workbook = core::Workbook::create();
        workbook->addSheet("Cover");
        ASSERT_EQ(workbook->save(core::Path(options.template_path)), core::ErrorCode::Ok);
    }
    options.roster_path.clear();
    test::writeDataWorkbook(input("Acme_20240101.xlsx"), "x", 1.0);
    test::writeDataWorkbook(input("Beta_20240101.xlsx"), "x", 1.0);

    auto report = BatchRunner::run(options);
    ASSERT_TRUE(report.hasValue());
    std::vector<std::string> failed = {"Acme", "Beta"};
    EXPECT_EQ(report->failed(), failed);
    EXPECT_FALSE(report->allSucceeded());
    EXPECT_NE(report->format().find("Template tab missing"), std::string::npos);
}

TEST_F(BatchRunnerTest, MissingTemplateStopsBatch) {
    test::writeDataWorkbook(input("Acme_20240101.xlsx"), "x", 1.0);

    auto report = BatchRunner::run(options);
    ASSERT_FALSE(report.hasValue());
    EXPECT_EQ(report.error().code, core::ErrorCode::TemplateMissing);
}

TEST_F(BatchRunnerTest, NoInputFilesGivesEmptyReport) {
    test::writeTemplateWorkbook(core::Path(options.template_path));
    options.roster_path.clear();

    auto report = BatchRunner::run(options);
    ASSERT_TRUE(report.hasValue());
    EXPECT_TRUE(report->empty());
    EXPECT_TRUE(report->allSucceeded());
}
