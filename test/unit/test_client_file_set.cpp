#include "sheetbinder/summary/ClientFileSet.hpp"
#include "support/TempDirTest.hpp"
#include <fstream>

using namespace sheetbinder;
using summary::ClientFileSet;

class ClientFileSetTest : public test::TempDirTest {
protected:
    void touch(const std::string& name) {
        std::ofstream out(path(name).string());
        out << "x";
    }
};

TEST(ClientFileNameTest, ClientAndDateToken) {
    core::Path acme("client_portfolio/Acme_20240101.xlsx");
    EXPECT_EQ(ClientFileSet::clientNameOf(acme), "Acme");
    EXPECT_EQ(ClientFileSet::dateTokenOf(acme), "20240101");

    core::Path multi("Big_Corp_Ltd_2024Q1.xlsm");
    EXPECT_EQ(ClientFileSet::clientNameOf(multi), "Big_Corp_Ltd");
    EXPECT_EQ(ClientFileSet::dateTokenOf(multi), "2024Q1");

    core::Path plain("Solo.xlsx");
    EXPECT_EQ(ClientFileSet::clientNameOf(plain), "Solo");
    EXPECT_EQ(ClientFileSet::dateTokenOf(plain), "");
}

TEST_F(ClientFileSetTest, DiscoverFiltersExtensionsAndTempFiles) {
    touch("Acme_20240201.xlsx");
    touch("Acme_20240101.XLSX");
    touch("Beta_20240101.xls");
    touch("Gamma_20240101.xlsm");
    touch("~$Acme_20240101.xlsx");
    touch("notes.txt");

    summary::SummaryOptions options;
    options.input_dir = dir();
    auto files = ClientFileSet::discover(options);

    std::vector<std::string> names;
    for (const auto& file : files) names.push_back(file.filename());
    std::vector<std::string> expected = {"Acme_20240101.XLSX", "Acme_20240201.xlsx",
                                         "Beta_20240101.xls", "Gamma_20240101.xlsm"};
    EXPECT_EQ(names, expected);
}

TEST_F(ClientFileSetTest, MissingDirectoryYieldsNothing) {
    summary::SummaryOptions options;
    options.input_dir = path("does_not_exist").string();
    EXPECT_TRUE(ClientFileSet::discover(options).empty());
}

TEST(ClientFileGroupTest, GroupsByClientInNameOrder) {
    std::vector<core::Path> paths = {core::Path("in/Zeta_1.xlsx"), core::Path("in/Acme_2.xlsx"),
                                     core::Path("in/Acme_1.xlsx")};
    auto groups = ClientFileSet::group(paths);

    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups.begin()->first, "Acme");
    EXPECT_EQ(groups["Acme"].size(), 2u);
    EXPECT_EQ(groups["Zeta"].size(), 1u);
}

TEST(ClientFileGroupTest, SortByDateTokenIsStable) {
    std::vector<core::Path> paths = {core::Path("b/Acme_20240301.xlsx"), core::Path("Acme.xlsx"),
                                     core::Path("a/Acme_20240101.xlsx"), core::Path("c/Acme_20240101.xlsm")};
    ClientFileSet::sortByDateToken(paths);

    EXPECT_EQ(paths[0].string(), "Acme.xlsx");
    EXPECT_EQ(paths[1].string(), "a/Acme_20240101.xlsx");
    EXPECT_EQ(paths[2].string(), "c/Acme_20240101.xlsm");
    EXPECT_EQ(paths[3].string(), "b/Acme_20240301.xlsx");
}
