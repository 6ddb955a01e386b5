#include "sheetbinder/SheetBinder.hpp"
#include <iostream>
#include <string>

namespace {

enum ExitCode {
    kExitOk = 0,
    kExitClientFailures = 1,
    kExitUsage = 2
};

struct CommandLine {
    sheetbinder::summary::SummaryOptions options;
    std::string log_file;                 // 为空表示不写日志文件
    std::string log_level = "info";
    bool quiet = false;
    bool help = false;
    bool pruned_overridden = false;
};

void printUsage(const char* program) {
    std::cout
        << "Usage: " << program << " [options]\n"
        << "\n"
        << "Build one <client>_summary.xlsx per client from the files in the input directory.\n"
        << "\n"
        << "Options:\n"
        << "  --template <path>      Template workbook (default: Template.xlsx)\n"
        << "  --input <dir>          Client file directory (default: client_portfolio)\n"
        << "  --output <dir>         Output directory (default: .)\n"
        << "  --roster <path>        Client roster workbook (default: account_list.xlsx)\n"
        << "  --no-roster            Process every client found, ignore the roster\n"
        << "  --template-tab <name>  Sheet that supplies the formatting (default: tab1)\n"
        << "  --prune <name>         Sheet removed from each summary, repeatable (default: Calculations)\n"
        << "  --log-file <path>      Also write the log to this file\n"
        << "  --log-level <level>    trace, debug, info, warn, error, critical, off (default: info)\n"
        << "  --quiet                No console logging, only the final report\n"
        << "  --help                 Show this help\n";
}

/**
 * @return 参数是否合法；出错时把原因写入 error
 */
bool parseCommandLine(int argc, char** argv, CommandLine& cmd, std::string& error) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        auto next = [&](std::string& target) {
            if (i + 1 >= argc) {
                error = "Missing value for " + arg;
                return false;
            }
            target = argv[++i];
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            cmd.help = true;
        } else if (arg == "--template") {
            if (!next(cmd.options.template_path)) return false;
        } else if (arg == "--input") {
            if (!next(cmd.options.input_dir)) return false;
        } else if (arg == "--output") {
            if (!next(cmd.options.output_dir)) return false;
        } else if (arg == "--roster") {
            if (!next(cmd.options.roster_path)) return false;
        } else if (arg == "--no-roster") {
            cmd.options.roster_path.clear();
        } else if (arg == "--template-tab") {
            if (!next(cmd.options.template_tab)) return false;
        } else if (arg == "--prune") {
            std::string sheet;
            if (!next(sheet)) return false;
            if (!cmd.pruned_overridden) {
                cmd.options.pruned_sheets.clear();
                cmd.pruned_overridden = true;
            }
            cmd.options.pruned_sheets.push_back(sheet);
        } else if (arg == "--log-file") {
            if (!next(cmd.log_file)) return false;
        } else if (arg == "--log-level") {
            if (!next(cmd.log_level)) return false;
        } else if (arg == "--quiet") {
            cmd.quiet = true;
        } else {
            error = "Unknown option: " + arg;
            return false;
        }
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    CommandLine cmd;
    std::string error;
    if (!parseCommandLine(argc, argv, cmd, error)) {
        std::cerr << error << "\n\n";
        printUsage(argv[0]);
        return kExitUsage;
    }
    if (cmd.help) {
        printUsage(argv[0]);
        return kExitOk;
    }

    auto level = sheetbinder::Logger::parseLevel(cmd.log_level, sheetbinder::Logger::Level::INFO);
    if (!sheetbinder::initialize(cmd.log_file, level, !cmd.quiet)) {
        return kExitUsage;
    }

    auto result = sheetbinder::summary::BatchRunner::run(cmd.options);
    if (!result) {
        std::cerr << "Error: " << result.error().fullMessage() << std::endl;
        sheetbinder::cleanup();
        return kExitUsage;
    }

    const auto& report = result.value();
    std::cout << report.format();
    if (!report.empty()) {
        std::cout << "External links have been removed from every summary." << std::endl;
    }

    sheetbinder::cleanup();
    return report.allSucceeded() ? kExitOk : kExitClientFailures;
}
