#include "sheetbinder/summary/BatchRunner.hpp"
#include "sheetbinder/summary/ClientFileSet.hpp"
#include "sheetbinder/summary/RosterReader.hpp"
#include "sheetbinder/utils/ModuleLoggers.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace sheetbinder {
namespace summary {

std::vector<std::string> BatchReport::succeeded() const {
    std::vector<std::string> names;
    for (const auto& outcome : outcomes) {
        if (outcome.success) names.push_back(outcome.client);
    }
    return names;
}

std::vector<std::string> BatchReport::failed() const {
    std::vector<std::string> names;
    for (const auto& outcome : outcomes) {
        if (!outcome.success) names.push_back(outcome.client);
    }
    return names;
}

std::string BatchReport::format() const {
    if (outcomes.empty()) {
        return "No client summaries were created.\n";
    }

    std::string out = "SUMMARY:\n";
    const auto ok = succeeded();
    out += fmt::format("Successfully created summary files for {} clients:\n", ok.size());
    for (const auto& outcome : outcomes) {
        if (!outcome.success) continue;
        out += fmt::format("   - {} ({} tabs", outcome.output_path.filename(), outcome.tab_count);
        if (!outcome.skipped_files.empty()) {
            out += fmt::format(", {} files skipped", outcome.skipped_files.size());
        }
        out += ")\n";
    }

    const auto bad = failed();
    if (!bad.empty()) {
        out += fmt::format("Failed to create summary files for {} clients:\n", bad.size());
        for (const auto& outcome : outcomes) {
            if (outcome.success) continue;
            out += fmt::format("   - {}: [{}] {}\n", outcome.client, core::toString(outcome.error.code),
                               outcome.error.fullMessage());
        }
    }

    if (!unlisted_clients.empty()) {
        out += fmt::format("Skipped {} clients not in the roster\n", unlisted_clients.size());
    }
    return out;
}

core::Expected<BatchReport> BatchRunner::run(const SummaryOptions& options) {
    SUMMARY_INFO("Starting batch: template='{}', input='{}', output='{}'",
                 options.template_path, options.input_dir, options.output_dir);

    if (!core::Path(options.template_path).isFile()) {
        SUMMARY_ERROR("Template '{}' not found", options.template_path);
        return core::makeUnexpected<BatchReport>(core::ErrorCode::TemplateMissing,
                                                 "Template workbook not found", options.template_path);
    }

    BatchReport report;

    std::vector<std::string> roster;
    if (!options.roster_path.empty()) {
        auto listed = RosterReader::read(core::Path(options.roster_path), options.roster_column);
        if (listed) {
            roster = std::move(listed).value();
        } else {
            SUMMARY_WARN("Roster unavailable ({}), processing every client found", listed.error().fullMessage());
        }
        if (listed && roster.empty()) {
            SUMMARY_WARN("Roster lists no clients, processing every client found");
        }
    }

    auto files = ClientFileSet::discover(options);
    if (files.empty()) {
        SUMMARY_WARN("No client files found");
        return report;
    }

    auto groups = ClientFileSet::group(files);
    if (!roster.empty()) {
        report.roster_applied = true;
        for (auto it = groups.begin(); it != groups.end();) {
            if (std::find(roster.begin(), roster.end(), it->first) == roster.end()) {
                SUMMARY_INFO("Skipping '{}': not found in roster", it->first);
                report.unlisted_clients.push_back(it->first);
                it = groups.erase(it);
            } else {
                ++it;
            }
        }
        if (groups.empty()) {
            SUMMARY_WARN("No client files match the roster");
            return report;
        }
    }

    ClientSummaryBuilder builder(options);
    for (auto& [client, client_files] : groups) {
        report.outcomes.push_back(builder.build(client, std::move(client_files)));
    }

    SUMMARY_INFO("Batch finished: {} succeeded, {} failed",
                 report.succeeded().size(), report.failed().size());
    return report;
}

}} // namespace sheetbinder::summary
