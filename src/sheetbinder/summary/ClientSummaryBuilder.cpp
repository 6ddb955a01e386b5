#include "sheetbinder/summary/ClientSummaryBuilder.hpp"
#include "sheetbinder/core/Exception.hpp"
#include "sheetbinder/core/Workbook.hpp"
#include "sheetbinder/summary/ClientFileSet.hpp"
#include "sheetbinder/summary/DateResolver.hpp"
#include "sheetbinder/summary/FormatTransplanter.hpp"
#include "sheetbinder/summary/LinkSanitizer.hpp"
#include "sheetbinder/summary/TabLabelAllocator.hpp"
#include "sheetbinder/utils/ModuleLoggers.hpp"
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace sheetbinder {
namespace summary {

const char* toString(BuildState state) noexcept {
    switch (state) {
        case BuildState::Init:           return "Init";
        case BuildState::TemplateCopied: return "TemplateCopied";
        case BuildState::Sanitized:      return "Sanitized";
        case BuildState::SheetsPruned:   return "SheetsPruned";
        case BuildState::IteratingFiles: return "IteratingFiles";
        case BuildState::Saved:          return "Saved";
        case BuildState::Failed:         return "Failed";
    }
    return "Unknown";
}

ClientSummaryBuilder::ClientSummaryBuilder(SummaryOptions options)
    : options_(std::move(options)) {
}

core::Path ClientSummaryBuilder::outputPathFor(const std::string& client) const {
    return core::Path(options_.output_dir) / (client + options_.summary_suffix + options_.output_extension);
}

ClientOutcome& ClientSummaryBuilder::fail(ClientOutcome& outcome, core::Error error) const {
    SUMMARY_ERROR("Client '{}' failed in state {}: {}", outcome.client, toString(outcome.state),
                  error.fullMessage());
    outcome.success = false;
    outcome.error = std::move(error);
    outcome.state = BuildState::Failed;
    return outcome;
}

ClientOutcome ClientSummaryBuilder::build(const std::string& client, std::vector<core::Path> files) const {
    ClientOutcome outcome;
    outcome.client = client;
    outcome.output_path = outputPathFor(client);

    SUMMARY_INFO("Building summary for client '{}' ({} files)", client, files.size());

    // Init -> TemplateCopied
    core::Path template_path(options_.template_path);
    if (!template_path.isFile()) {
        return fail(outcome, core::makeError(core::ErrorCode::TemplateMissing,
                                             "Template workbook not found", template_path.string()));
    }
    core::Path output_dir(options_.output_dir);
    if (!output_dir.createDirectories() || !template_path.copyTo(outcome.output_path, true)) {
        return fail(outcome, core::makeError(core::ErrorCode::PersistFailure,
                                             "Cannot copy template to output", outcome.output_path.string()));
    }

    std::unique_ptr<core::Workbook> summary;
    try {
        summary = core::Workbook::open(outcome.output_path);
    } catch (const core::SheetBinderException& e) {
        outcome.output_path.remove();
        return fail(outcome, e.toError());
    }
    outcome.state = BuildState::TemplateCopied;

    // TemplateCopied -> Sanitized
    LinkSanitizer::sanitize(*summary);
    outcome.state = BuildState::Sanitized;

    // Sanitized -> SheetsPruned
    for (const auto& name : options_.pruned_sheets) {
        if (summary->removeSheet(name)) {
            SUMMARY_INFO("Removed sheet '{}'", name);
        }
    }
    outcome.state = BuildState::SheetsPruned;

    auto template_sheet = summary->getSheet(options_.template_tab);
    if (!template_sheet) {
        outcome.output_path.remove();
        return fail(outcome, core::makeError(core::ErrorCode::TemplateTabMissing,
                                             fmt::format("Sheet '{}' not found in template", options_.template_tab),
                                             fmt::format("available: {}", fmt::join(summary->getSheetNames(), ", "))));
    }

    // IteratingFiles
    outcome.state = BuildState::IteratingFiles;
    ClientFileSet::sortByDateToken(files);
    for (const auto& file : files) {
        SUMMARY_INFO("Processing file '{}'", file.filename());
        auto label = appendFile(*summary, *template_sheet, file);
        if (label) {
            SUMMARY_INFO("Created tab '{}'", label.value());
            outcome.tab_names.push_back(label.value());
            ++outcome.tab_count;
        } else {
            SUMMARY_WARN("Skipping '{}': {}", file.string(), label.error().fullMessage());
            outcome.skipped_files.push_back({file, label.error()});
        }
    }

    // IteratingFiles -> Saved
    core::ErrorCode rc = summary->save(outcome.output_path);
    if (rc != core::ErrorCode::Ok) {
        return fail(outcome, core::makeError(core::ErrorCode::PersistFailure,
                                             fmt::format("Saving summary failed: {}", core::toString(rc)),
                                             outcome.output_path.string()));
    }

    outcome.state = BuildState::Saved;
    outcome.success = true;
    SUMMARY_INFO("Created '{}' with {} data tabs", outcome.output_path.string(), outcome.tab_count);
    return outcome;
}

core::Expected<std::string> ClientSummaryBuilder::appendFile(core::Workbook& summary,
                                                             const core::Worksheet& template_sheet,
                                                             const core::Path& file) const {
    try {
        auto data = core::Workbook::open(file);
        auto data_sheet = data->getActiveWorksheet();
        if (!data_sheet) {
            return core::makeUnexpected<std::string>(core::ErrorCode::FileReadFailure,
                                                     "Workbook has no worksheet", file.string());
        }

        const std::string label = TabLabelAllocator::allocate(desiredLabel(*data_sheet, file),
                                                              summary.getSheetNames(),
                                                              options_.max_label_length);
        FormatTransplanter::transplant(summary, template_sheet, *data_sheet, label);
        return label;
    } catch (const core::SheetBinderException& e) {
        return core::makeUnexpected<std::string>(core::ErrorCode::FileReadFailure, e.what(), file.string());
    } catch (const std::exception& e) {
        return core::makeUnexpected<std::string>(core::ErrorCode::FileReadFailure,
                                                 fmt::format("Unexpected error: {}", e.what()), file.string());
    }
}

std::string ClientSummaryBuilder::desiredLabel(const core::Worksheet& data_sheet, const core::Path& file) const {
    if (auto date = DateResolver::resolve(data_sheet, options_.date_scan_rows, options_.date_scan_cols)) {
        SUMMARY_DEBUG("Found date in sheet: {}", *date);
        return *date;
    }

    std::string token = ClientFileSet::dateTokenOf(file);
    if (!token.empty()) {
        SUMMARY_DEBUG("Using filename date: {}", token);
        return token;
    }
    return file.stem();
}

}} // namespace sheetbinder::summary
