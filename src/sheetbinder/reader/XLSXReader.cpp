#include "sheetbinder/reader/XLSXReader.hpp"
#include "sheetbinder/reader/WorkbookParser.hpp"
#include "sheetbinder/reader/SharedStringsParser.hpp"
#include "sheetbinder/reader/StylesParser.hpp"
#include "sheetbinder/reader/WorksheetParser.hpp"
#include "sheetbinder/core/Exception.hpp"
#include "sheetbinder/utils/ModuleLoggers.hpp"
#include <fmt/format.h>
#include <algorithm>

namespace sheetbinder {
namespace reader {

XLSXReader::XLSXReader(const core::Path& path)
    : path_(path)
    , zip_reader_(std::make_unique<archive::ZipReader>(path)) {
}

XLSXReader::~XLSXReader() {
    close();
}

core::ErrorCode XLSXReader::open() {
    if (is_open_) {
        return core::ErrorCode::Ok;
    }

    if (!zip_reader_->open()) {
        READER_ERROR("Cannot open XLSX file (not a ZIP package?): {}", path_.string());
        return core::ErrorCode::FileCorrupted;
    }

    core::ErrorCode result = locateWorkbookPart();
    if (result != core::ErrorCode::Ok) {
        zip_reader_->close();
        return result;
    }

    is_open_ = true;
    READER_DEBUG("Opened XLSX file: {} (workbook part {})", path_.string(), workbook_path_);
    return core::ErrorCode::Ok;
}

core::ErrorCode XLSXReader::close() {
    if (is_open_) {
        zip_reader_->close();
        is_open_ = false;
    }
    return core::ErrorCode::Ok;
}

core::ErrorCode XLSXReader::loadWorkbook(std::unique_ptr<core::Workbook>& workbook) {
    if (!is_open_) {
        return core::ErrorCode::InvalidArgument;
    }

    std::string workbook_xml;
    core::ErrorCode result = extractPart(workbook_path_, workbook_xml);
    if (result != core::ErrorCode::Ok) {
        return result;
    }

    WorkbookParser workbook_parser;
    if (!workbook_parser.parse(workbook_xml)) {
        READER_ERROR("Failed to parse {}: {}", workbook_path_, workbook_parser.getErrorMessage());
        return core::ErrorCode::XmlParseError;
    }

    result = parseWorkbookRelationships();
    if (result != core::ErrorCode::Ok) {
        return result;
    }

    auto loaded = core::Workbook::create();

    result = parseStylesXML(*loaded);
    if (result != core::ErrorCode::Ok) {
        return result;
    }
    result = parseSharedStringsXML();
    if (result != core::ErrorCode::Ok) {
        return result;
    }
    parseThemeXML(*loaded);

    const std::string base_dir = workbookDirectory();
    size_t active_tab = workbook_parser.getActiveTab();
    size_t skipped_before_active = 0;

    const auto& sheets = workbook_parser.getSheets();
    for (size_t i = 0; i < sheets.size(); ++i) {
        const auto& info = sheets[i];
        const auto* rel = workbook_rels_.findById(info.rel_id);
        if (!rel) {
            READER_ERROR("Sheet '{}' references missing relationship {}", info.name, info.rel_id);
            return core::ErrorCode::InvalidWorkbook;
        }

        // 图表工作表等非普通工作表不进入模型
        if (rel->type.size() < 10 || rel->type.compare(rel->type.size() - 10, 10, "/worksheet") != 0) {
            READER_WARN("Skipping non-worksheet sheet '{}' ({})", info.name, rel->type);
            if (i < active_tab) ++skipped_before_active;
            continue;
        }

        std::shared_ptr<core::Worksheet> worksheet;
        try {
            worksheet = loaded->addSheet(info.name);
        } catch (const core::WorksheetException& e) {
            READER_ERROR("Cannot add sheet '{}': {}", info.name, e.what());
            return core::ErrorCode::InvalidWorksheet;
        }

        if (info.state == "hidden") {
            worksheet->setState(core::SheetState::Hidden);
        } else if (info.state == "veryHidden") {
            worksheet->setState(core::SheetState::VeryHidden);
        }

        result = parseWorksheetXML(resolvePartPath(base_dir, rel->target), *worksheet);
        if (result != core::ErrorCode::Ok) {
            return result;
        }
    }

    // localSheetId 指向 <sheets> 中的下标，转换为工作表名
    for (const auto& info : workbook_parser.getDefinedNames()) {
        core::DefinedName defined_name(info.name, info.formula);
        defined_name.hidden = info.hidden;
        if (info.local_sheet_id >= 0) {
            if (static_cast<size_t>(info.local_sheet_id) >= sheets.size() ||
                !loaded->getSheet(sheets[static_cast<size_t>(info.local_sheet_id)].name)) {
                READER_WARN("Skipping defined name '{}' scoped to unknown sheet {}", info.name, info.local_sheet_id);
                continue;
            }
            defined_name.scope = sheets[static_cast<size_t>(info.local_sheet_id)].name;
        }
        loaded->getDefinedNames().define(defined_name);
    }

    if (loaded->getSheetCount() == 0) {
        READER_ERROR("Workbook has no worksheets: {}", path_.string());
        return core::ErrorCode::InvalidWorkbook;
    }

    active_tab -= std::min(active_tab, skipped_before_active);
    if (active_tab >= loaded->getSheetCount()) {
        active_tab = 0;
    }
    loaded->setActiveWorksheet(active_tab);

    READER_INFO("Loaded {} ({} sheets)", path_.string(), loaded->getSheetCount());
    workbook = std::move(loaded);
    return core::ErrorCode::Ok;
}

core::ErrorCode XLSXReader::getSheetNames(std::vector<std::string>& names) {
    if (!is_open_) {
        return core::ErrorCode::InvalidArgument;
    }

    std::string workbook_xml;
    core::ErrorCode result = extractPart(workbook_path_, workbook_xml);
    if (result != core::ErrorCode::Ok) {
        return result;
    }

    WorkbookParser parser;
    if (!parser.parse(workbook_xml)) {
        return core::ErrorCode::XmlParseError;
    }

    names.clear();
    for (const auto& sheet : parser.getSheets()) {
        names.push_back(sheet.name);
    }
    return core::ErrorCode::Ok;
}

core::ErrorCode XLSXReader::extractPart(const std::string& path, std::string& content) {
    archive::ZipError error = zip_reader_->extractFile(path, content);
    if (error == archive::ZipError::FileNotFound) {
        return core::ErrorCode::XmlMissingElement;
    }
    if (archive::isError(error)) {
        READER_ERROR("Failed to extract {} from {}: {}", path, path_.string(), archive::toString(error));
        return core::ErrorCode::ZipError;
    }
    return core::ErrorCode::Ok;
}

core::ErrorCode XLSXReader::locateWorkbookPart() {
    std::string rels_xml;
    core::ErrorCode result = extractPart("_rels/.rels", rels_xml);
    if (result == core::ErrorCode::Ok) {
        RelationshipsParser root_rels;
        if (root_rels.parse(rels_xml)) {
            if (const auto* rel = root_rels.findByTypeSuffix("/officeDocument")) {
                workbook_path_ = resolvePartPath("", rel->target);
            }
        } else {
            READER_WARN("Cannot parse _rels/.rels in {}, assuming default layout", path_.string());
        }
    }

    if (!archive::isSuccess(zip_reader_->fileExists(workbook_path_))) {
        READER_ERROR("Workbook part {} not found in {}", workbook_path_, path_.string());
        return core::ErrorCode::InvalidWorkbook;
    }
    return core::ErrorCode::Ok;
}

core::ErrorCode XLSXReader::parseWorkbookRelationships() {
    const std::string base_dir = workbookDirectory();
    const std::string file_name = workbook_path_.substr(base_dir.size());
    const std::string rels_path = base_dir + "_rels/" + file_name + ".rels";

    std::string rels_xml;
    core::ErrorCode result = extractPart(rels_path, rels_xml);
    if (result != core::ErrorCode::Ok) {
        READER_ERROR("Workbook relationships {} unavailable in {}", rels_path, path_.string());
        return result == core::ErrorCode::XmlMissingElement ? core::ErrorCode::InvalidWorkbook : result;
    }

    if (!workbook_rels_.parse(rels_xml)) {
        READER_ERROR("Failed to parse {}: {}", rels_path, workbook_rels_.getErrorMessage());
        return core::ErrorCode::XmlParseError;
    }
    return core::ErrorCode::Ok;
}

core::ErrorCode XLSXReader::parseStylesXML(core::Workbook& workbook) {
    styles_.clear();
    const auto* rel = workbook_rels_.findByTypeSuffix("/styles");
    if (!rel) {
        READER_DEBUG("No styles part in {}", path_.string());
        return core::ErrorCode::Ok;
    }

    std::string styles_xml;
    core::ErrorCode result = extractPart(resolvePartPath(workbookDirectory(), rel->target), styles_xml);
    if (result != core::ErrorCode::Ok) {
        return result == core::ErrorCode::XmlMissingElement ? core::ErrorCode::Ok : result;
    }

    StylesParser parser;
    if (!parser.parse(styles_xml)) {
        READER_ERROR("Failed to parse styles: {}", parser.getErrorMessage());
        return core::ErrorCode::CorruptedStyles;
    }

    styles_ = parser.getStyles();
    if (!styles_.empty()) {
        workbook.setDefaultStyle(styles_.front());
    }
    return core::ErrorCode::Ok;
}

core::ErrorCode XLSXReader::parseSharedStringsXML() {
    shared_strings_.clear();
    const auto* rel = workbook_rels_.findByTypeSuffix("/sharedStrings");
    if (!rel) {
        return core::ErrorCode::Ok;
    }

    std::string sst_xml;
    core::ErrorCode result = extractPart(resolvePartPath(workbookDirectory(), rel->target), sst_xml);
    if (result != core::ErrorCode::Ok) {
        return result == core::ErrorCode::XmlMissingElement ? core::ErrorCode::Ok : result;
    }

    SharedStringsParser parser;
    if (!parser.parse(sst_xml)) {
        READER_ERROR("Failed to parse shared strings: {}", parser.getErrorMessage());
        return core::ErrorCode::CorruptedSharedStrings;
    }
    shared_strings_ = parser.takeStrings();
    READER_DEBUG("Loaded {} shared strings", shared_strings_.size());
    return core::ErrorCode::Ok;
}

void XLSXReader::parseThemeXML(core::Workbook& workbook) {
    const auto* rel = workbook_rels_.findByTypeSuffix("/theme");
    if (!rel) {
        return;
    }

    std::string theme_xml;
    if (extractPart(resolvePartPath(workbookDirectory(), rel->target), theme_xml) == core::ErrorCode::Ok) {
        workbook.setThemeXML(theme_xml);
    }
}

core::ErrorCode XLSXReader::parseWorksheetXML(const std::string& path, core::Worksheet& worksheet) {
    std::string sheet_xml;
    core::ErrorCode result = extractPart(path, sheet_xml);
    if (result != core::ErrorCode::Ok) {
        READER_ERROR("Worksheet part {} for '{}' unavailable", path, worksheet.getName());
        return result == core::ErrorCode::XmlMissingElement ? core::ErrorCode::InvalidWorksheet : result;
    }

    WorksheetParser parser;
    if (!parser.parse(sheet_xml, worksheet, shared_strings_, styles_)) {
        READER_ERROR("Failed to parse worksheet '{}': {}", worksheet.getName(), parser.getErrorMessage());
        return core::ErrorCode::XmlParseError;
    }
    return core::ErrorCode::Ok;
}

std::string XLSXReader::workbookDirectory() const {
    size_t slash = workbook_path_.rfind('/');
    return slash == std::string::npos ? std::string() : workbook_path_.substr(0, slash + 1);
}

std::string XLSXReader::resolvePartPath(const std::string& base_dir, const std::string& target) {
    std::string combined = (!target.empty() && target.front() == '/') ? target.substr(1) : base_dir + target;

    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= combined.size()) {
        size_t slash = combined.find('/', start);
        if (slash == std::string::npos) slash = combined.size();
        std::string segment = combined.substr(start, slash - start);
        if (segment == "..") {
            if (!segments.empty()) segments.pop_back();
        } else if (!segment.empty() && segment != ".") {
            segments.push_back(std::move(segment));
        }
        start = slash + 1;
    }

    std::string resolved;
    for (const auto& segment : segments) {
        if (!resolved.empty()) resolved += '/';
        resolved += segment;
    }
    return resolved;
}

}} // namespace sheetbinder::reader
