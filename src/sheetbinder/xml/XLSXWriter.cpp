#include "sheetbinder/xml/XLSXWriter.hpp"
#include "sheetbinder/xml/ContentTypes.hpp"
#include "sheetbinder/xml/Relationships.hpp"
#include "sheetbinder/xml/SharedStrings.hpp"
#include "sheetbinder/xml/StyleSerializer.hpp"
#include "sheetbinder/xml/WorksheetXMLGenerator.hpp"
#include "sheetbinder/archive/ZipWriter.hpp"
#include "sheetbinder/core/FormatRepository.hpp"
#include "sheetbinder/core/Exception.hpp"
#include "sheetbinder/utils/TimeUtils.hpp"
#include "sheetbinder/utils/ModuleLoggers.hpp"
#include <fmt/format.h>

namespace sheetbinder {
namespace xml {

namespace {

constexpr const char* kRelOfficeDocument =
    "http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument";
constexpr const char* kRelCoreProperties =
    "http://schemas.openxmlformats.org/package/2006/relationships/metadata/core-properties";
constexpr const char* kRelExtendedProperties =
    "http://schemas.openxmlformats.org/officeDocument/2006/relationships/extended-properties";
constexpr const char* kRelWorksheet =
    "http://schemas.openxmlformats.org/officeDocument/2006/relationships/worksheet";
constexpr const char* kRelStyles =
    "http://schemas.openxmlformats.org/officeDocument/2006/relationships/styles";
constexpr const char* kRelSharedStrings =
    "http://schemas.openxmlformats.org/officeDocument/2006/relationships/sharedStrings";
constexpr const char* kRelTheme =
    "http://schemas.openxmlformats.org/officeDocument/2006/relationships/theme";

std::string worksheetPartPath(size_t index) {
    return fmt::format("xl/worksheets/sheet{}.xml", index + 1);
}

} // namespace

XLSXWriter::XLSXWriter(const core::Workbook& workbook, int compression_level)
    : workbook_(workbook)
    , compression_level_(compression_level) {
}

core::ErrorCode XLSXWriter::write(const core::Path& path) {
    if (workbook_.getSheetCount() == 0) {
        XML_ERROR("Refusing to write workbook without worksheets: {}", path.string());
        return core::ErrorCode::InvalidWorkbook;
    }

    try {
        buildParts();
    } catch (const core::SheetBinderException& e) {
        XML_ERROR("Failed to generate workbook parts for {}: {}", path.string(), e.what());
        return e.getErrorCode();
    }

    archive::ZipWriter zip(path, compression_level_);
    if (!zip.open()) {
        XML_ERROR("Cannot create output file: {}", path.string());
        return core::ErrorCode::FileWriteError;
    }

    for (const auto& [part_path, content] : parts_) {
        core::ErrorCode result = writePart(zip, part_path, content);
        if (result != core::ErrorCode::Ok) {
            zip.close();
            return result;
        }
    }

    if (!zip.close()) {
        XML_ERROR("Failed to finalize output file: {}", path.string());
        return core::ErrorCode::FileWriteError;
    }

    XML_INFO("Wrote {} ({} sheets, {} parts, {} bytes)", path.string(), workbook_.getSheetCount(),
             parts_.size(), zip.getStats().bytes_written);
    return core::ErrorCode::Ok;
}

void XLSXWriter::buildParts() {
    parts_.clear();

    core::FormatRepository format_repo(workbook_.getDefaultStyle());
    SharedStrings shared_strings;

    // 工作表必须先于 styles.xml / sharedStrings.xml 生成
    std::vector<std::pair<std::string, std::string>> worksheet_parts;
    for (size_t i = 0; i < workbook_.getSheetCount(); ++i) {
        auto sheet = workbook_.getSheet(i);
        WorksheetXMLGenerator generator(*sheet, format_repo, shared_strings,
                                        i == visibleActiveTab());
        XMLStreamWriter writer;
        generator.generate(writer);
        worksheet_parts.emplace_back(worksheetPartPath(i), writer.release());
    }

    parts_.emplace_back("[Content_Types].xml", generateContentTypes());
    parts_.emplace_back("_rels/.rels", generateRootRelationships());
    parts_.emplace_back("docProps/app.xml", generateAppXML());
    parts_.emplace_back("docProps/core.xml", generateCoreXML());
    parts_.emplace_back("xl/workbook.xml", generateWorkbookXML());
    parts_.emplace_back("xl/_rels/workbook.xml.rels", generateWorkbookRelationships());

    {
        XMLStreamWriter writer;
        StyleSerializer::serialize(format_repo, writer);
        parts_.emplace_back("xl/styles.xml", writer.release());
    }

    {
        XMLStreamWriter writer;
        shared_strings.generate(writer);
        parts_.emplace_back("xl/sharedStrings.xml", writer.release());
    }

    if (workbook_.hasTheme()) {
        parts_.emplace_back("xl/theme/theme1.xml", workbook_.getThemeXML());
    }

    for (auto& part : worksheet_parts) {
        parts_.push_back(std::move(part));
    }
}

std::string XLSXWriter::generateContentTypes() const {
    ContentTypes content_types;
    content_types.addExcelDefaults();

    content_types.addOverride("/docProps/app.xml",
        "application/vnd.openxmlformats-officedocument.extended-properties+xml");
    content_types.addOverride("/docProps/core.xml",
        "application/vnd.openxmlformats-package.core-properties+xml");
    content_types.addOverride("/xl/workbook.xml",
        "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet.main+xml");
    content_types.addOverride("/xl/styles.xml",
        "application/vnd.openxmlformats-officedocument.spreadsheetml.styles+xml");
    content_types.addOverride("/xl/sharedStrings.xml",
        "application/vnd.openxmlformats-officedocument.spreadsheetml.sharedStrings+xml");
    if (workbook_.hasTheme()) {
        content_types.addOverride("/xl/theme/theme1.xml",
            "application/vnd.openxmlformats-officedocument.theme+xml");
    }
    for (size_t i = 0; i < workbook_.getSheetCount(); ++i) {
        content_types.addOverride("/" + worksheetPartPath(i),
            "application/vnd.openxmlformats-officedocument.spreadsheetml.worksheet+xml");
    }

    XMLStreamWriter writer;
    content_types.generate(writer);
    return writer.release();
}

std::string XLSXWriter::generateRootRelationships() const {
    Relationships rels;
    rels.addRelationship("rId1", kRelOfficeDocument, "xl/workbook.xml");
    rels.addRelationship("rId2", kRelCoreProperties, "docProps/core.xml");
    rels.addRelationship("rId3", kRelExtendedProperties, "docProps/app.xml");

    XMLStreamWriter writer;
    rels.generate(writer);
    return writer.release();
}

std::string XLSXWriter::generateAppXML() const {
    XMLStreamWriter writer;
    writer.startDocument();
    writer.startElement("Properties");
    writer.writeAttribute("xmlns", "http://schemas.openxmlformats.org/officeDocument/2006/extended-properties");
    writer.writeAttribute("xmlns:vt", "http://schemas.openxmlformats.org/officeDocument/2006/docPropsVTypes");

    writer.startElement("Application");
    writer.writeText("Microsoft Excel");
    writer.endElement(); // Application

    writer.startElement("DocSecurity");
    writer.writeText("0");
    writer.endElement(); // DocSecurity

    writer.startElement("ScaleCrop");
    writer.writeText("false");
    writer.endElement(); // ScaleCrop

    auto names = workbook_.getSheetNames();

    writer.startElement("HeadingPairs");
    writer.startElement("vt:vector");
    writer.writeAttribute("size", 2);
    writer.writeAttribute("baseType", "variant");
    writer.startElement("vt:variant");
    writer.startElement("vt:lpstr");
    writer.writeText("Worksheets");
    writer.endElement(); // vt:lpstr
    writer.endElement(); // vt:variant
    writer.startElement("vt:variant");
    writer.startElement("vt:i4");
    writer.writeText(std::to_string(names.size()));
    writer.endElement(); // vt:i4
    writer.endElement(); // vt:variant
    writer.endElement(); // vt:vector
    writer.endElement(); // HeadingPairs

    writer.startElement("TitlesOfParts");
    writer.startElement("vt:vector");
    writer.writeAttribute("size", names.size());
    writer.writeAttribute("baseType", "lpstr");
    for (const auto& name : names) {
        writer.startElement("vt:lpstr");
        writer.writeText(name);
        writer.endElement(); // vt:lpstr
    }
    writer.endElement(); // vt:vector
    writer.endElement(); // TitlesOfParts

    writer.startElement("LinksUpToDate");
    writer.writeText("false");
    writer.endElement(); // LinksUpToDate

    writer.startElement("SharedDoc");
    writer.writeText("false");
    writer.endElement(); // SharedDoc

    writer.startElement("AppVersion");
    writer.writeText("16.0300");
    writer.endElement(); // AppVersion

    writer.endElement(); // Properties
    writer.endDocument();
    return writer.release();
}

std::string XLSXWriter::generateCoreXML() const {
    const std::string timestamp = utils::TimeUtils::formatTimeISO8601(utils::TimeUtils::getCurrentUTCTime());

    XMLStreamWriter writer;
    writer.startDocument();
    writer.startElement("cp:coreProperties");
    writer.writeAttribute("xmlns:cp", "http://schemas.openxmlformats.org/package/2006/metadata/core-properties");
    writer.writeAttribute("xmlns:dc", "http://purl.org/dc/elements/1.1/");
    writer.writeAttribute("xmlns:dcterms", "http://purl.org/dc/terms/");
    writer.writeAttribute("xmlns:dcmitype", "http://purl.org/dc/dcmitype/");
    writer.writeAttribute("xmlns:xsi", "http://www.w3.org/2001/XMLSchema-instance");

    writer.startElement("dc:creator");
    writer.writeText("SheetBinder");
    writer.endElement(); // dc:creator

    writer.startElement("cp:lastModifiedBy");
    writer.writeText("SheetBinder");
    writer.endElement(); // cp:lastModifiedBy

    writer.startElement("dcterms:created");
    writer.writeAttribute("xsi:type", "dcterms:W3CDTF");
    writer.writeText(timestamp);
    writer.endElement(); // dcterms:created

    writer.startElement("dcterms:modified");
    writer.writeAttribute("xsi:type", "dcterms:W3CDTF");
    writer.writeText(timestamp);
    writer.endElement(); // dcterms:modified

    writer.endElement(); // cp:coreProperties
    writer.endDocument();
    return writer.release();
}

std::string XLSXWriter::generateWorkbookXML() const {
    XMLStreamWriter writer;
    writer.startDocument();
    writer.startElement("workbook");
    writer.writeAttribute("xmlns", "http://schemas.openxmlformats.org/spreadsheetml/2006/main");
    writer.writeAttribute("xmlns:r", "http://schemas.openxmlformats.org/officeDocument/2006/relationships");

    writer.startElement("bookViews");
    writer.startElement("workbookView");
    writer.writeAttribute("xWindow", 240);
    writer.writeAttribute("yWindow", 15);
    writer.writeAttribute("windowWidth", 16095);
    writer.writeAttribute("windowHeight", 9660);
    const size_t active_tab = visibleActiveTab();
    if (active_tab > 0) {
        writer.writeAttribute("activeTab", active_tab);
    }
    writer.endElement(); // workbookView
    writer.endElement(); // bookViews

    // 工作表关系ID：rId1..rIdN 依次对应各工作表
    writer.startElement("sheets");
    for (size_t i = 0; i < workbook_.getSheetCount(); ++i) {
        auto sheet = workbook_.getSheet(i);
        writer.startElement("sheet");
        writer.writeAttribute("name", sheet->getName());
        writer.writeAttribute("sheetId", i + 1);
        if (!sheet->isVisible()) {
            writer.writeAttribute("state", core::toString(sheet->getState()));
        }
        writer.writeAttribute("r:id", fmt::format("rId{}", i + 1));
        writer.endElement(); // sheet
    }
    writer.endElement(); // sheets

    generateDefinedNames(writer);

    writer.startElement("calcPr");
    writer.writeAttribute("calcId", 191029);
    writer.writeAttribute("fullCalcOnLoad", 1);
    writer.endElement(); // calcPr

    writer.endElement(); // workbook
    writer.endDocument();
    return writer.release();
}

void XLSXWriter::generateDefinedNames(XMLStreamWriter& writer) const {
    const auto& names = workbook_.getDefinedNames().getAll();
    if (names.empty()) {
        return;
    }

    writer.startElement("definedNames");
    for (const auto& defined_name : names) {
        size_t scope_index = 0;
        if (!defined_name.scope.empty()) {
            while (scope_index < workbook_.getSheetCount() &&
                   workbook_.getSheet(scope_index)->getName() != defined_name.scope) {
                ++scope_index;
            }
            if (scope_index == workbook_.getSheetCount()) {
                XML_WARN("Skipping defined name '{}' scoped to missing sheet '{}'",
                         defined_name.name, defined_name.scope);
                continue;
            }
        }

        writer.startElement("definedName");
        writer.writeAttribute("name", defined_name.name);
        if (!defined_name.scope.empty()) {
            writer.writeAttribute("localSheetId", scope_index);
        }
        if (defined_name.hidden) {
            writer.writeAttribute("hidden", 1);
        }
        writer.writeText(defined_name.formula);
        writer.endElement(); // definedName
    }
    writer.endElement(); // definedNames
}

size_t XLSXWriter::visibleActiveTab() const {
    // 活动工作表不能是隐藏的，否则 Excel 打开时需要修复
    size_t active = workbook_.getActiveSheetIndex();
    if (active < workbook_.getSheetCount() && workbook_.getSheet(active)->isVisible()) {
        return active;
    }
    for (size_t i = 0; i < workbook_.getSheetCount(); ++i) {
        if (workbook_.getSheet(i)->isVisible()) {
            return i;
        }
    }
    return 0;
}

std::string XLSXWriter::generateWorkbookRelationships() const {
    Relationships rels;
    for (size_t i = 0; i < workbook_.getSheetCount(); ++i) {
        rels.addAutoRelationship(kRelWorksheet, fmt::format("worksheets/sheet{}.xml", i + 1));
    }
    rels.addAutoRelationship(kRelStyles, "styles.xml");
    rels.addAutoRelationship(kRelSharedStrings, "sharedStrings.xml");
    if (workbook_.hasTheme()) {
        rels.addAutoRelationship(kRelTheme, "theme/theme1.xml");
    }

    XMLStreamWriter writer;
    rels.generate(writer);
    return writer.release();
}

core::ErrorCode XLSXWriter::writePart(archive::ZipWriter& zip, const std::string& path, const std::string& content) {
    archive::ZipError result = zip.addFile(path, content);
    if (archive::isError(result)) {
        XML_ERROR("Failed to write part {}: {}", path, archive::toString(result));
        return core::ErrorCode::ZipError;
    }
    return core::ErrorCode::Ok;
}

}} // namespace sheetbinder::xml
