#include "sheetbinder/xml/WorksheetXMLGenerator.hpp"
#include "sheetbinder/core/StyleBuilder.hpp"
#include "sheetbinder/utils/CommonUtils.hpp"
#include "sheetbinder/utils/XMLUtils.hpp"
#include "sheetbinder/utils/ModuleLoggers.hpp"
#include <fmt/format.h>
#include <algorithm>

namespace sheetbinder {
namespace xml {

namespace {

constexpr const char* kFallbackDateFormat = "yyyy-mm-dd";

std::string formatNumber(double value) {
    return fmt::format("{}", value);
}

} // namespace

WorksheetXMLGenerator::WorksheetXMLGenerator(const core::Worksheet& worksheet,
                                             core::FormatRepository& format_repo,
                                             SharedStrings& shared_strings,
                                             bool tab_selected)
    : worksheet_(worksheet)
    , format_repo_(format_repo)
    , shared_strings_(shared_strings)
    , tab_selected_(tab_selected) {
}

void WorksheetXMLGenerator::generate(XMLStreamWriter& writer) {
    writer.startDocument();
    writer.startElement("worksheet");
    writer.writeAttribute("xmlns", "http://schemas.openxmlformats.org/spreadsheetml/2006/main");
    writer.writeAttribute("xmlns:r", "http://schemas.openxmlformats.org/officeDocument/2006/relationships");

    generateDimension(writer);
    generateSheetViews(writer);

    writer.startElement("sheetFormatPr");
    writer.writeAttribute("defaultRowHeight", 15.0);
    writer.endElement(); // sheetFormatPr

    generateColumns(writer);
    generateSheetData(writer);
    generateMergeCells(writer);

    writer.startElement("pageMargins");
    writer.writeAttribute("left", 0.7);
    writer.writeAttribute("right", 0.7);
    writer.writeAttribute("top", 0.75);
    writer.writeAttribute("bottom", 0.75);
    writer.writeAttribute("header", 0.3);
    writer.writeAttribute("footer", 0.3);
    writer.endElement(); // pageMargins

    writer.endElement(); // worksheet
    writer.endDocument();

    XML_DEBUG("Generated worksheet '{}': {} cells, {} merges",
              worksheet_.getName(), worksheet_.getCellCount(), worksheet_.getMergeRanges().size());
}

void WorksheetXMLGenerator::generateDimension(XMLStreamWriter& writer) {
    // 尺寸信息（考虑合并区域扩展列/行）
    auto [max_row, max_col] = worksheet_.getUsedRange();
    for (const auto& range : worksheet_.getMergeRanges()) {
        max_row = std::max(max_row, range.last_row);
        max_col = std::max(max_col, range.last_col);
    }

    writer.startElement("dimension");
    if (max_row > 0 && max_col > 0) {
        writer.writeAttribute("ref", utils::CommonUtils::rangeReference(1, 1, max_row, max_col));
    } else {
        writer.writeAttribute("ref", "A1");
    }
    writer.endElement(); // dimension
}

void WorksheetXMLGenerator::generateSheetViews(XMLStreamWriter& writer) {
    writer.startElement("sheetViews");
    writer.startElement("sheetView");
    if (tab_selected_) {
        writer.writeAttribute("tabSelected", 1);
    }
    writer.writeAttribute("workbookViewId", 0);
    writer.endElement(); // sheetView
    writer.endElement(); // sheetViews
}

void WorksheetXMLGenerator::generateColumns(XMLStreamWriter& writer) {
    const auto& widths = worksheet_.getColumnWidths();
    if (widths.empty()) return;

    writer.startElement("cols");

    // 合并相邻且宽度相同的列
    auto it = widths.begin();
    while (it != widths.end()) {
        int min_col = it->first;
        int max_col = min_col;
        double width = it->second;

        auto next = std::next(it);
        while (next != widths.end() && next->first == max_col + 1 && next->second == width) {
            max_col = next->first;
            ++next;
        }

        writer.startElement("col");
        writer.writeAttribute("min", min_col);
        writer.writeAttribute("max", max_col);
        writer.writeAttribute("width", width);
        writer.writeAttribute("customWidth", 1);
        writer.endElement(); // col

        it = next;
    }

    writer.endElement(); // cols
}

void WorksheetXMLGenerator::generateSheetData(XMLStreamWriter& writer) {
    writer.startElement("sheetData");

    const auto& cells = worksheet_.getCells();
    const auto& heights = worksheet_.getRowHeights();

    auto cell_it = cells.begin();
    auto height_it = heights.begin();

    // 行按行号递增输出；只有行高没有单元格的行也要输出
    while (cell_it != cells.end() || height_it != heights.end()) {
        int row = 0;
        if (cell_it == cells.end()) {
            row = height_it->first;
        } else if (height_it == heights.end()) {
            row = cell_it->first.first;
        } else {
            row = std::min(cell_it->first.first, height_it->first);
        }

        writer.startElement("row");
        writer.writeAttribute("r", row);
        if (height_it != heights.end() && height_it->first == row) {
            writer.writeAttribute("ht", height_it->second);
            writer.writeAttribute("customHeight", 1);
            ++height_it;
        }

        while (cell_it != cells.end() && cell_it->first.first == row) {
            generateCell(writer, row, cell_it->first.second, cell_it->second);
            ++cell_it;
        }

        writer.endElement(); // row
    }

    writer.endElement(); // sheetData
}

void WorksheetXMLGenerator::generateCell(XMLStreamWriter& writer, int row, int col, const core::Cell& cell) {
    writer.startElement("c");
    writer.writeAttribute("r", utils::CommonUtils::cellReference(row, col));

    int format_index = getCellFormatIndex(cell);
    if (format_index > 0) {
        writer.writeAttribute("s", format_index);
    }

    switch (cell.getType()) {
        case core::CellType::Empty:
            break;

        case core::CellType::String:
            writer.writeAttribute("t", "s");
            writer.startElement("v");
            writer.writeText(std::to_string(shared_strings_.addString(cell.getStringValue())));
            writer.endElement(); // v
            break;

        case core::CellType::Number:
        case core::CellType::Date:
            writer.startElement("v");
            writer.writeText(formatNumber(cell.getNumberValue()));
            writer.endElement(); // v
            break;

        case core::CellType::Boolean:
            writer.writeAttribute("t", "b");
            writer.startElement("v");
            writer.writeText(cell.getBooleanValue() ? "1" : "0");
            writer.endElement(); // v
            break;

        case core::CellType::Error:
            writer.writeAttribute("t", "e");
            writer.startElement("v");
            writer.writeText(cell.getStringValue());
            writer.endElement(); // v
            break;

        case core::CellType::Formula:
            switch (cell.getFormulaResultType()) {
                case core::CellType::String:
                    writer.writeAttribute("t", "str");
                    break;
                case core::CellType::Boolean:
                    writer.writeAttribute("t", "b");
                    break;
                case core::CellType::Error:
                    writer.writeAttribute("t", "e");
                    break;
                default:
                    break;
            }

            writer.startElement("f");
            writer.writeText(cell.getFormula());
            writer.endElement(); // f

            // 保留缓存结果，未重新计算的查看器也能显示
            if (cell.hasFormulaResult()) {
                writer.startElement("v");
                switch (cell.getFormulaResultType()) {
                    case core::CellType::String:
                    case core::CellType::Error:
                        writer.writeText(cell.getFormulaResultText());
                        break;
                    case core::CellType::Boolean:
                        writer.writeText(cell.getFormulaResult() != 0.0 ? "1" : "0");
                        break;
                    default:
                        writer.writeText(formatNumber(cell.getFormulaResult()));
                        break;
                }
                writer.endElement(); // v
            }
            break;
    }

    writer.endElement(); // c
}

void WorksheetXMLGenerator::generateMergeCells(XMLStreamWriter& writer) {
    const auto& merge_ranges = worksheet_.getMergeRanges();
    if (merge_ranges.empty()) return;

    writer.startElement("mergeCells");
    writer.writeAttribute("count", merge_ranges.size());
    for (const auto& range : merge_ranges) {
        writer.startElement("mergeCell");
        writer.writeAttribute("ref", range.toReference());
        writer.endElement(); // mergeCell
    }
    writer.endElement(); // mergeCells
}

int WorksheetXMLGenerator::getCellFormatIndex(const core::Cell& cell) {
    const core::StylePtr& style = cell.getStyle();

    if (!cell.isDate()) {
        return style ? format_repo_.addFormat(style) : format_repo_.getDefaultFormatId();
    }

    core::StylePtr base = style ? style : format_repo_.getFormat(format_repo_.getDefaultFormatId());
    if (base->isDateFormat()) {
        return format_repo_.addFormat(base);
    }

    auto it = date_styles_.find(base.get());
    if (it == date_styles_.end()) {
        core::StylePtr derived = core::StyleBuilder(*base).numberFormat(kFallbackDateFormat).build();
        it = date_styles_.emplace(base.get(), derived).first;
    }
    return format_repo_.addFormat(it->second);
}

}} // namespace sheetbinder::xml
