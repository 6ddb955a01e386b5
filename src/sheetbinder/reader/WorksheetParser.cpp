#include "sheetbinder/reader/WorksheetParser.hpp"
#include "sheetbinder/core/Exception.hpp"
#include "sheetbinder/utils/CommonUtils.hpp"
#include "sheetbinder/utils/TimeUtils.hpp"
#include <algorithm>

namespace sheetbinder {
namespace reader {

namespace {

// 单个 <col> 元素最多展开的列数，超出部分是整行格式，不携带有意义的列宽
constexpr int kMaxColumnSpan = 1024;

} // namespace

bool WorksheetParser::parse(const std::string& xml_content,
                            core::Worksheet& worksheet,
                            const std::vector<std::string>& shared_strings,
                            const std::vector<core::StylePtr>& styles) {
    worksheet_ = &worksheet;
    shared_strings_ = &shared_strings;
    styles_ = &styles;
    cell_.reset();
    in_cell_ = false;
    current_row_ = 0;
    last_col_ = 0;
    skipped_merges_ = 0;
    shared_formulas_.clear();

    bool ok = parseXML(xml_content);
    if (ok) {
        READER_DEBUG("Parsed worksheet '{}': {} cells, {} merges ({} skipped)",
                     worksheet.getName(), worksheet.getCellCount(),
                     worksheet.getMergeRanges().size(), skipped_merges_);
    }
    return ok;
}

void WorksheetParser::onStartElement(const std::string& name, const std::vector<xml::XMLAttribute>& attributes, int /*depth*/) {
    if (in_cell_) {
        if (name == "v") {
            cell_.has_value = true;
            startCollectingText();
        } else if (name == "f") {
            cell_.has_formula = true;
            cell_.formula_type = getAttributeOr(attributes, "t", "normal");
            cell_.shared_index = getIntAttributeOr(attributes, "si", -1);
            startCollectingText();
        } else if (name == "t" && isInElement("is") && !isInElement("rPh")) {
            cell_.has_inline = true;
            startCollectingText();
        }
        return;
    }

    if (name == "col") {
        handleColumnElement(attributes);
    } else if (name == "row") {
        handleRowElement(attributes);
    } else if (name == "c") {
        handleCellStart(attributes);
    } else if (name == "mergeCell") {
        handleMergeCell(attributes);
    }
}

void WorksheetParser::onEndElement(const std::string& name, int /*depth*/) {
    if (!in_cell_) {
        return;
    }

    if (name == "v" && state_.collecting_text) {
        cell_.value = getCurrentText();
        stopCollectingText();
    } else if (name == "f" && state_.collecting_text) {
        cell_.formula = getCurrentText();
        stopCollectingText();
    } else if (name == "t" && state_.collecting_text) {
        cell_.inline_text += getCurrentText();
        stopCollectingText();
    } else if (name == "c") {
        finishCell();
        in_cell_ = false;
    }
}

void WorksheetParser::handleColumnElement(const std::vector<xml::XMLAttribute>& attributes) {
    auto width = findDoubleAttribute(attributes, "width");
    if (!width || *width <= 0) {
        return;
    }

    int min_col = getIntAttributeOr(attributes, "min", 0);
    int max_col = getIntAttributeOr(attributes, "max", min_col);
    if (min_col < 1 || max_col < min_col || max_col > utils::CommonUtils::kMaxCols) {
        READER_WARN("Ignoring column definition with invalid range {}..{}", min_col, max_col);
        return;
    }

    max_col = std::min(max_col, min_col + kMaxColumnSpan - 1);
    for (int col = min_col; col <= max_col; ++col) {
        worksheet_->setColumnWidth(col, *width);
    }
}

void WorksheetParser::handleRowElement(const std::vector<xml::XMLAttribute>& attributes) {
    int row = getIntAttributeOr(attributes, "r", current_row_ + 1);
    if (row < 1 || row > utils::CommonUtils::kMaxRows) {
        row = current_row_ + 1;
    }
    current_row_ = row;
    last_col_ = 0;

    auto height = findDoubleAttribute(attributes, "ht");
    if (height && *height >= 0) {
        worksheet_->setRowHeight(row, *height);
    }
}

void WorksheetParser::handleCellStart(const std::vector<xml::XMLAttribute>& attributes) {
    cell_.reset();
    in_cell_ = true;

    // r 属性可以省略，此时按行内顺序推算
    auto ref = findAttribute(attributes, "r");
    if (ref) {
        auto [row, col] = parseCellReference(*ref);
        cell_.row = row;
        cell_.col = col;
    } else {
        cell_.row = current_row_;
        cell_.col = last_col_ + 1;
    }

    cell_.style_index = getIntAttributeOr(attributes, "s", 0);
    cell_.type = getAttributeOr(attributes, "t", "n");
}

void WorksheetParser::handleMergeCell(const std::vector<xml::XMLAttribute>& attributes) {
    auto ref = findAttribute(attributes, "ref");
    int first_row = 0, first_col = 0, last_row = 0, last_col = 0;
    if (!ref || !parseRangeReference(*ref, first_row, first_col, last_row, last_col)) {
        ++skipped_merges_;
        READER_WARN("Skipping merge with invalid reference in '{}'", worksheet_->getName());
        return;
    }

    try {
        worksheet_->mergeCells(first_row, first_col, last_row, last_col);
    } catch (const core::ParameterException& e) {
        ++skipped_merges_;
        READER_WARN("Skipping merge {} in '{}': {}", *ref, worksheet_->getName(), e.what());
    }
}

core::StylePtr WorksheetParser::resolveStyle(int style_index) const {
    if (style_index <= 0 || static_cast<size_t>(style_index) >= styles_->size()) {
        return nullptr;
    }
    return (*styles_)[static_cast<size_t>(style_index)];
}

void WorksheetParser::finishCell() {
    if (!utils::CommonUtils::isValidCellPosition(cell_.row, cell_.col)) {
        READER_WARN("Skipping cell with invalid position ({}, {}) in '{}'",
                    cell_.row, cell_.col, worksheet_->getName());
        return;
    }
    last_col_ = cell_.col;

    std::string formula = cell_.has_formula ? cell_.formula : std::string();
    if (cell_.has_formula && cell_.formula_type == "shared" && cell_.shared_index >= 0) {
        if (!formula.empty()) {
            shared_formulas_.registerSharedFormula(cell_.shared_index, formula, cell_.row, cell_.col);
        } else {
            formula = shared_formulas_.expandFormula(cell_.shared_index, cell_.row, cell_.col);
            if (formula.empty()) {
                READER_WARN("Shared formula {} not defined before {}, keeping cached value",
                            cell_.shared_index, utils::CommonUtils::cellReference(cell_.row, cell_.col));
            }
        }
    }

    core::StylePtr style = resolveStyle(cell_.style_index);
    const bool has_content = cell_.has_value || cell_.has_inline || !formula.empty();
    if (!has_content && !style) {
        return;
    }

    core::Cell& cell = worksheet_->getCell(cell_.row, cell_.col);
    cell.setStyle(style);

    const std::string& t = cell_.type;

    if (!formula.empty()) {
        cell.setFormula(formula);
        if (!cell_.has_value) {
            return;
        }
        if (t == "str") {
            cell.setFormulaStringResult(cell_.value);
        } else if (t == "b") {
            cell.setFormulaBooleanResult(cell_.value == "1");
        } else if (t == "e") {
            cell.setFormulaErrorResult(cell_.value);
        } else if (auto number = parseDouble(cell_.value)) {
            cell.setFormula(formula, *number);
        }
        return;
    }

    if (t == "inlineStr") {
        cell.setValue(cell_.inline_text);
        return;
    }

    if (!cell_.has_value) {
        return;
    }

    if (t == "s") {
        auto index = parseDouble(cell_.value);
        if (index && *index >= 0 && static_cast<size_t>(*index) < shared_strings_->size()) {
            cell.setValue((*shared_strings_)[static_cast<size_t>(*index)]);
        } else {
            READER_WARN("Shared string index '{}' out of range at {}", cell_.value,
                        utils::CommonUtils::cellReference(cell_.row, cell_.col));
        }
    } else if (t == "str") {
        cell.setValue(cell_.value);
    } else if (t == "d") {
        if (auto serial = utils::TimeUtils::isoToExcelSerial(cell_.value)) {
            cell.setDate(*serial);
        } else {
            READER_WARN("Unparseable ISO date '{}' at {}, kept as text", cell_.value,
                        utils::CommonUtils::cellReference(cell_.row, cell_.col));
            cell.setValue(cell_.value);
        }
    } else if (t == "b") {
        cell.setValue(cell_.value == "1" || cell_.value == "true");
    } else if (t == "e") {
        cell.setError(cell_.value);
    } else if (auto number = parseDouble(cell_.value)) {
        if (style && style->isDateFormat()) {
            cell.setDate(*number);
        } else {
            cell.setValue(*number);
        }
    } else {
        READER_WARN("Unparseable numeric value '{}' at {}", cell_.value,
                    utils::CommonUtils::cellReference(cell_.row, cell_.col));
    }
}

}} // namespace sheetbinder::reader
