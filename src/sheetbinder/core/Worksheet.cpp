#include "sheetbinder/core/Worksheet.hpp"
#include "sheetbinder/core/Exception.hpp"
#include "sheetbinder/utils/CommonUtils.hpp"
#include "sheetbinder/utils/ModuleLoggers.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace sheetbinder {
namespace core {

std::string MergeRange::toReference() const {
    return utils::CommonUtils::rangeReference(first_row, first_col, last_row, last_col);
}

const char* toString(SheetState state) noexcept {
    switch (state) {
        case SheetState::Visible:    return "visible";
        case SheetState::Hidden:     return "hidden";
        case SheetState::VeryHidden: return "veryHidden";
    }
    return "visible";
}

Worksheet::Worksheet(const std::string& name)
    : name_(name) {
}

void Worksheet::validateCellPosition(int row, int col) const {
    if (!utils::CommonUtils::isValidCellPosition(row, col)) {
        throw ParameterException(
            fmt::format("Cell position ({}, {}) out of range in sheet '{}'", row, col, name_), "row/col");
    }
}

Cell& Worksheet::getCell(int row, int col) {
    validateCellPosition(row, col);
    return cells_[std::make_pair(row, col)];
}

const Cell& Worksheet::getCell(int row, int col) const {
    static const Cell empty_cell;
    const Cell* cell = findCell(row, col);
    return cell ? *cell : empty_cell;
}

const Cell* Worksheet::findCell(int row, int col) const {
    auto it = cells_.find(std::make_pair(row, col));
    return it != cells_.end() ? &it->second : nullptr;
}

bool Worksheet::hasCellAt(int row, int col) const {
    return cells_.find(std::make_pair(row, col)) != cells_.end();
}

void Worksheet::setFormula(int row, int col, const std::string& formula) {
    getCell(row, col).setFormula(formula);
}

void Worksheet::setDate(int row, int col, double serial) {
    getCell(row, col).setDate(serial);
}

void Worksheet::setCellStyle(int row, int col, StylePtr style) {
    getCell(row, col).setStyle(std::move(style));
}

std::pair<int, int> Worksheet::getUsedRange() const {
    int max_row = 0;
    int max_col = 0;
    for (const auto& [pos, cell] : cells_) {
        max_row = std::max(max_row, pos.first);
        max_col = std::max(max_col, pos.second);
    }
    return {max_row, max_col};
}

void Worksheet::setColumnWidth(int col, double width) {
    validateCellPosition(1, col);
    if (width < 0) {
        throw ParameterException(fmt::format("Negative column width {} for column {}", width, col), "width");
    }
    column_widths_[col] = width;
}

std::optional<double> Worksheet::tryGetColumnWidth(int col) const {
    auto it = column_widths_.find(col);
    if (it == column_widths_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void Worksheet::setRowHeight(int row, double height) {
    validateCellPosition(row, 1);
    if (height < 0) {
        throw ParameterException(fmt::format("Negative row height {} for row {}", height, row), "height");
    }
    row_heights_[row] = height;
}

std::optional<double> Worksheet::tryGetRowHeight(int row) const {
    auto it = row_heights_.find(row);
    if (it == row_heights_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void Worksheet::mergeCells(int first_row, int first_col, int last_row, int last_col) {
    validateCellPosition(first_row, first_col);
    validateCellPosition(last_row, last_col);
    if (first_row > last_row || first_col > last_col) {
        throw ParameterException(
            fmt::format("Invalid merge range {}", utils::CommonUtils::rangeReference(first_row, first_col, last_row, last_col)),
            "range");
    }

    MergeRange range(first_row, first_col, last_row, last_col);
    for (const auto& existing : merge_ranges_) {
        if (existing.overlaps(range)) {
            throw ParameterException(
                fmt::format("Merge range {} overlaps {}", range.toReference(), existing.toReference()), "range");
        }
    }
    merge_ranges_.push_back(range);
    CORE_DEBUG("Merged {} in sheet '{}'", range.toReference(), name_);
}

void Worksheet::clear() {
    cells_.clear();
    column_widths_.clear();
    row_heights_.clear();
    merge_ranges_.clear();
}

}} // namespace sheetbinder::core
