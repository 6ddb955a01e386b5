#pragma once

#include "sheetbinder/core/Cell.hpp"
#include <string>
#include <map>
#include <vector>
#include <optional>
#include <utility>
#include <cstdint>

namespace sheetbinder {
namespace core {

/**
 * @brief 合并单元格区域（行列1开始，含两端）
 */
struct MergeRange {
    int first_row;
    int first_col;
    int last_row;
    int last_col;

    MergeRange(int fr, int fc, int lr, int lc)
        : first_row(fr), first_col(fc), last_row(lr), last_col(lc) {}

    bool contains(int row, int col) const {
        return row >= first_row && row <= last_row && col >= first_col && col <= last_col;
    }

    bool overlaps(const MergeRange& other) const {
        return first_row <= other.last_row && other.first_row <= last_row &&
               first_col <= other.last_col && other.first_col <= last_col;
    }

    /**
     * @brief 区域引用，如 "A1:C1"
     */
    std::string toReference() const;

    bool operator==(const MergeRange& other) const {
        return first_row == other.first_row && first_col == other.first_col &&
               last_row == other.last_row && last_col == other.last_col;
    }
};

/**
 * @brief 工作表可见性（<sheet state="...">）
 */
enum class SheetState : uint8_t {
    Visible,
    Hidden,
    VeryHidden
};

const char* toString(SheetState state) noexcept;

/**
 * @brief 工作表：单元格网格加上列宽、行高与合并区域
 *
 * 单元格按 (行, 列) 有序存储，遍历顺序即行优先顺序。
 */
class Worksheet {
public:
    using CellMap = std::map<std::pair<int, int>, Cell>;

private:
    std::string name_;
    SheetState state_ = SheetState::Visible;

    CellMap cells_;
    std::map<int, double> column_widths_;
    std::map<int, double> row_heights_;
    std::vector<MergeRange> merge_ranges_;

    void validateCellPosition(int row, int col) const;

public:
    explicit Worksheet(const std::string& name);

    Worksheet(const Worksheet&) = delete;
    Worksheet& operator=(const Worksheet&) = delete;

    const std::string& getName() const { return name_; }

    SheetState getState() const { return state_; }
    void setState(SheetState state) { state_ = state; }
    bool isVisible() const { return state_ == SheetState::Visible; }

    // ========== 单元格访问 ==========

    /**
     * @brief 获取单元格，不存在时创建空单元格
     * @throws ParameterException 行列超出范围
     */
    Cell& getCell(int row, int col);

    /**
     * @brief 只读访问，不存在时返回共享的空单元格
     */
    const Cell& getCell(int row, int col) const;

    /**
     * @brief 查找单元格
     * @return 单元格指针，不存在时返回 nullptr
     */
    const Cell* findCell(int row, int col) const;

    bool hasCellAt(int row, int col) const;

    template<typename T>
    void setValue(int row, int col, const T& value) {
        getCell(row, col).setValue(value);
    }

    template<typename T>
    T getValue(int row, int col) const {
        return getCell(row, col).template getValue<T>();
    }

    void setFormula(int row, int col, const std::string& formula);
    void setDate(int row, int col, double serial);
    void setCellStyle(int row, int col, StylePtr style);

    const CellMap& getCells() const { return cells_; }
    CellMap& getCells() { return cells_; }
    size_t getCellCount() const { return cells_.size(); }

    /**
     * @brief 已使用区域的最大行列（无单元格时为 (0, 0)）
     */
    std::pair<int, int> getUsedRange() const;

    // ========== 列宽与行高 ==========

    void setColumnWidth(int col, double width);
    std::optional<double> tryGetColumnWidth(int col) const;
    const std::map<int, double>& getColumnWidths() const { return column_widths_; }

    void setRowHeight(int row, double height);
    std::optional<double> tryGetRowHeight(int row) const;
    const std::map<int, double>& getRowHeights() const { return row_heights_; }

    // ========== 合并单元格 ==========

    /**
     * @brief 合并区域
     * @throws ParameterException 区域无效或与已有区域重叠
     */
    void mergeCells(int first_row, int first_col, int last_row, int last_col);
    const std::vector<MergeRange>& getMergeRanges() const { return merge_ranges_; }

    void clear();
};

}} // namespace sheetbinder::core
