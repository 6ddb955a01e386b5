#pragma once

#include <string>
#include <map>
#include <utility>

namespace sheetbinder {
namespace core {

/**
 * @brief 共享公式（<f t="shared" si="N">）
 *
 * Excel 只在主单元格保存公式文本，范围内其余单元格只带 si 索引。
 * 读取时按主单元格与目标单元格的行列偏移展开出每个单元格自己的公式。
 * 例如：主公式 "B1*C1" 位于 A1，A3 展开为 "B3*C3"。
 */
class SharedFormula {
private:
    std::string base_formula_;
    int base_row_ = 0;
    int base_col_ = 0;

public:
    SharedFormula() = default;
    SharedFormula(std::string base_formula, int base_row, int base_col)
        : base_formula_(std::move(base_formula)), base_row_(base_row), base_col_(base_col) {}

    const std::string& getBaseFormula() const { return base_formula_; }
    int getBaseRow() const { return base_row_; }
    int getBaseCol() const { return base_col_; }

    /**
     * @brief 为指定单元格展开公式
     */
    std::string expandFormula(int row, int col) const {
        return adjustFormula(base_formula_, row - base_row_, col - base_col_);
    }

    /**
     * @brief 按偏移调整公式中的相对单元格引用
     *
     * 带 $ 的部分保持不变；字符串字面量、带引号的工作表名与函数名不受影响。
     * 偏移后越界的引用原样保留。
     */
    static std::string adjustFormula(const std::string& formula, int row_offset, int col_offset);
};

/**
 * @brief 单个工作表内的共享公式索引 si -> 主公式
 */
class SharedFormulaManager {
private:
    std::map<int, SharedFormula> shared_formulas_;

public:
    void registerSharedFormula(int shared_index, const std::string& base_formula, int row, int col) {
        shared_formulas_[shared_index] = SharedFormula(base_formula, row, col);
    }

    /**
     * @return 展开后的公式；未注册的 si 返回空字符串
     */
    std::string expandFormula(int shared_index, int row, int col) const {
        auto it = shared_formulas_.find(shared_index);
        return it == shared_formulas_.end() ? std::string() : it->second.expandFormula(row, col);
    }

    size_t size() const { return shared_formulas_.size(); }
    void clear() { shared_formulas_.clear(); }
};

}} // namespace sheetbinder::core
