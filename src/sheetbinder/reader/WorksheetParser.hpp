#pragma once

#include "sheetbinder/reader/BaseSAXParser.hpp"
#include "sheetbinder/core/Worksheet.hpp"
#include "sheetbinder/core/SharedFormula.hpp"
#include <string>
#include <vector>

namespace sheetbinder {
namespace reader {

/**
 * @brief 工作表XML解析器（xl/worksheets/sheetN.xml）
 *
 * 读取列宽、行高、单元格（值、公式、样式）与合并区域。
 * 数值单元格若其样式为日期格式，则作为日期单元格读入；t="d" 的 ISO 日期同样读为日期。
 * 共享公式在从属单元格处展开为各自的公式文本。
 */
class WorksheetParser : public BaseSAXParser {
public:
    /**
     * @param worksheet 目标工作表
     * @param shared_strings 共享字符串表
     * @param styles cellXfs 对应的样式列表（下标 0 视为默认样式）
     */
    bool parse(const std::string& xml_content,
               core::Worksheet& worksheet,
               const std::vector<std::string>& shared_strings,
               const std::vector<core::StylePtr>& styles);

    /**
     * @brief 因无效或重叠而跳过的合并区域数量
     */
    size_t getSkippedMergeCount() const { return skipped_merges_; }

private:
    struct CellState {
        int row = 0;
        int col = 0;
        int style_index = 0;
        std::string type;          // t 属性
        std::string value;         // <v>
        std::string formula;       // <f>
        std::string formula_type;  // <f t="...">
        int shared_index = -1;     // <f si="...">
        std::string inline_text;   // <is><t>
        bool has_value = false;
        bool has_formula = false;
        bool has_inline = false;

        void reset() { *this = CellState{}; }
    };

    core::Worksheet* worksheet_ = nullptr;
    const std::vector<std::string>* shared_strings_ = nullptr;
    const std::vector<core::StylePtr>* styles_ = nullptr;

    CellState cell_;
    bool in_cell_ = false;
    int current_row_ = 0;
    int last_col_ = 0;
    size_t skipped_merges_ = 0;
    core::SharedFormulaManager shared_formulas_;

    void onStartElement(const std::string& name, const std::vector<xml::XMLAttribute>& attributes, int depth) override;
    void onEndElement(const std::string& name, int depth) override;

    void handleColumnElement(const std::vector<xml::XMLAttribute>& attributes);
    void handleRowElement(const std::vector<xml::XMLAttribute>& attributes);
    void handleCellStart(const std::vector<xml::XMLAttribute>& attributes);
    void handleMergeCell(const std::vector<xml::XMLAttribute>& attributes);

    void finishCell();
    core::StylePtr resolveStyle(int style_index) const;
};

}} // namespace sheetbinder::reader
