#pragma once

#include "sheetbinder/core/Worksheet.hpp"
#include "sheetbinder/core/FormatRepository.hpp"
#include "sheetbinder/xml/SharedStrings.hpp"
#include "sheetbinder/xml/XMLStreamWriter.hpp"
#include <unordered_map>

namespace sheetbinder {
namespace xml {

/**
 * @brief 工作表XML生成器（xl/worksheets/sheetN.xml）
 *
 * 生成过程中把单元格样式登记到 FormatRepository，把字符串登记到
 * SharedStrings，因此必须在 styles.xml 和 sharedStrings.xml 之前生成。
 */
class WorksheetXMLGenerator {
public:
    WorksheetXMLGenerator(const core::Worksheet& worksheet,
                          core::FormatRepository& format_repo,
                          SharedStrings& shared_strings,
                          bool tab_selected);

    void generate(XMLStreamWriter& writer);

private:
    const core::Worksheet& worksheet_;
    core::FormatRepository& format_repo_;
    SharedStrings& shared_strings_;
    bool tab_selected_;

    // 日期单元格派生出的日期样式（源样式 -> 派生样式）
    std::unordered_map<const core::StyleBundle*, core::StylePtr> date_styles_;

    void generateDimension(XMLStreamWriter& writer);
    void generateSheetViews(XMLStreamWriter& writer);
    void generateColumns(XMLStreamWriter& writer);
    void generateSheetData(XMLStreamWriter& writer);
    void generateCell(XMLStreamWriter& writer, int row, int col, const core::Cell& cell);
    void generateMergeCells(XMLStreamWriter& writer);

    /**
     * @brief 单元格的样式编号
     *
     * 日期单元格的样式若不是日期格式，改用数字格式为 yyyy-mm-dd 的派生样式，
     * 否则在 Excel 中会显示为序列号。
     */
    int getCellFormatIndex(const core::Cell& cell);
};

}} // namespace sheetbinder::xml
