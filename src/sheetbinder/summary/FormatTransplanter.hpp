#pragma once

#include "sheetbinder/core/Workbook.hpp"
#include "sheetbinder/core/Worksheet.hpp"
#include <memory>
#include <string>

namespace sheetbinder {
namespace summary {

/**
 * @brief 格式移植器
 *
 * 在目标工作簿中新建一张工作表：样式网格、列宽、行高与合并区域取自模板工作表，
 * 单元格的值取自数据工作表。模板单元格的值不会被复制。
 */
class FormatTransplanter {
public:
    struct TransplantStats {
        size_t styled_cells = 0;    // 从模板复制了样式的单元格
        size_t data_cells = 0;      // 从数据表写入了值的单元格
        size_t cloned_styles = 0;   // 新建的样式克隆数量
    };

    /**
     * @brief 执行一次移植
     * @param dest 目标工作簿，新工作表追加到末尾
     * @param template_sheet 样式来源，不会被修改
     * @param data_sheet 数据来源
     * @param new_name 新工作表名称，必须合法且未被占用
     * @return 新建的工作表
     * @throws WorksheetException 名称非法或重复时
     */
    static std::shared_ptr<core::Worksheet> transplant(core::Workbook& dest,
                                                       const core::Worksheet& template_sheet,
                                                       const core::Worksheet& data_sheet,
                                                       const std::string& new_name,
                                                       TransplantStats* stats = nullptr);

private:
    static void copyLayout(const core::Worksheet& template_sheet, core::Worksheet& target);
};

}} // namespace sheetbinder::summary
