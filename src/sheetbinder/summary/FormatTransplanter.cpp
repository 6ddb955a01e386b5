#include "sheetbinder/summary/FormatTransplanter.hpp"
#include "sheetbinder/core/StyleTransferContext.hpp"
#include "sheetbinder/utils/ModuleLoggers.hpp"

namespace sheetbinder {
namespace summary {

std::shared_ptr<core::Worksheet> FormatTransplanter::transplant(core::Workbook& dest,
                                                               const core::Worksheet& template_sheet,
                                                               const core::Worksheet& data_sheet,
                                                               const std::string& new_name,
                                                               TransplantStats* stats) {
    auto target = dest.addSheet(new_name);
    TransplantStats local;

    try {
        // 样式网格：每个源样式只克隆一次
        core::StyleTransferContext context;
        for (const auto& [position, cell] : template_sheet.getCells()) {
            if (!cell.hasStyle()) {
                continue;
            }
            target->getCell(position.first, position.second).setStyle(context.transfer(cell.getStyle()));
            ++local.styled_cells;
        }
        local.cloned_styles = context.getTransferStats().cloned_count;

        copyLayout(template_sheet, *target);

        // 数据覆盖：只写值，样式保持模板网格
        for (const auto& [position, cell] : data_sheet.getCells()) {
            if (cell.isEmpty()) {
                continue;
            }
            target->getCell(position.first, position.second).copyValueFrom(cell);
            ++local.data_cells;
        }
    } catch (const std::exception& e) {
        SUMMARY_ERROR("Transplant into '{}' failed: {}", new_name, e.what());
        dest.removeSheet(new_name);
        throw;
    }

    SUMMARY_DEBUG("Transplanted '{}' -> '{}': {} styled cells, {} data cells, {} style clones",
                  data_sheet.getName(), new_name, local.styled_cells, local.data_cells, local.cloned_styles);
    if (stats) {
        *stats = local;
    }
    return target;
}

void FormatTransplanter::copyLayout(const core::Worksheet& template_sheet, core::Worksheet& target) {
    for (const auto& [col, width] : template_sheet.getColumnWidths()) {
        target.setColumnWidth(col, width);
    }
    for (const auto& [row, height] : template_sheet.getRowHeights()) {
        target.setRowHeight(row, height);
    }
    for (const auto& range : template_sheet.getMergeRanges()) {
        target.mergeCells(range.first_row, range.first_col, range.last_row, range.last_col);
    }
}

}} // namespace sheetbinder::summary
