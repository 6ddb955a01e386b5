#pragma once

#include "sheetbinder/core/Worksheet.hpp"
#include "sheetbinder/utils/TimeUtils.hpp"
#include <optional>
#include <string>

namespace sheetbinder {
namespace summary {

/**
 * @brief 工作表日期探测
 *
 * 在左上角探测窗口内查找报告日期，结果统一为 YYYYMMDD。
 * 先找原生日期单元格，再按固定顺序尝试解析字符串：
 * YYYY-MM-DD、MM/DD/YYYY、DD/MM/YYYY、YYYYMMDD。
 */
class DateResolver {
public:
    static constexpr int kDefaultScanRows = 5;
    static constexpr int kDefaultScanCols = 5;

    static std::optional<std::string> resolve(const core::Worksheet& sheet,
                                              int scan_rows = kDefaultScanRows,
                                              int scan_cols = kDefaultScanCols);

    /**
     * @brief 按上述格式顺序解析整个字符串
     */
    static std::optional<utils::CivilDate> parseDateString(const std::string& text);

private:
    static std::optional<utils::CivilDate> parseIsoDate(const std::string& text);
    static std::optional<utils::CivilDate> parseSlashDate(const std::string& text, bool month_first);
    static std::optional<utils::CivilDate> parseCompactDate(const std::string& text);
};

}} // namespace sheetbinder::summary
