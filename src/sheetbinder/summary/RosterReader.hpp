#pragma once

#include "sheetbinder/core/Expected.hpp"
#include "sheetbinder/core/Path.hpp"
#include <string>
#include <vector>

namespace sheetbinder {
namespace core {
class Cell;
}

namespace summary {

/**
 * @brief 客户名单读取
 *
 * 在名单工作簿活动工作表的第一行查找表头，收集其下方的非空值（去重，保持顺序）。
 */
class RosterReader {
public:
    /**
     * @return 客户名列表；文件无法打开或找不到表头时返回 RosterUnavailable
     */
    static core::Expected<std::vector<std::string>> read(const core::Path& path, const std::string& column);

private:
    static std::string cellText(const core::Cell& cell);
};

}} // namespace sheetbinder::summary
