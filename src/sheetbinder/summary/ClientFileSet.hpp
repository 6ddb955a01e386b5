#pragma once

#include "sheetbinder/core/Path.hpp"
#include "sheetbinder/summary/SummaryOptions.hpp"
#include <map>
#include <string>
#include <vector>

namespace sheetbinder {
namespace summary {

/**
 * @brief 客户数据文件集合
 *
 * 文件名约定为 <客户名>_<日期标记><扩展名>：最后一个下划线之前是客户名，
 * 之后是日期标记。没有下划线的文件名整体作为客户名，日期标记为空。
 */
class ClientFileSet {
public:
    using ClientGroups = std::map<std::string, std::vector<core::Path>>;

    static std::string clientNameOf(const core::Path& path);
    static std::string dateTokenOf(const core::Path& path);

    /**
     * @brief 列出输入目录中的客户文件
     *
     * 扩展名比较不区分大小写，以临时文件前缀开头的文件被排除。
     * 目录不存在时返回空列表并记录警告。
     */
    static std::vector<core::Path> discover(const SummaryOptions& options);

    /**
     * @brief 按客户名分组，客户按名称排序
     */
    static ClientGroups group(const std::vector<core::Path>& paths);

    /**
     * @brief 按日期标记升序排列（稳定排序，标记相同的保持原顺序）
     */
    static void sortByDateToken(std::vector<core::Path>& paths);
};

}} // namespace sheetbinder::summary
