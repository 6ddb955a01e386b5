#pragma once

#include "sheetbinder/core/Workbook.hpp"
#include <string>

namespace sheetbinder {
namespace summary {

/**
 * @brief 外部链接清理器
 *
 * 清除引用其他工作簿的公式与定义名称，避免打开汇总文件时出现外部链接安全提示。
 * 判断基于文本启发式，不解析公式。
 */
class LinkSanitizer {
public:
    struct SanitizeStats {
        size_t cells_scanned = 0;
        size_t cells_cleared = 0;
        size_t names_removed = 0;
    };

    /**
     * @brief 扫描所有工作表，清空带外部引用的公式单元格（保留样式），
     *        并删除指向外部工作簿的定义名称
     */
    static SanitizeStats sanitize(core::Workbook& workbook);

    /**
     * @brief 公式文本（带 "="）是否像外部引用
     *
     * 需同时满足：匹配 \[.*\.xl.*\] 或含单引号；并且同时含有 '[' 与 ']'。
     */
    static bool looksLikeExternalReference(const std::string& formula_text);

    /**
     * @brief 定义名称的值（不带 "="）是否指向外部工作簿
     *
     * 除上述启发式外，还识别保存后的外部链接下标形式，如 [1]Sheet1!$A$1。
     */
    static bool isExternalDefinedName(const std::string& formula);
};

}} // namespace sheetbinder::summary
