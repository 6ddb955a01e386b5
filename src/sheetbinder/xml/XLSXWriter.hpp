#pragma once

#include "sheetbinder/core/Workbook.hpp"
#include "sheetbinder/core/ErrorCode.hpp"
#include "sheetbinder/core/Path.hpp"
#include "sheetbinder/xml/XMLStreamWriter.hpp"
#include <string>
#include <vector>
#include <utility>

namespace sheetbinder {
namespace archive { class ZipWriter; }

namespace xml {

/**
 * @brief XLSX写入器 - 把内存工作簿写成 xlsx 包
 *
 * 先生成全部工作表（同时收集样式与共享字符串），再生成 styles.xml、
 * sharedStrings.xml 与包结构部件，最后一次性写入 ZIP。
 * 不写外部链接部件，保存后的文件不含工作簿级外部引用。
 */
class XLSXWriter {
public:
    explicit XLSXWriter(const core::Workbook& workbook, int compression_level = 6);

    /**
     * @brief 写入文件（已存在时覆盖）
     * @return ErrorCode::Ok 表示成功
     */
    core::ErrorCode write(const core::Path& path);

private:
    const core::Workbook& workbook_;
    int compression_level_;

    // 部件路径 -> 内容
    std::vector<std::pair<std::string, std::string>> parts_;

    void buildParts();

    std::string generateContentTypes() const;
    std::string generateRootRelationships() const;
    std::string generateAppXML() const;
    std::string generateCoreXML() const;
    std::string generateWorkbookXML() const;
    std::string generateWorkbookRelationships() const;
    void generateDefinedNames(XMLStreamWriter& writer) const;

    /**
     * @brief 写出的活动工作表下标：原活动表隐藏时改用第一个可见表
     */
    size_t visibleActiveTab() const;

    static core::ErrorCode writePart(archive::ZipWriter& zip, const std::string& path, const std::string& content);
};

}} // namespace sheetbinder::xml
