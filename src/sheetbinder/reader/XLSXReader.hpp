#pragma once

#include "sheetbinder/core/Workbook.hpp"
#include "sheetbinder/core/ErrorCode.hpp"
#include "sheetbinder/core/Path.hpp"
#include "sheetbinder/archive/ZipReader.hpp"
#include "sheetbinder/reader/RelationshipsParser.hpp"
#include <memory>
#include <string>
#include <vector>

namespace sheetbinder {
namespace reader {

/**
 * @brief XLSX文件读取器
 *
 * 按包关系定位各部件：_rels/.rels -> workbook.xml -> workbook.xml.rels
 * -> 工作表、样式、共享字符串与主题。主题原样保留，保存时写回。
 */
class XLSXReader {
public:
    explicit XLSXReader(const core::Path& path);
    ~XLSXReader();

    XLSXReader(const XLSXReader&) = delete;
    XLSXReader& operator=(const XLSXReader&) = delete;

    /**
     * @brief 打开文件并校验包结构
     * @return ErrorCode::Ok 表示成功
     */
    core::ErrorCode open();

    core::ErrorCode close();

    /**
     * @brief 加载完整工作簿
     * @param workbook 输出的工作簿
     */
    core::ErrorCode loadWorkbook(std::unique_ptr<core::Workbook>& workbook);

    /**
     * @brief 仅读取工作表名称（按工作簿顺序）
     */
    core::ErrorCode getSheetNames(std::vector<std::string>& names);

    bool isOpen() const { return is_open_; }

private:
    core::Path path_;
    std::unique_ptr<archive::ZipReader> zip_reader_;
    bool is_open_ = false;

    std::string workbook_path_ = "xl/workbook.xml";
    RelationshipsParser workbook_rels_;
    std::vector<std::string> shared_strings_;
    std::vector<core::StylePtr> styles_;

    core::ErrorCode extractPart(const std::string& path, std::string& content);
    core::ErrorCode locateWorkbookPart();
    core::ErrorCode parseWorkbookRelationships();
    core::ErrorCode parseStylesXML(core::Workbook& workbook);
    core::ErrorCode parseSharedStringsXML();
    void parseThemeXML(core::Workbook& workbook);
    core::ErrorCode parseWorksheetXML(const std::string& path, core::Worksheet& worksheet);

    std::string workbookDirectory() const;

    /**
     * @brief 把关系目标解析为包内路径（处理绝对路径与 ".."）
     */
    static std::string resolvePartPath(const std::string& base_dir, const std::string& target);
};

}} // namespace sheetbinder::reader
