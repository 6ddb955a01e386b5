#pragma once

#include "sheetbinder/core/Worksheet.hpp"
#include "sheetbinder/core/StyleBundle.hpp"
#include "sheetbinder/core/ErrorCode.hpp"
#include "sheetbinder/core/Path.hpp"
#include "sheetbinder/core/DefinedNameManager.hpp"
#include <string>
#include <vector>
#include <memory>

namespace sheetbinder {
namespace core {

/**
 * @brief 工作簿：有序、名称唯一的工作表集合
 *
 * 工作簿持有默认样式（styles.xml 中第 0 个 cellXfs）、定义名称以及原始主题 XML，
 * 保存时原样写回主题，使主题颜色在新文件中保持一致。
 */
class Workbook {
private:
    std::vector<std::shared_ptr<Worksheet>> worksheets_;
    size_t active_sheet_index_ = 0;
    DefinedNameManager defined_names_;

    StylePtr default_style_;
    std::string theme_xml_;

public:
    Workbook();
    ~Workbook() = default;

    Workbook(const Workbook&) = delete;
    Workbook& operator=(const Workbook&) = delete;

    /**
     * @brief 创建空的内存工作簿（不含工作表）
     */
    static std::unique_ptr<Workbook> create();

    /**
     * @brief 打开已有的 xlsx 文件
     * @param path 文件路径
     * @return 加载完成的工作簿
     * @throws FileException 文件不存在或无法解析
     */
    static std::unique_ptr<Workbook> open(const Path& path);

    /**
     * @brief 保存为 xlsx 文件（覆盖已有文件）
     * @return ErrorCode::Ok 表示成功
     */
    ErrorCode save(const Path& path) const;

    // ========== 工作表管理 ==========

    /**
     * @brief 追加工作表
     * @throws WorksheetException 名称无效或已存在
     */
    std::shared_ptr<Worksheet> addSheet(const std::string& name);

    /**
     * @brief 删除工作表，同时删除作用域为该表或引用该表的定义名称
     */
    bool removeSheet(const std::string& name);
    bool removeSheet(size_t index);

    std::shared_ptr<Worksheet> getSheet(const std::string& name);
    std::shared_ptr<Worksheet> getSheet(size_t index);
    std::shared_ptr<const Worksheet> getSheet(const std::string& name) const;
    std::shared_ptr<const Worksheet> getSheet(size_t index) const;

    /**
     * @brief 是否已有同名工作表（忽略大小写，与 Excel 一致）
     */
    bool hasSheet(const std::string& name) const;
    size_t getSheetCount() const { return worksheets_.size(); }
    std::vector<std::string> getSheetNames() const;

    /**
     * @brief 设置活动工作表
     * @throws ParameterException 索引越界
     */
    void setActiveWorksheet(size_t index);
    size_t getActiveSheetIndex() const { return active_sheet_index_; }
    std::shared_ptr<Worksheet> getActiveWorksheet();
    std::shared_ptr<const Worksheet> getActiveWorksheet() const;

    // ========== 定义名称 ==========

    DefinedNameManager& getDefinedNames() { return defined_names_; }
    const DefinedNameManager& getDefinedNames() const { return defined_names_; }

    // ========== 默认样式与主题 ==========

    /**
     * @brief 工作簿默认样式（从不为 nullptr）
     */
    const StylePtr& getDefaultStyle() const { return default_style_; }
    void setDefaultStyle(StylePtr style);

    const std::string& getThemeXML() const { return theme_xml_; }
    void setThemeXML(const std::string& theme_xml) { theme_xml_ = theme_xml; }
    bool hasTheme() const { return !theme_xml_.empty(); }
};

}} // namespace sheetbinder::core
