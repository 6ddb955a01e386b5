#pragma once

#include "sheetbinder/reader/BaseSAXParser.hpp"
#include <string>
#include <vector>

namespace sheetbinder {
namespace reader {

/**
 * @brief xl/workbook.xml 解析器：工作表列表、活动工作表与定义名称
 */
class WorkbookParser : public BaseSAXParser {
public:
    struct SheetInfo {
        std::string name;
        int sheet_id = 0;
        std::string rel_id;
        std::string state;   // "visible"/"hidden"/"veryHidden"
    };

    struct DefinedNameInfo {
        std::string name;
        std::string formula;
        int local_sheet_id = -1;   // <sheets> 中的下标，-1 表示工作簿级
        bool hidden = false;
    };

    bool parse(const std::string& xml_content) {
        sheets_.clear();
        defined_names_.clear();
        active_tab_ = 0;
        in_sheets_ = false;
        in_defined_name_ = false;
        return parseXML(xml_content);
    }

    const std::vector<SheetInfo>& getSheets() const { return sheets_; }
    size_t getActiveTab() const { return active_tab_; }
    const std::vector<DefinedNameInfo>& getDefinedNames() const { return defined_names_; }

private:
    std::vector<SheetInfo> sheets_;
    size_t active_tab_ = 0;
    bool in_sheets_ = false;
    std::vector<DefinedNameInfo> defined_names_;
    DefinedNameInfo current_name_;
    bool in_defined_name_ = false;

    void onStartElement(const std::string& name, const std::vector<xml::XMLAttribute>& attributes, int depth) override;
    void onEndElement(const std::string& name, int depth) override;
};

}} // namespace sheetbinder::reader
