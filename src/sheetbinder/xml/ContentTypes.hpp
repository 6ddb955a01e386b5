#pragma once

#include "sheetbinder/xml/XMLStreamWriter.hpp"
#include <string>
#include <vector>

namespace sheetbinder {
namespace xml {

/**
 * @brief [Content_Types].xml 生成器
 */
class ContentTypes {
public:
    void addDefault(const std::string& extension, const std::string& content_type);
    void addOverride(const std::string& part_name, const std::string& content_type);

    /**
     * @brief 添加 rels 与 xml 两个默认类型
     */
    void addExcelDefaults();

    void generate(XMLStreamWriter& writer) const;

private:
    struct DefaultType {
        std::string extension;
        std::string content_type;
    };

    struct OverrideType {
        std::string part_name;
        std::string content_type;
    };

    std::vector<DefaultType> default_types_;
    std::vector<OverrideType> override_types_;
};

}} // namespace sheetbinder::xml
