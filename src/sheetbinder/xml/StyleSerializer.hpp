#pragma once

#include "sheetbinder/core/FormatRepository.hpp"
#include "sheetbinder/xml/XMLStreamWriter.hpp"
#include <string>
#include <vector>
#include <map>

namespace sheetbinder {
namespace xml {

/**
 * @brief XLSX样式序列化器
 *
 * 把 FormatRepository 中的样式写成 styles.xml：字体、填充、边框、
 * 数字格式各自去重成表，cellXfs 的第 i 项对应仓储中的第 i 个样式。
 */
class StyleSerializer {
public:
    /**
     * @brief 序列化样式信息到XML流
     * @param repository 格式仓储（只读）
     * @param writer XML写入器
     */
    static void serialize(const core::FormatRepository& repository, XMLStreamWriter& writer);

private:
    // 各组件的去重表及每个样式对应的组件编号
    struct ComponentMappings {
        std::vector<core::FontStyle> fonts;
        std::vector<core::FillStyle> fills;
        std::vector<core::BorderSet> borders;
        std::map<std::string, uint32_t> custom_numfmts;   // 格式码 -> 编号（>= 164）

        struct XfIds {
            int font_id;
            int fill_id;
            int border_id;
            uint32_t numfmt_id;
        };
        std::vector<XfIds> xf_ids;
    };

    static ComponentMappings createComponentMappings(const core::FormatRepository& repository);

    static void writeNumberFormats(const ComponentMappings& mappings, XMLStreamWriter& writer);
    static void writeFonts(const ComponentMappings& mappings, XMLStreamWriter& writer);
    static void writeFills(const ComponentMappings& mappings, XMLStreamWriter& writer);
    static void writeBorders(const ComponentMappings& mappings, XMLStreamWriter& writer);
    static void writeCellXfs(const core::FormatRepository& repository,
                             const ComponentMappings& mappings, XMLStreamWriter& writer);

    static void writeFont(const core::FontStyle& font, XMLStreamWriter& writer);
    static void writeFill(const core::FillStyle& fill, XMLStreamWriter& writer);
    static void writeBorder(const core::BorderSet& border, XMLStreamWriter& writer);
    static void writeBorderSide(const char* name, const core::BorderSide& side, XMLStreamWriter& writer);
    static void writeColor(const char* name, const core::Color& color, XMLStreamWriter& writer);
    static void writeAlignment(const core::AlignmentStyle& alignment, XMLStreamWriter& writer);
    static void writeProtection(const core::ProtectionStyle& protection, XMLStreamWriter& writer);
};

}} // namespace sheetbinder::xml
