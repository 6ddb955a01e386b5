#include "sheetbinder/xml/StyleSerializer.hpp"
#include "sheetbinder/utils/ModuleLoggers.hpp"
#include <algorithm>

namespace sheetbinder {
namespace xml {

namespace {

constexpr uint32_t kFirstCustomNumFmtId = 164;

template <typename T>
int indexOf(std::vector<T>& table, const T& value) {
    auto it = std::find(table.begin(), table.end(), value);
    if (it != table.end()) {
        return static_cast<int>(std::distance(table.begin(), it));
    }
    table.push_back(value);
    return static_cast<int>(table.size() - 1);
}

core::FillStyle grayFill() {
    core::FillStyle fill;
    fill.pattern = core::PatternType::Gray125;
    return fill;
}

} // namespace

void StyleSerializer::serialize(const core::FormatRepository& repository, XMLStreamWriter& writer) {
    ComponentMappings mappings = createComponentMappings(repository);

    writer.startDocument();
    writer.startElement("styleSheet");
    writer.writeAttribute("xmlns", "http://schemas.openxmlformats.org/spreadsheetml/2006/main");

    writeNumberFormats(mappings, writer);
    writeFonts(mappings, writer);
    writeFills(mappings, writer);
    writeBorders(mappings, writer);

    // cellXfs 全部关联到 cellStyleXfs[0]（Normal）
    writer.startElement("cellStyleXfs");
    writer.writeAttribute("count", 1);
    writer.startElement("xf");
    writer.writeAttribute("numFmtId", 0);
    writer.writeAttribute("fontId", 0);
    writer.writeAttribute("fillId", 0);
    writer.writeAttribute("borderId", 0);
    writer.endElement(); // xf
    writer.endElement(); // cellStyleXfs

    writeCellXfs(repository, mappings, writer);

    writer.startElement("cellStyles");
    writer.writeAttribute("count", 1);
    writer.startElement("cellStyle");
    writer.writeAttribute("name", "Normal");
    writer.writeAttribute("xfId", 0);
    writer.writeAttribute("builtinId", 0);
    writer.endElement(); // cellStyle
    writer.endElement(); // cellStyles

    writer.startElement("dxfs");
    writer.writeAttribute("count", 0);
    writer.endElement(); // dxfs

    writer.endElement(); // styleSheet
    writer.endDocument();

    XML_DEBUG("Serialized styles: {} xfs, {} fonts, {} fills, {} borders, {} custom numFmts",
              mappings.xf_ids.size(), mappings.fonts.size(), mappings.fills.size(),
              mappings.borders.size(), mappings.custom_numfmts.size());
}

StyleSerializer::ComponentMappings StyleSerializer::createComponentMappings(const core::FormatRepository& repository) {
    ComponentMappings mappings;

    // 填充表前两项是 Excel 要求的保留项
    mappings.fills.push_back(core::FillStyle{});
    mappings.fills.push_back(grayFill());

    // 字体和边框的第 0 项取默认样式
    auto default_style = repository.getFormat(repository.getDefaultFormatId());
    mappings.fonts.push_back(default_style->getFont());
    mappings.borders.push_back(default_style->getBorder());

    uint32_t next_custom_id = kFirstCustomNumFmtId;
    size_t count = repository.getFormatCount();
    mappings.xf_ids.reserve(count);

    for (size_t i = 0; i < count; ++i) {
        auto style = repository.getFormat(static_cast<int>(i));

        ComponentMappings::XfIds ids{};
        ids.font_id = indexOf(mappings.fonts, style->getFont());
        ids.fill_id = indexOf(mappings.fills, style->getFill());
        ids.border_id = indexOf(mappings.borders, style->getBorder());

        const auto& numfmt = style->getNumberFormat();
        if (numfmt.code.empty()) {
            ids.numfmt_id = numfmt.id;
        } else {
            auto it = mappings.custom_numfmts.find(numfmt.code);
            if (it == mappings.custom_numfmts.end()) {
                it = mappings.custom_numfmts.emplace(numfmt.code, next_custom_id++).first;
            }
            ids.numfmt_id = it->second;
        }
        mappings.xf_ids.push_back(ids);
    }

    return mappings;
}

void StyleSerializer::writeNumberFormats(const ComponentMappings& mappings, XMLStreamWriter& writer) {
    if (mappings.custom_numfmts.empty()) {
        return;
    }

    // 按编号顺序输出
    std::vector<std::pair<uint32_t, std::string>> ordered;
    ordered.reserve(mappings.custom_numfmts.size());
    for (const auto& [code, id] : mappings.custom_numfmts) {
        ordered.emplace_back(id, code);
    }
    std::sort(ordered.begin(), ordered.end());

    writer.startElement("numFmts");
    writer.writeAttribute("count", ordered.size());
    for (const auto& [id, code] : ordered) {
        writer.startElement("numFmt");
        writer.writeAttribute("numFmtId", id);
        writer.writeAttribute("formatCode", code);
        writer.endElement(); // numFmt
    }
    writer.endElement(); // numFmts
}

void StyleSerializer::writeFonts(const ComponentMappings& mappings, XMLStreamWriter& writer) {
    writer.startElement("fonts");
    writer.writeAttribute("count", mappings.fonts.size());
    for (const auto& font : mappings.fonts) {
        writeFont(font, writer);
    }
    writer.endElement(); // fonts
}

void StyleSerializer::writeFills(const ComponentMappings& mappings, XMLStreamWriter& writer) {
    writer.startElement("fills");
    writer.writeAttribute("count", mappings.fills.size());
    for (const auto& fill : mappings.fills) {
        writeFill(fill, writer);
    }
    writer.endElement(); // fills
}

void StyleSerializer::writeBorders(const ComponentMappings& mappings, XMLStreamWriter& writer) {
    writer.startElement("borders");
    writer.writeAttribute("count", mappings.borders.size());
    for (const auto& border : mappings.borders) {
        writeBorder(border, writer);
    }
    writer.endElement(); // borders
}

void StyleSerializer::writeCellXfs(const core::FormatRepository& repository,
                                   const ComponentMappings& mappings, XMLStreamWriter& writer) {
    writer.startElement("cellXfs");
    writer.writeAttribute("count", mappings.xf_ids.size());

    for (size_t i = 0; i < mappings.xf_ids.size(); ++i) {
        auto style = repository.getFormat(static_cast<int>(i));
        const auto& ids = mappings.xf_ids[i];

        writer.startElement("xf");
        writer.writeAttribute("numFmtId", ids.numfmt_id);
        writer.writeAttribute("fontId", ids.font_id);
        writer.writeAttribute("fillId", ids.fill_id);
        writer.writeAttribute("borderId", ids.border_id);
        writer.writeAttribute("xfId", 0);

        if (ids.numfmt_id > 0) writer.writeAttribute("applyNumberFormat", 1);
        if (ids.font_id > 0) writer.writeAttribute("applyFont", 1);
        if (ids.fill_id > 0) writer.writeAttribute("applyFill", 1);
        if (ids.border_id > 0) writer.writeAttribute("applyBorder", 1);

        bool has_alignment = !style->getAlignment().isDefault();
        bool has_protection = !style->getProtection().isDefault();
        if (has_alignment) writer.writeAttribute("applyAlignment", 1);
        if (has_protection) writer.writeAttribute("applyProtection", 1);

        if (has_alignment) writeAlignment(style->getAlignment(), writer);
        if (has_protection) writeProtection(style->getProtection(), writer);

        writer.endElement(); // xf
    }

    writer.endElement(); // cellXfs
}

void StyleSerializer::writeFont(const core::FontStyle& font, XMLStreamWriter& writer) {
    writer.startElement("font");

    if (font.bold) writer.writeEmptyElement("b");
    if (font.italic) writer.writeEmptyElement("i");
    if (font.strikeout) writer.writeEmptyElement("strike");

    if (font.underline != core::UnderlineType::None) {
        writer.startElement("u");
        if (font.underline != core::UnderlineType::Single) {
            writer.writeAttribute("val", core::toXMLValue(font.underline));
        }
        writer.endElement(); // u
    }

    if (font.script != core::FontScript::None) {
        writer.startElement("vertAlign");
        writer.writeAttribute("val", core::toXMLValue(font.script));
        writer.endElement(); // vertAlign
    }

    writer.startElement("sz");
    writer.writeAttribute("val", font.size);
    writer.endElement(); // sz

    if (font.color) {
        writeColor("color", *font.color, writer);
    }

    writer.startElement("name");
    writer.writeAttribute("val", font.name);
    writer.endElement(); // name

    if (font.family) {
        writer.startElement("family");
        writer.writeAttribute("val", *font.family);
        writer.endElement(); // family
    }

    if (font.charset) {
        writer.startElement("charset");
        writer.writeAttribute("val", *font.charset);
        writer.endElement(); // charset
    }

    if (!font.scheme.empty()) {
        writer.startElement("scheme");
        writer.writeAttribute("val", font.scheme);
        writer.endElement(); // scheme
    }

    writer.endElement(); // font
}

void StyleSerializer::writeFill(const core::FillStyle& fill, XMLStreamWriter& writer) {
    writer.startElement("fill");
    writer.startElement("patternFill");
    writer.writeAttribute("patternType", core::toXMLValue(fill.pattern));

    if (fill.fg_color) writeColor("fgColor", *fill.fg_color, writer);
    if (fill.bg_color) writeColor("bgColor", *fill.bg_color, writer);

    writer.endElement(); // patternFill
    writer.endElement(); // fill
}

void StyleSerializer::writeBorder(const core::BorderSet& border, XMLStreamWriter& writer) {
    writer.startElement("border");
    if (border.diagonal_up) writer.writeAttribute("diagonalUp", 1);
    if (border.diagonal_down) writer.writeAttribute("diagonalDown", 1);

    writeBorderSide("left", border.left, writer);
    writeBorderSide("right", border.right, writer);
    writeBorderSide("top", border.top, writer);
    writeBorderSide("bottom", border.bottom, writer);
    writeBorderSide("diagonal", border.diagonal, writer);

    writer.endElement(); // border
}

void StyleSerializer::writeBorderSide(const char* name, const core::BorderSide& side, XMLStreamWriter& writer) {
    writer.startElement(name);
    if (side.style != core::BorderStyle::None) {
        writer.writeAttribute("style", core::toXMLValue(side.style));
        if (side.color) {
            writeColor("color", *side.color, writer);
        }
    }
    writer.endElement();
}

void StyleSerializer::writeColor(const char* name, const core::Color& color, XMLStreamWriter& writer) {
    writer.startElement(name);
    switch (color.getType()) {
        case core::Color::Type::RGB:
            writer.writeAttribute("rgb", color.toHex());
            break;
        case core::Color::Type::Theme:
            writer.writeAttribute("theme", color.getValue());
            break;
        case core::Color::Type::Indexed:
            writer.writeAttribute("indexed", color.getValue());
            break;
        case core::Color::Type::Auto:
            writer.writeAttribute("auto", 1);
            break;
    }
    if (color.getTint() != 0.0) {
        writer.writeAttribute("tint", color.getTint());
    }
    writer.endElement();
}

void StyleSerializer::writeAlignment(const core::AlignmentStyle& alignment, XMLStreamWriter& writer) {
    writer.startElement("alignment");
    if (alignment.horizontal != core::HorizontalAlign::None) {
        writer.writeAttribute("horizontal", core::toXMLValue(alignment.horizontal));
    }
    if (alignment.vertical != core::VerticalAlign::None) {
        writer.writeAttribute("vertical", core::toXMLValue(alignment.vertical));
    }
    if (alignment.rotation != 0) writer.writeAttribute("textRotation", alignment.rotation);
    if (alignment.wrap_text) writer.writeAttribute("wrapText", 1);
    if (alignment.indent > 0) writer.writeAttribute("indent", alignment.indent);
    if (alignment.shrink_to_fit) writer.writeAttribute("shrinkToFit", 1);
    writer.endElement(); // alignment
}

void StyleSerializer::writeProtection(const core::ProtectionStyle& protection, XMLStreamWriter& writer) {
    writer.startElement("protection");
    if (!protection.locked) writer.writeAttribute("locked", 0);
    if (protection.hidden) writer.writeAttribute("hidden", 1);
    writer.endElement(); // protection
}

}} // namespace sheetbinder::xml
