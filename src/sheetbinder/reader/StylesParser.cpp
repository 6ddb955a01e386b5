#include "sheetbinder/reader/StylesParser.hpp"
#include "sheetbinder/core/StyleBuilder.hpp"
#include <algorithm>

namespace sheetbinder {
namespace reader {

bool StylesParser::parse(const std::string& xml_content) {
    region_ = Region::None;
    number_formats_.clear();
    fonts_.clear();
    fills_.clear();
    borders_.clear();
    cell_xfs_.clear();
    styles_.clear();
    in_item_ = false;
    current_side_ = nullptr;

    if (!parseXML(xml_content)) {
        return false;
    }

    buildStyles();
    READER_DEBUG("Parsed styles: {} numFmts, {} fonts, {} fills, {} borders, {} xfs",
                 number_formats_.size(), fonts_.size(), fills_.size(), borders_.size(), cell_xfs_.size());
    return true;
}

core::StylePtr StylesParser::getStyle(int xf_index) const {
    if (xf_index < 0 || static_cast<size_t>(xf_index) >= styles_.size()) {
        return nullptr;
    }
    return styles_[static_cast<size_t>(xf_index)];
}

std::optional<std::string> StylesParser::getNumberFormatCode(uint32_t id) const {
    auto it = number_formats_.find(id);
    if (it == number_formats_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void StylesParser::onStartElement(const std::string& name, const std::vector<xml::XMLAttribute>& attributes, int /*depth*/) {
    if (region_ == Region::None) {
        // 顶级区域检测
        if (name == "numFmts") region_ = Region::NumFmts;
        else if (name == "fonts") region_ = Region::Fonts;
        else if (name == "fills") region_ = Region::Fills;
        else if (name == "borders") region_ = Region::Borders;
        else if (name == "cellXfs") region_ = Region::CellXfs;
        else if (name == "cellStyleXfs" || name == "dxfs" || name == "extLst" || name == "colors") region_ = Region::Other;
        return;
    }

    switch (region_) {
        case Region::NumFmts:
            if (name == "numFmt") {
                auto id = findIntAttribute(attributes, "numFmtId");
                if (id && *id >= 0) {
                    number_formats_[static_cast<uint32_t>(*id)] = getAttributeOr(attributes, "formatCode", "");
                }
            }
            break;

        case Region::Fonts:
            if (name == "font" && !in_item_) {
                current_font_ = core::FontStyle{};
                in_item_ = true;
            } else if (in_item_) {
                handleFontChild(name, attributes);
            }
            break;

        case Region::Fills:
            if (name == "fill" && !in_item_) {
                current_fill_ = core::FillStyle{};
                in_item_ = true;
            } else if (in_item_) {
                handleFillChild(name, attributes);
            }
            break;

        case Region::Borders:
            if (name == "border" && !in_item_) {
                current_border_ = core::BorderSet{};
                current_border_.diagonal_up = getBoolAttributeOr(attributes, "diagonalUp", false);
                current_border_.diagonal_down = getBoolAttributeOr(attributes, "diagonalDown", false);
                current_side_ = nullptr;
                in_item_ = true;
            } else if (in_item_) {
                handleBorderChild(name, attributes);
            }
            break;

        case Region::CellXfs:
            if (name == "xf" && !in_item_) {
                current_xf_ = CellXf{};
                current_xf_.num_fmt_id = static_cast<uint32_t>(std::max(0, getIntAttributeOr(attributes, "numFmtId", 0)));
                current_xf_.font_id = getIntAttributeOr(attributes, "fontId", 0);
                current_xf_.fill_id = getIntAttributeOr(attributes, "fillId", 0);
                current_xf_.border_id = getIntAttributeOr(attributes, "borderId", 0);
                in_item_ = true;
            } else if (in_item_) {
                handleXfChild(name, attributes);
            }
            break;

        default:
            break;
    }
}

void StylesParser::onEndElement(const std::string& name, int /*depth*/) {
    switch (region_) {
        case Region::NumFmts:
            if (name == "numFmts") region_ = Region::None;
            break;
        case Region::Fonts:
            if (name == "font" && in_item_) {
                fonts_.push_back(current_font_);
                in_item_ = false;
            } else if (name == "fonts") {
                region_ = Region::None;
            }
            break;
        case Region::Fills:
            if (name == "fill" && in_item_) {
                fills_.push_back(current_fill_);
                in_item_ = false;
            } else if (name == "fills") {
                region_ = Region::None;
            }
            break;
        case Region::Borders:
            if (name == "border" && in_item_) {
                borders_.push_back(current_border_);
                current_side_ = nullptr;
                in_item_ = false;
            } else if (current_side_ && (name == "left" || name == "right" || name == "top" ||
                                         name == "bottom" || name == "diagonal" ||
                                         name == "start" || name == "end")) {
                current_side_ = nullptr;
            } else if (name == "borders") {
                region_ = Region::None;
            }
            break;
        case Region::CellXfs:
            if (name == "xf" && in_item_) {
                cell_xfs_.push_back(current_xf_);
                in_item_ = false;
            } else if (name == "cellXfs") {
                region_ = Region::None;
            }
            break;
        case Region::Other:
            if (name == "cellStyleXfs" || name == "dxfs" || name == "extLst" || name == "colors") {
                region_ = Region::None;
            }
            break;
        case Region::None:
            break;
    }
}

void StylesParser::handleFontChild(const std::string& name, const std::vector<xml::XMLAttribute>& attributes) {
    if (name == "b") {
        current_font_.bold = getBoolAttributeOr(attributes, "val", true);
    } else if (name == "i") {
        current_font_.italic = getBoolAttributeOr(attributes, "val", true);
    } else if (name == "strike") {
        current_font_.strikeout = getBoolAttributeOr(attributes, "val", true);
    } else if (name == "u") {
        current_font_.underline = core::underlineFromXML(getAttributeOr(attributes, "val", ""));
    } else if (name == "vertAlign") {
        current_font_.script = core::scriptFromXML(getAttributeOr(attributes, "val", ""));
    } else if (name == "sz") {
        double size = getDoubleAttributeOr(attributes, "val", 11.0);
        if (size > 0) current_font_.size = size;
    } else if (name == "color") {
        current_font_.color = parseColor(attributes);
    } else if (name == "name" || name == "rFont") {
        current_font_.name = getAttributeOr(attributes, "val", current_font_.name);
    } else if (name == "family") {
        current_font_.family = findIntAttribute(attributes, "val");
    } else if (name == "charset") {
        current_font_.charset = findIntAttribute(attributes, "val");
    } else if (name == "scheme") {
        current_font_.scheme = getAttributeOr(attributes, "val", "");
    }
}

void StylesParser::handleFillChild(const std::string& name, const std::vector<xml::XMLAttribute>& attributes) {
    if (name == "patternFill") {
        current_fill_.pattern = core::patternFromXML(getAttributeOr(attributes, "patternType", "none"));
    } else if (name == "fgColor" && !isInElement("gradientFill")) {
        current_fill_.fg_color = parseColor(attributes);
    } else if (name == "bgColor" && !isInElement("gradientFill")) {
        current_fill_.bg_color = parseColor(attributes);
    }
}

void StylesParser::handleBorderChild(const std::string& name, const std::vector<xml::XMLAttribute>& attributes) {
    core::BorderSide* side = nullptr;
    if (name == "left" || name == "start") side = &current_border_.left;
    else if (name == "right" || name == "end") side = &current_border_.right;
    else if (name == "top") side = &current_border_.top;
    else if (name == "bottom") side = &current_border_.bottom;
    else if (name == "diagonal") side = &current_border_.diagonal;

    if (side) {
        side->style = core::borderStyleFromXML(getAttributeOr(attributes, "style", "none"));
        current_side_ = side;
    } else if (name == "color" && current_side_) {
        current_side_->color = parseColor(attributes);
    }
}

void StylesParser::handleXfChild(const std::string& name, const std::vector<xml::XMLAttribute>& attributes) {
    if (name == "alignment") {
        auto& align = current_xf_.alignment;
        align.horizontal = core::horizontalAlignFromXML(getAttributeOr(attributes, "horizontal", ""));
        align.vertical = core::verticalAlignFromXML(getAttributeOr(attributes, "vertical", ""));
        align.rotation = getIntAttributeOr(attributes, "textRotation", 0);
        align.wrap_text = getBoolAttributeOr(attributes, "wrapText", false);
        align.indent = getIntAttributeOr(attributes, "indent", 0);
        align.shrink_to_fit = getBoolAttributeOr(attributes, "shrinkToFit", false);
    } else if (name == "protection") {
        current_xf_.protection.locked = getBoolAttributeOr(attributes, "locked", true);
        current_xf_.protection.hidden = getBoolAttributeOr(attributes, "hidden", false);
    }
}

core::Color StylesParser::parseColor(const std::vector<xml::XMLAttribute>& attributes) {
    core::Color color;
    if (auto rgb = findAttribute(attributes, "rgb")) {
        color = core::Color::fromHex(*rgb);
    } else if (auto theme = findIntAttribute(attributes, "theme")) {
        color = core::Color::fromTheme(static_cast<uint32_t>(std::max(0, *theme)));
    } else if (auto indexed = findIntAttribute(attributes, "indexed")) {
        color = core::Color::fromIndex(static_cast<uint32_t>(std::max(0, *indexed)));
    } else if (getBoolAttributeOr(attributes, "auto", false)) {
        color = core::Color::automatic();
    }

    if (auto tint = findDoubleAttribute(attributes, "tint")) {
        color.setTint(*tint);
    }
    return color;
}

void StylesParser::buildStyles() {
    styles_.reserve(cell_xfs_.size());

    for (const auto& xf : cell_xfs_) {
        core::NumberFormat number_format;
        number_format.id = xf.num_fmt_id;
        auto code = number_formats_.find(xf.num_fmt_id);
        if (code != number_formats_.end()) {
            number_format.code = code->second;
        }

        core::StyleBuilder builder;
        if (xf.font_id >= 0 && static_cast<size_t>(xf.font_id) < fonts_.size()) {
            builder.font(fonts_[static_cast<size_t>(xf.font_id)]);
        }
        if (xf.fill_id >= 0 && static_cast<size_t>(xf.fill_id) < fills_.size()) {
            builder.fill(fills_[static_cast<size_t>(xf.fill_id)]);
        }
        if (xf.border_id >= 0 && static_cast<size_t>(xf.border_id) < borders_.size()) {
            builder.border(borders_[static_cast<size_t>(xf.border_id)]);
        }
        builder.alignment(xf.alignment)
               .protection(xf.protection)
               .numberFormat(number_format);

        styles_.push_back(builder.build());
    }
}

}} // namespace sheetbinder::reader
