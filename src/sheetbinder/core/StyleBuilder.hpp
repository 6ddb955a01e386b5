#pragma once

#include "sheetbinder/core/StyleBundle.hpp"
#include <string>
#include <memory>

namespace sheetbinder {
namespace core {

/**
 * @brief 样式构建器 - 流式API创建样式
 *
 * 链式设置各项属性，build() 生成新的不可变 StyleBundle。
 * 从已有样式构造时复制其全部属性，用于"基于现有样式修改"或整体克隆。
 */
class StyleBuilder {
private:
    FontStyle font_;
    FillStyle fill_;
    BorderSet border_;
    AlignmentStyle alignment_;
    ProtectionStyle protection_;
    NumberFormat number_format_;

public:
    StyleBuilder() = default;

    // 从现有样式创建Builder
    explicit StyleBuilder(const StyleBundle& style);

    // ========== 字体设置 ==========

    StyleBuilder& font(const FontStyle& font) {
        font_ = font;
        return *this;
    }

    StyleBuilder& fontName(const std::string& name) {
        font_.name = name;
        return *this;
    }

    /**
     * @brief 设置字体大小
     * @param size 磅值，必须为正数，否则忽略
     */
    StyleBuilder& fontSize(double size) {
        if (size > 0) {
            font_.size = size;
        }
        return *this;
    }

    StyleBuilder& fontColor(const Color& color) {
        font_.color = color;
        return *this;
    }

    StyleBuilder& bold(bool is_bold = true) {
        font_.bold = is_bold;
        return *this;
    }

    StyleBuilder& italic(bool is_italic = true) {
        font_.italic = is_italic;
        return *this;
    }

    StyleBuilder& underline(UnderlineType type = UnderlineType::Single) {
        font_.underline = type;
        return *this;
    }

    StyleBuilder& strikeout(bool is_strikeout = true) {
        font_.strikeout = is_strikeout;
        return *this;
    }

    // ========== 填充设置 ==========

    StyleBuilder& fill(const FillStyle& fill) {
        fill_ = fill;
        return *this;
    }

    /**
     * @brief 纯色填充（Excel 的 solid 填充颜色存放在 fgColor）
     */
    StyleBuilder& fill(const Color& color) {
        fill_.pattern = PatternType::Solid;
        fill_.fg_color = color;
        return *this;
    }

    StyleBuilder& fill(PatternType pattern, const Color& fg_color, const Color& bg_color) {
        fill_.pattern = pattern;
        fill_.fg_color = fg_color;
        fill_.bg_color = bg_color;
        return *this;
    }

    // ========== 边框设置 ==========

    StyleBuilder& border(const BorderSet& border) {
        border_ = border;
        return *this;
    }

    /**
     * @brief 设置四周边框
     */
    StyleBuilder& border(BorderStyle style, const Color& color = Color::BLACK) {
        border_.left = border_.right = border_.top = border_.bottom = BorderSide{style, color};
        return *this;
    }

    StyleBuilder& leftBorder(BorderStyle style, const Color& color = Color::BLACK) {
        border_.left = BorderSide{style, color};
        return *this;
    }

    StyleBuilder& rightBorder(BorderStyle style, const Color& color = Color::BLACK) {
        border_.right = BorderSide{style, color};
        return *this;
    }

    StyleBuilder& topBorder(BorderStyle style, const Color& color = Color::BLACK) {
        border_.top = BorderSide{style, color};
        return *this;
    }

    StyleBuilder& bottomBorder(BorderStyle style, const Color& color = Color::BLACK) {
        border_.bottom = BorderSide{style, color};
        return *this;
    }

    // ========== 对齐设置 ==========

    StyleBuilder& alignment(const AlignmentStyle& alignment) {
        alignment_ = alignment;
        return *this;
    }

    StyleBuilder& horizontalAlign(HorizontalAlign align) {
        alignment_.horizontal = align;
        return *this;
    }

    StyleBuilder& verticalAlign(VerticalAlign align) {
        alignment_.vertical = align;
        return *this;
    }

    StyleBuilder& textWrap(bool wrap = true) {
        alignment_.wrap_text = wrap;
        return *this;
    }

    StyleBuilder& shrinkToFit(bool shrink = true) {
        alignment_.shrink_to_fit = shrink;
        return *this;
    }

    StyleBuilder& rotation(int angle) {
        alignment_.rotation = angle;
        return *this;
    }

    StyleBuilder& indent(int level) {
        alignment_.indent = level;
        return *this;
    }

    // ========== 数字格式设置 ==========

    /**
     * @brief 设置自定义数字格式码（保存时分配 164 起的编号）
     */
    StyleBuilder& numberFormat(const std::string& code) {
        number_format_.id = 0;
        number_format_.code = code;
        return *this;
    }

    /**
     * @brief 设置内置数字格式编号
     */
    StyleBuilder& numberFormatIndex(uint32_t id) {
        number_format_.id = id;
        number_format_.code.clear();
        return *this;
    }

    StyleBuilder& numberFormat(const NumberFormat& format) {
        number_format_ = format;
        return *this;
    }

    StyleBuilder& date() { return numberFormatIndex(14); }

    // ========== 保护设置 ==========

    StyleBuilder& locked(bool is_locked = true) {
        protection_.locked = is_locked;
        return *this;
    }

    StyleBuilder& hidden(bool is_hidden = true) {
        protection_.hidden = is_hidden;
        return *this;
    }

    StyleBuilder& protection(const ProtectionStyle& protection) {
        protection_ = protection;
        return *this;
    }

    /**
     * @brief 构建新的不可变样式
     */
    StylePtr build() const;
};

}} // namespace sheetbinder::core
