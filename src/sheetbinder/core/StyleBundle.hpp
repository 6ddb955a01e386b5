#pragma once

#include "sheetbinder/core/Color.hpp"
#include "sheetbinder/core/FormatTypes.hpp"
#include <string>
#include <cstdint>
#include <optional>
#include <memory>
#include <functional>

namespace sheetbinder {
namespace core {

/**
 * @brief 字体属性（对应 styles.xml 的 <font>）
 */
struct FontStyle {
    std::string name = "Calibri";
    double size = 11.0;
    bool bold = false;
    bool italic = false;
    bool strikeout = false;
    UnderlineType underline = UnderlineType::None;
    FontScript script = FontScript::None;
    std::optional<Color> color;
    std::optional<int> family;
    std::optional<int> charset;
    std::string scheme;   // "minor"/"major"，空表示未设置

    bool operator==(const FontStyle& other) const {
        return name == other.name && size == other.size && bold == other.bold &&
               italic == other.italic && strikeout == other.strikeout &&
               underline == other.underline && script == other.script &&
               color == other.color && family == other.family &&
               charset == other.charset && scheme == other.scheme;
    }
    bool operator!=(const FontStyle& other) const { return !(*this == other); }
    size_t hash() const;
};

/**
 * @brief 填充属性（对应 <fill><patternFill>）
 */
struct FillStyle {
    PatternType pattern = PatternType::None;
    std::optional<Color> fg_color;
    std::optional<Color> bg_color;

    bool operator==(const FillStyle& other) const {
        return pattern == other.pattern && fg_color == other.fg_color && bg_color == other.bg_color;
    }
    bool operator!=(const FillStyle& other) const { return !(*this == other); }
    size_t hash() const;
};

struct BorderSide {
    BorderStyle style = BorderStyle::None;
    std::optional<Color> color;

    bool operator==(const BorderSide& other) const {
        return style == other.style && color == other.color;
    }
    bool operator!=(const BorderSide& other) const { return !(*this == other); }
};

/**
 * @brief 边框属性（对应 <border>）
 */
struct BorderSet {
    BorderSide left;
    BorderSide right;
    BorderSide top;
    BorderSide bottom;
    BorderSide diagonal;
    bool diagonal_up = false;
    bool diagonal_down = false;

    bool operator==(const BorderSet& other) const {
        return left == other.left && right == other.right && top == other.top &&
               bottom == other.bottom && diagonal == other.diagonal &&
               diagonal_up == other.diagonal_up && diagonal_down == other.diagonal_down;
    }
    bool operator!=(const BorderSet& other) const { return !(*this == other); }
    size_t hash() const;
};

/**
 * @brief 对齐属性（对应 <xf><alignment>）
 */
struct AlignmentStyle {
    HorizontalAlign horizontal = HorizontalAlign::None;
    VerticalAlign vertical = VerticalAlign::None;
    bool wrap_text = false;
    bool shrink_to_fit = false;
    int rotation = 0;
    int indent = 0;

    bool isDefault() const { return *this == AlignmentStyle{}; }

    bool operator==(const AlignmentStyle& other) const {
        return horizontal == other.horizontal && vertical == other.vertical &&
               wrap_text == other.wrap_text && shrink_to_fit == other.shrink_to_fit &&
               rotation == other.rotation && indent == other.indent;
    }
    bool operator!=(const AlignmentStyle& other) const { return !(*this == other); }
};

/**
 * @brief 保护属性（对应 <xf><protection>）
 */
struct ProtectionStyle {
    bool locked = true;
    bool hidden = false;

    bool isDefault() const { return locked && !hidden; }

    bool operator==(const ProtectionStyle& other) const {
        return locked == other.locked && hidden == other.hidden;
    }
    bool operator!=(const ProtectionStyle& other) const { return !(*this == other); }
};

/**
 * @brief 数字格式：内置格式只有编号，自定义格式编号 >= 164 且带格式码
 */
struct NumberFormat {
    uint32_t id = 0;
    std::string code;

    /**
     * @brief 是否为日期/时间格式
     *
     * 内置编号 14-22、45-47 视为日期；自定义格式码在去掉引号文本、
     * 方括号段和转义字符后仍含 d/m/y/h/s 时视为日期。
     */
    bool isDate() const;

    bool operator==(const NumberFormat& other) const {
        return id == other.id && code == other.code;
    }
    bool operator!=(const NumberFormat& other) const { return !(*this == other); }
};

/**
 * @brief 不可变的单元格样式 - 值对象
 *
 * 一个 StyleBundle 描述单元格的全部可视属性：字体、填充、边框、
 * 对齐、保护和数字格式。创建后不可修改，只能经由 StyleBuilder 构造，
 * 以 std::shared_ptr<const StyleBundle> 在单元格之间共享。
 */
class StyleBundle {
private:
    const FontStyle font_;
    const FillStyle fill_;
    const BorderSet border_;
    const AlignmentStyle alignment_;
    const ProtectionStyle protection_;
    const NumberFormat number_format_;

    // 预计算的哈希值
    const size_t hash_value_;

    StyleBundle(FontStyle font, FillStyle fill, BorderSet border,
                AlignmentStyle alignment, ProtectionStyle protection,
                NumberFormat number_format);

    size_t calculateHash() const;

public:
    friend class StyleBuilder;

    StyleBundle(const StyleBundle& other) = default;
    StyleBundle(StyleBundle&& other) = default;
    StyleBundle& operator=(const StyleBundle& other) = delete;
    StyleBundle& operator=(StyleBundle&& other) = delete;

    /**
     * @brief 工作簿默认样式（Calibri 11，无填充无边框，General）
     */
    static const StyleBundle& getDefault();

    const FontStyle& getFont() const { return font_; }
    const FillStyle& getFill() const { return fill_; }
    const BorderSet& getBorder() const { return border_; }
    const AlignmentStyle& getAlignment() const { return alignment_; }
    const ProtectionStyle& getProtection() const { return protection_; }
    const NumberFormat& getNumberFormat() const { return number_format_; }

    bool isDateFormat() const { return number_format_.isDate(); }

    bool operator==(const StyleBundle& other) const;
    bool operator!=(const StyleBundle& other) const { return !(*this == other); }

    size_t hash() const { return hash_value_; }
};

using StylePtr = std::shared_ptr<const StyleBundle>;

}} // namespace sheetbinder::core

namespace std {
template<>
struct hash<sheetbinder::core::StyleBundle> {
    size_t operator()(const sheetbinder::core::StyleBundle& style) const {
        return style.hash();
    }
};
} // namespace std
