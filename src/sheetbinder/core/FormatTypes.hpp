#pragma once

/**
 * @file FormatTypes.hpp
 * @brief 样式相关的枚举类型以及与 OOXML 属性值之间的转换
 */

#include <cstdint>
#include <string>
#include <string_view>

namespace sheetbinder {
namespace core {

/**
 * @brief 下划线类型
 */
enum class UnderlineType : uint8_t {
    None = 0,
    Single = 1,
    Double = 2,
    SingleAccounting = 3,
    DoubleAccounting = 4
};

/**
 * @brief 字体脚本类型（上标/下标）
 */
enum class FontScript : uint8_t {
    None = 0,
    Superscript = 1,
    Subscript = 2
};

/**
 * @brief 水平对齐方式（None 表示未设置，沿用 general）
 */
enum class HorizontalAlign : uint8_t {
    None = 0,
    Left = 1,
    Center = 2,
    Right = 3,
    Fill = 4,
    Justify = 5,
    CenterAcross = 6,
    Distributed = 7
};

/**
 * @brief 垂直对齐方式（None 表示未设置，Excel 默认底端）
 */
enum class VerticalAlign : uint8_t {
    None = 0,
    Top = 1,
    Center = 2,
    Bottom = 3,
    Justify = 4,
    Distributed = 5
};

/**
 * @brief 填充模式
 */
enum class PatternType : uint8_t {
    None = 0,
    Solid = 1,
    MediumGray = 2,
    DarkGray = 3,
    LightGray = 4,
    DarkHorizontal = 5,
    DarkVertical = 6,
    DarkDown = 7,
    DarkUp = 8,
    DarkGrid = 9,
    DarkTrellis = 10,
    LightHorizontal = 11,
    LightVertical = 12,
    LightDown = 13,
    LightUp = 14,
    LightGrid = 15,
    LightTrellis = 16,
    Gray125 = 17,
    Gray0625 = 18
};

/**
 * @brief 边框样式
 */
enum class BorderStyle : uint8_t {
    None = 0,
    Thin = 1,
    Medium = 2,
    Thick = 3,
    Double = 4,
    Hair = 5,
    Dotted = 6,
    Dashed = 7,
    DashDot = 8,
    DashDotDot = 9,
    MediumDashed = 10,
    MediumDashDot = 11,
    MediumDashDotDot = 12,
    SlantDashDot = 13
};

// ========== OOXML 属性值转换 ==========
// 未识别的属性值统一映射为 None

const char* toXMLValue(UnderlineType type);
const char* toXMLValue(FontScript script);
const char* toXMLValue(HorizontalAlign align);
const char* toXMLValue(VerticalAlign align);
const char* toXMLValue(PatternType pattern);
const char* toXMLValue(BorderStyle style);

UnderlineType underlineFromXML(std::string_view value);
FontScript scriptFromXML(std::string_view value);
HorizontalAlign horizontalAlignFromXML(std::string_view value);
VerticalAlign verticalAlignFromXML(std::string_view value);
PatternType patternFromXML(std::string_view value);
BorderStyle borderStyleFromXML(std::string_view value);

}} // namespace sheetbinder::core
