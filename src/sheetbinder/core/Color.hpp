#pragma once

#include <string>
#include <cstdint>
#include <functional>
#include <algorithm>

namespace sheetbinder {
namespace core {

/**
 * @brief Color类 - Excel颜色
 *
 * 对应 styles.xml 中的 <color>/<fgColor>/<bgColor> 等元素：
 * - RGB颜色（ARGB，保留 alpha 通道）
 * - 主题颜色（可带 tint）
 * - 索引颜色
 * - 自动颜色
 */
class Color {
public:
    enum class Type : uint8_t {
        RGB = 0,
        Theme = 1,
        Indexed = 2,
        Auto = 3
    };

private:
    Type type_;
    uint32_t value_;    // ARGB值、主题索引或颜色索引
    double tint_;       // 色调调整 (-1.0 到 1.0)

public:
    /**
     * @brief 默认构造函数（不透明黑色）
     */
    Color() : type_(Type::RGB), value_(0xFF000000), tint_(0.0) {}

    /**
     * @brief RGB三参数构造函数（alpha 为 FF）
     */
    Color(uint8_t red, uint8_t green, uint8_t blue)
        : type_(Type::RGB),
          value_(0xFF000000 | (static_cast<uint32_t>(red) << 16) |
                 (static_cast<uint32_t>(green) << 8) | static_cast<uint32_t>(blue)),
          tint_(0.0) {}

    /**
     * @brief ARGB颜色构造函数
     * @param argb ARGB值，如 0xFF1F4E79
     */
    explicit Color(uint32_t argb) : type_(Type::RGB), value_(argb), tint_(0.0) {}

    static Color fromTheme(uint32_t theme_index, double tint = 0.0) {
        Color color;
        color.type_ = Type::Theme;
        color.value_ = theme_index;
        color.tint_ = tint;
        return color;
    }

    static Color fromIndex(uint32_t color_index, double tint = 0.0) {
        Color color;
        color.type_ = Type::Indexed;
        color.value_ = color_index;
        color.tint_ = tint;
        return color;
    }

    static Color automatic() {
        Color color;
        color.type_ = Type::Auto;
        color.value_ = 0;
        return color;
    }

    /**
     * @brief 从十六进制字符串创建颜色
     * @param hex_string "RRGGBB"、"AARRGGBB"，可带 # 前缀
     * @return 颜色；格式不正确时返回黑色
     */
    static Color fromHex(const std::string& hex_string);

    static const Color BLACK;
    static const Color WHITE;

    Type getType() const { return type_; }
    uint32_t getValue() const { return value_; }
    double getTint() const { return tint_; }

    void setTint(double tint) { tint_ = std::max(-1.0, std::min(1.0, tint)); }

    /**
     * @brief 转换为 8 位大写 ARGB 十六进制字符串（仅RGB类型有意义）
     */
    std::string toHex() const;

    bool operator==(const Color& other) const {
        return type_ == other.type_ && value_ == other.value_ && tint_ == other.tint_;
    }

    bool operator!=(const Color& other) const {
        return !(*this == other);
    }

    size_t hash() const {
        return std::hash<uint64_t>{}((static_cast<uint64_t>(type_) << 32) | value_) ^
               (std::hash<double>{}(tint_) << 1);
    }
};

}} // namespace sheetbinder::core
