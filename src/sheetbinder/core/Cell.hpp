#pragma once

#include "sheetbinder/core/StyleBundle.hpp"
#include <string>
#include <string_view>
#include <memory>
#include <cstdint>
#include <type_traits>

namespace sheetbinder {
namespace core {

enum class CellType : uint8_t {
    Empty = 0,
    Number = 1,
    String = 2,
    Boolean = 3,
    Formula = 4,
    Date = 5,     // 数值为 Excel 序列号
    Error = 6     // 文本为错误码，如 "#REF!"
};

/**
 * @brief 单元格：一个值加上可选的样式
 *
 * 样式为 nullptr 时使用工作簿默认样式。公式文本不带前导 "="，
 * 公式可携带上次计算的缓存结果（数值、文本、布尔或错误）。
 */
class Cell {
private:
    CellType type_ = CellType::Empty;
    double number_ = 0.0;        // Number / Date / Boolean(0/1)
    std::string text_;           // String 文本、Formula 公式、Error 错误码

    // 公式缓存结果
    CellType result_type_ = CellType::Empty;
    double result_number_ = 0.0;
    std::string result_text_;

    StylePtr style_;

    void resetValue();

public:
    Cell() = default;

    explicit Cell(const std::string& value);
    explicit Cell(const char* value);
    explicit Cell(double value);
    explicit Cell(int value);
    explicit Cell(bool value);

    Cell& operator=(double value);
    Cell& operator=(int value);
    Cell& operator=(bool value);
    Cell& operator=(const std::string& value);
    Cell& operator=(const char* value);

    Cell(const Cell& other) = default;
    Cell& operator=(const Cell& other) = default;
    Cell(Cell&& other) noexcept = default;
    Cell& operator=(Cell&& other) noexcept = default;

    // ========== 值设置 ==========

    template<typename T>
    void setValue(const T& value) {
        if constexpr (std::is_same_v<T, bool>) {
            setValueImpl(value);
        } else if constexpr (std::is_arithmetic_v<T>) {
            setValueImpl(static_cast<double>(value));
        } else if constexpr (std::is_convertible_v<T, std::string>) {
            setValueImpl(std::string(value));
        } else {
            static_assert(std::is_arithmetic_v<T>,
                          "Unsupported type for Cell::setValue<T>()");
        }
    }

    /**
     * @brief 设置公式（不带 "="），清除缓存结果
     */
    void setFormula(const std::string& formula);

    /**
     * @brief 设置公式及其数值缓存结果
     */
    void setFormula(const std::string& formula, double result);

    void setFormulaStringResult(const std::string& result);
    void setFormulaBooleanResult(bool result);
    void setFormulaErrorResult(const std::string& error);

    /**
     * @brief 设置日期值
     * @param serial Excel 序列号
     */
    void setDate(double serial);

    void setError(const std::string& error);

    /**
     * @brief 复制另一个单元格的值（包括公式缓存结果），不改变本单元格样式
     */
    void copyValueFrom(const Cell& other);

    // ========== 值获取 ==========

    CellType getType() const { return type_; }

    template<typename T>
    T getValue() const {
        if constexpr (std::is_same_v<T, std::string>) {
            return getStringValue();
        } else if constexpr (std::is_same_v<T, bool>) {
            return getBooleanValue();
        } else if constexpr (std::is_arithmetic_v<T>) {
            return static_cast<T>(getNumberValue());
        } else {
            static_assert(std::is_same_v<T, std::string>,
                          "Unsupported type for Cell::getValue<T>()");
        }
    }

    /**
     * @brief 字符串值：String 返回文本，Error 返回错误码，其余类型返回空串
     */
    const std::string& getStringValue() const;

    /**
     * @brief 数值：Number、Date 返回数值，公式返回数值缓存结果，其余为 0
     */
    double getNumberValue() const;

    bool getBooleanValue() const;

    /**
     * @brief 公式文本（不带 "="），非公式单元格返回空串
     */
    const std::string& getFormula() const;

    CellType getFormulaResultType() const { return result_type_; }
    double getFormulaResult() const { return result_number_; }
    const std::string& getFormulaResultText() const { return result_text_; }
    bool hasFormulaResult() const { return result_type_ != CellType::Empty; }

    bool isEmpty() const { return type_ == CellType::Empty; }
    bool isNumber() const { return type_ == CellType::Number; }
    bool isString() const { return type_ == CellType::String; }
    bool isBoolean() const { return type_ == CellType::Boolean; }
    bool isFormula() const { return type_ == CellType::Formula; }
    bool isDate() const { return type_ == CellType::Date; }
    bool isError() const { return type_ == CellType::Error; }

    // ========== 样式 ==========

    void setStyle(StylePtr style) { style_ = std::move(style); }
    const StylePtr& getStyle() const { return style_; }
    bool hasStyle() const { return style_ != nullptr; }

    /**
     * @brief 清空值，保留样式
     */
    void clearValue() { resetValue(); }

    /**
     * @brief 清空值和样式
     */
    void clear();

    /**
     * @brief 值是否相同（类型与内容，含公式缓存结果），不比较样式
     */
    bool sameValueAs(const Cell& other) const;

private:
    void setValueImpl(double value);
    void setValueImpl(bool value);
    void setValueImpl(const std::string& value);
};

}} // namespace sheetbinder::core
