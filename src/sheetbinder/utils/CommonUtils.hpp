#pragma once

#include <string>
#include <iterator>
#include <utf8.h>
#include <utility>
#include <cctype>
#include <stdexcept>

namespace sheetbinder {
namespace utils {

/**
 * @brief 通用工具类 - 单元格引用与工作表名称
 *
 * 行列均为1开始（A1 -> (1, 1)），与工作表模型一致。
 */
class CommonUtils {
public:
    static constexpr int kMaxRows = 1048576;
    static constexpr int kMaxCols = 16384;
    static constexpr size_t kMaxSheetNameLength = 31;

    /**
     * @brief 列号转换为字母表示（1 -> A, 27 -> AA）
     * @param col 列号（1开始）
     * @return 字母表示
     */
    static std::string columnToLetter(int col) {
        std::string result;
        while (col > 0) {
            int rem = (col - 1) % 26;
            result.insert(result.begin(), static_cast<char>('A' + rem));
            col = (col - 1) / 26;
        }
        return result;
    }

    /**
     * @brief 生成单元格引用（如A1, B2等）
     * @param row 行号（1开始）
     * @param col 列号（1开始）
     */
    static std::string cellReference(int row, int col) {
        return columnToLetter(col) + std::to_string(row);
    }

    /**
     * @brief 生成范围引用（如A1:B2）
     */
    static std::string rangeReference(int first_row, int first_col, int last_row, int last_col) {
        return cellReference(first_row, first_col) + ":" + cellReference(last_row, last_col);
    }

    /**
     * @brief 解析单元格引用（如A1 -> (1, 1)），允许 $ 绝对引用标记
     * @param reference 单元格引用字符串
     * @return 行列坐标（1开始）
     * @throws std::invalid_argument 如果引用格式不正确
     */
    static std::pair<int, int> parseReference(const std::string& reference) {
        if (reference.empty()) {
            throw std::invalid_argument("Empty cell reference");
        }

        size_t i = 0;
        if (reference[i] == '$') ++i;

        // 解析列部分 (A-Z)
        int col = 0;
        while (i < reference.length() && std::isalpha(static_cast<unsigned char>(reference[i]))) {
            char c = static_cast<char>(std::toupper(static_cast<unsigned char>(reference[i])));
            col = col * 26 + (c - 'A' + 1);
            if (col > kMaxCols) {
                throw std::invalid_argument("Column out of range in reference: " + reference);
            }
            ++i;
        }

        if (col == 0) {
            throw std::invalid_argument("No column part in reference: " + reference);
        }

        if (i < reference.length() && reference[i] == '$') ++i;

        // 解析行部分
        if (i >= reference.length() || !std::isdigit(static_cast<unsigned char>(reference[i]))) {
            throw std::invalid_argument("No row part in reference: " + reference);
        }

        long row = 0;
        while (i < reference.length() && std::isdigit(static_cast<unsigned char>(reference[i]))) {
            row = row * 10 + (reference[i] - '0');
            if (row > kMaxRows) {
                throw std::invalid_argument("Row out of range in reference: " + reference);
            }
            ++i;
        }

        if (row == 0) {
            throw std::invalid_argument("Invalid row number in reference: " + reference);
        }

        if (i < reference.length()) {
            throw std::invalid_argument("Invalid characters at end of reference: " + reference);
        }

        return std::make_pair(static_cast<int>(row), col);
    }

    /**
     * @brief 验证单元格位置是否有效（1开始）
     */
    static bool isValidCellPosition(int row, int col) {
        return row >= 1 && col >= 1 && row <= kMaxRows && col <= kMaxCols;
    }

    /**
     * @brief 验证工作表名称是否有效
     *
     * Excel 限制：合法 UTF-8、非空、最多31个字符、不含 []*\/?: 、不以单引号开头或结尾。
     */
    static bool isValidSheetName(const std::string& name) {
        if (name.empty() || !utf8::is_valid(name.begin(), name.end())) {
            return false;
        }
        if (static_cast<size_t>(utf8::distance(name.begin(), name.end())) > kMaxSheetNameLength) {
            return false;
        }
        if (name.front() == '\'' || name.back() == '\'') {
            return false;
        }
        const std::string invalid_chars = "[]*/\\?:";
        return name.find_first_of(invalid_chars) == std::string::npos;
    }

    /**
     * @brief 把非法 UTF-8 字节序列替换为 U+FFFD
     */
    static std::string utf8Sanitize(const std::string& text) {
        if (utf8::is_valid(text.begin(), text.end())) {
            return text;
        }
        std::string result;
        result.reserve(text.size());
        utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(result));
        return result;
    }

    /**
     * @brief UTF-8 字符数，非法序列按替换后的字符计数
     */
    static size_t utf8Length(const std::string& text) {
        const std::string valid = utf8Sanitize(text);
        return static_cast<size_t>(utf8::distance(valid.begin(), valid.end()));
    }

    /**
     * @brief 按字符数截断 UTF-8 字符串，不切断多字节字符
     *
     * 输入先经过 utf8Sanitize，结果总是合法的 UTF-8。
     */
    static std::string utf8Truncate(const std::string& text, size_t max_chars) {
        std::string valid = utf8Sanitize(text);
        if (static_cast<size_t>(utf8::distance(valid.begin(), valid.end())) <= max_chars) {
            return valid;
        }
        auto it = valid.begin();
        utf8::advance(it, max_chars, valid.end());
        return std::string(valid.begin(), it);
    }

    /**
     * @brief ASCII 小写转换
     */
    static std::string toLower(std::string text) {
        for (auto& c : text) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return text;
    }
};

}} // namespace sheetbinder::utils
