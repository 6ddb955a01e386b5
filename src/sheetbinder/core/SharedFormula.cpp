#include "sheetbinder/core/SharedFormula.hpp"
#include "sheetbinder/utils/CommonUtils.hpp"
#include <cctype>

namespace sheetbinder {
namespace core {

namespace {

bool isNameChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.';
}

bool isUpper(char c) {
    return c >= 'A' && c <= 'Z';
}

bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

/**
 * @brief 尝试在 pos 处匹配 [$]COL[$]ROW 形式的单元格引用
 * @return 引用长度，不匹配时为 0
 */
size_t matchCellReference(const std::string& text, size_t pos,
                          bool& col_absolute, std::string& col_part,
                          bool& row_absolute, std::string& row_part) {
    size_t i = pos;
    col_absolute = i < text.size() && text[i] == '$';
    if (col_absolute) ++i;

    size_t col_start = i;
    while (i < text.size() && isUpper(text[i]) && i - col_start < 3) ++i;
    if (i == col_start) return 0;
    col_part = text.substr(col_start, i - col_start);

    row_absolute = i < text.size() && text[i] == '$';
    if (row_absolute) ++i;

    size_t row_start = i;
    while (i < text.size() && isDigit(text[i])) ++i;
    if (i == row_start || i - row_start > 7) return 0;
    row_part = text.substr(row_start, i - row_start);

    // 后面紧跟名称字符或左括号时是名称/函数（如 LOG10(）而不是引用
    if (i < text.size() && (isNameChar(text[i]) || text[i] == '(')) return 0;
    return i - pos;
}

int columnNumber(const std::string& letters) {
    int col = 0;
    for (char c : letters) {
        col = col * 26 + (c - 'A' + 1);
    }
    return col;
}

} // namespace

std::string SharedFormula::adjustFormula(const std::string& formula, int row_offset, int col_offset) {
    if (row_offset == 0 && col_offset == 0) {
        return formula;
    }

    std::string result;
    result.reserve(formula.size() + 8);

    size_t i = 0;
    while (i < formula.size()) {
        char c = formula[i];

        // 字符串字面量与带引号的工作表名原样复制（"" 与 '' 为转义）
        if (c == '"' || c == '\'') {
            size_t end = i + 1;
            while (end < formula.size()) {
                if (formula[end] == c) {
                    if (end + 1 < formula.size() && formula[end + 1] == c) {
                        end += 2;
                        continue;
                    }
                    break;
                }
                ++end;
            }
            size_t stop = end < formula.size() ? end + 1 : end;
            result.append(formula, i, stop - i);
            i = stop;
            continue;
        }

        bool at_boundary = i == 0 || !isNameChar(formula[i - 1]);
        if (at_boundary && (c == '$' || isUpper(c))) {
            bool col_abs = false, row_abs = false;
            std::string col_part, row_part;
            size_t len = matchCellReference(formula, i, col_abs, col_part, row_abs, row_part);
            if (len > 0) {
                int col = columnNumber(col_part) + (col_abs ? 0 : col_offset);
                long row = std::stol(row_part) + (row_abs ? 0 : row_offset);
                if (utils::CommonUtils::isValidCellPosition(static_cast<int>(row), col)) {
                    if (col_abs) result += '$';
                    result += utils::CommonUtils::columnToLetter(col);
                    if (row_abs) result += '$';
                    result += std::to_string(row);
                } else {
                    result.append(formula, i, len);
                }
                i += len;
                continue;
            }
        }

        // 跳过整个名称，避免在名称中间匹配引用
        if (isNameChar(c)) {
            size_t end = i;
            while (end < formula.size() && isNameChar(formula[end])) ++end;
            result.append(formula, i, end - i);
            i = end;
            continue;
        }

        result += c;
        ++i;
    }
    return result;
}

}} // namespace sheetbinder::core
