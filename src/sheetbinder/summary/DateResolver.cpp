#include "sheetbinder/summary/DateResolver.hpp"
#include "sheetbinder/utils/ModuleLoggers.hpp"
#include <cctype>
#include <vector>

namespace sheetbinder {
namespace summary {

namespace {

bool allDigits(const std::string& text) {
    if (text.empty()) return false;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

/**
 * @brief 按分隔符切分，要求恰好三段
 */
bool splitThree(const std::string& text, char separator, std::vector<std::string>& parts) {
    parts.clear();
    size_t start = 0;
    while (true) {
        size_t pos = text.find(separator, start);
        parts.push_back(text.substr(start, pos == std::string::npos ? std::string::npos : pos - start));
        if (pos == std::string::npos) break;
        start = pos + 1;
    }
    return parts.size() == 3;
}

std::optional<utils::CivilDate> makeDate(int year, int month, int day) {
    if (!utils::TimeUtils::isValidDate(year, month, day)) {
        return std::nullopt;
    }
    return utils::CivilDate{year, month, day};
}

} // namespace

std::optional<std::string> DateResolver::resolve(const core::Worksheet& sheet, int scan_rows, int scan_cols) {
    // 第一遍：原生日期
    for (int row = 1; row <= scan_rows; ++row) {
        for (int col = 1; col <= scan_cols; ++col) {
            const core::Cell* cell = sheet.findCell(row, col);
            // 序列号小于 1 只有时间部分，不算日期
            if (cell && cell->isDate() && cell->getNumberValue() >= 1.0) {
                auto date = utils::TimeUtils::excelSerialToDate(cell->getNumberValue());
                if (utils::TimeUtils::isValidDate(date.year, date.month, date.day)) {
                    return utils::TimeUtils::formatCompactDate(date);
                }
            }
        }
    }

    // 第二遍：日期字符串
    for (int row = 1; row <= scan_rows; ++row) {
        for (int col = 1; col <= scan_cols; ++col) {
            const core::Cell* cell = sheet.findCell(row, col);
            if (cell && cell->isString()) {
                if (auto date = parseDateString(cell->getStringValue())) {
                    return utils::TimeUtils::formatCompactDate(*date);
                }
            }
        }
    }

    SUMMARY_DEBUG("No date found in scan window of '{}'", sheet.getName());
    return std::nullopt;
}

std::optional<utils::CivilDate> DateResolver::parseDateString(const std::string& text) {
    if (auto date = parseIsoDate(text)) return date;
    if (auto date = parseSlashDate(text, true)) return date;
    if (auto date = parseSlashDate(text, false)) return date;
    return parseCompactDate(text);
}

std::optional<utils::CivilDate> DateResolver::parseIsoDate(const std::string& text) {
    std::vector<std::string> parts;
    if (!splitThree(text, '-', parts)) return std::nullopt;

    const auto& y = parts[0];
    const auto& m = parts[1];
    const auto& d = parts[2];
    if (y.size() != 4 || !allDigits(y)) return std::nullopt;
    if (m.empty() || m.size() > 2 || !allDigits(m)) return std::nullopt;
    if (d.empty() || d.size() > 2 || !allDigits(d)) return std::nullopt;

    return makeDate(std::stoi(y), std::stoi(m), std::stoi(d));
}

std::optional<utils::CivilDate> DateResolver::parseSlashDate(const std::string& text, bool month_first) {
    std::vector<std::string> parts;
    if (!splitThree(text, '/', parts)) return std::nullopt;

    const auto& a = parts[0];
    const auto& b = parts[1];
    const auto& y = parts[2];
    if (a.empty() || a.size() > 2 || !allDigits(a)) return std::nullopt;
    if (b.empty() || b.size() > 2 || !allDigits(b)) return std::nullopt;
    if (y.size() != 4 || !allDigits(y)) return std::nullopt;

    int first = std::stoi(a);
    int second = std::stoi(b);
    return month_first ? makeDate(std::stoi(y), first, second)
                       : makeDate(std::stoi(y), second, first);
}

std::optional<utils::CivilDate> DateResolver::parseCompactDate(const std::string& text) {
    if (text.size() != 8 || !allDigits(text)) return std::nullopt;
    return makeDate(std::stoi(text.substr(0, 4)), std::stoi(text.substr(4, 2)), std::stoi(text.substr(6, 2)));
}

}} // namespace sheetbinder::summary
