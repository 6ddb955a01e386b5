#pragma once

#include <string>
#include <ctime>
#include <cmath>
#include <cstdint>
#include <optional>
#include <fmt/format.h>

namespace sheetbinder {
namespace utils {

/**
 * @brief 公历日期（年月日）
 */
struct CivilDate {
    int year = 1900;
    int month = 1;
    int day = 1;

    bool operator==(const CivilDate& other) const {
        return year == other.year && month == other.month && day == other.day;
    }
};

/**
 * @brief 时间工具类 - 统一处理时间相关操作
 *
 * Excel 序列号采用 1900 日期系统：1 = 1900-01-01，
 * 并保留 Excel 把 1900 年当作闰年的历史行为（序列号 60 = 1900-02-29）。
 */
class TimeUtils {
public:
    /**
     * @brief 获取当前UTC时间的 std::tm 结构
     */
    static std::tm getCurrentUTCTime() {
        std::time_t now = std::time(nullptr);
        std::tm result{};
#ifdef _WIN32
        gmtime_s(&result, &now);
#else
        gmtime_r(&now, &result);
#endif
        return result;
    }

    /**
     * @brief 格式化时间为ISO 8601格式 (YYYY-MM-DDTHH:MM:SSZ)
     */
    static std::string formatTimeISO8601(const std::tm& time) {
        return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}Z",
                           time.tm_year + 1900, time.tm_mon + 1, time.tm_mday,
                           time.tm_hour, time.tm_min, time.tm_sec);
    }

    static bool isLeapYear(int year) {
        return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    }

    static int daysInMonth(int year, int month) {
        static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        if (month < 1 || month > 12) return 0;
        if (month == 2 && isLeapYear(year)) return 29;
        return kDays[month - 1];
    }

    /**
     * @brief 校验公历日期（年份 1..9999）
     */
    static bool isValidDate(int year, int month, int day) {
        return year >= 1 && year <= 9999 &&
               month >= 1 && month <= 12 &&
               day >= 1 && day <= daysInMonth(year, month);
    }

    /**
     * @brief 公历日期 -> 自 1970-01-01 起的天数
     */
    static int64_t daysFromCivil(int y, int m, int d) {
        y -= m <= 2;
        const int64_t era = (y >= 0 ? y : y - 399) / 400;
        const unsigned yoe = static_cast<unsigned>(y - era * 400);
        const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
        const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + static_cast<int64_t>(doe) - 719468;
    }

    /**
     * @brief 自 1970-01-01 起的天数 -> 公历日期
     */
    static CivilDate civilFromDays(int64_t z) {
        z += 719468;
        const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
        const unsigned doe = static_cast<unsigned>(z - era * 146097);
        const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
        const int64_t y = static_cast<int64_t>(yoe) + era * 400;
        const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
        const unsigned mp = (5 * doy + 2) / 153;
        const unsigned d = doy - (153 * mp + 2) / 5 + 1;
        const unsigned m = mp < 10 ? mp + 3 : mp - 9;
        return CivilDate{static_cast<int>(y + (m <= 2)), static_cast<int>(m), static_cast<int>(d)};
    }

    /**
     * @brief Excel 序列号 -> 公历日期（忽略时间部分）
     *
     * 序列号 60（不存在的 1900-02-29）按 1900-02-28 处理。
     */
    static CivilDate excelSerialToDate(double serial) {
        int64_t days = static_cast<int64_t>(std::floor(serial));
        // 1899-12-30 距 1970-01-01 为 -25569 天
        if (days < 60) {
            return civilFromDays(days - 25568);
        }
        if (days == 60) {
            return CivilDate{1900, 2, 28};
        }
        return civilFromDays(days - 25569);
    }

    /**
     * @brief 公历日期 -> Excel 序列号
     */
    static double dateToExcelSerial(const CivilDate& date) {
        int64_t days = daysFromCivil(date.year, date.month, date.day) + 25569;
        if (days < 61) {
            // 1900-03-01 之前没有虚构闰日的偏移
            days -= 1;
        }
        return static_cast<double>(days);
    }

    /**
     * @brief ISO 8601 日期时间 -> Excel 序列号
     *
     * 接受 "YYYY-MM-DD" 与 "YYYY-MM-DDTHH:MM[:SS[.fff]][Z]"，即 t="d" 单元格的取值。
     */
    static std::optional<double> isoToExcelSerial(const std::string& text) {
        auto number = [&text](size_t pos, size_t len, int& out) {
            if (pos + len > text.size()) return false;
            out = 0;
            for (size_t i = pos; i < pos + len; ++i) {
                if (text[i] < '0' || text[i] > '9') return false;
                out = out * 10 + (text[i] - '0');
            }
            return true;
        };

        CivilDate date;
        if (text.size() < 10 || text[4] != '-' || text[7] != '-' ||
            !number(0, 4, date.year) || !number(5, 2, date.month) || !number(8, 2, date.day) ||
            !isValidDate(date.year, date.month, date.day)) {
            return std::nullopt;
        }
        double serial = dateToExcelSerial(date);
        if (text.size() == 10) {
            return serial;
        }

        int hour = 0, minute = 0, second = 0;
        if (text[10] != 'T' || text.size() < 16 || text[13] != ':' ||
            !number(11, 2, hour) || !number(14, 2, minute) || hour > 23 || minute > 59) {
            return std::nullopt;
        }
        size_t pos = 16;
        if (pos < text.size() && text[pos] == ':') {
            if (!number(pos + 1, 2, second) || second > 59) return std::nullopt;
            pos += 3;
        }
        double fraction = 0.0;
        if (pos < text.size() && text[pos] == '.') {
            double scale = 0.1;
            for (++pos; pos < text.size() && text[pos] >= '0' && text[pos] <= '9'; ++pos) {
                fraction += (text[pos] - '0') * scale;
                scale /= 10.0;
            }
        }
        if (pos < text.size() && text[pos] == 'Z') ++pos;
        if (pos != text.size()) {
            return std::nullopt;
        }
        return serial + (hour * 3600 + minute * 60 + second + fraction) / 86400.0;
    }

    /**
     * @brief 格式化为紧凑日期 YYYYMMDD
     */
    static std::string formatCompactDate(const CivilDate& date) {
        return fmt::format("{:04d}{:02d}{:02d}", date.year, date.month, date.day);
    }
};

}} // namespace sheetbinder::utils
