#pragma once

#include <string>
#include <string_view>

namespace sheetbinder {
namespace utils {

/**
 * @brief XML工具类 - 提供XML相关的辅助函数
 */
class XMLUtils {
public:
  /**
   * @brief XML转义 - 将特殊字符转换为XML实体
   * @param text 需要转义的文本
   * @param escape_quotes 是否转义引号（属性值需要）
   * @return 转义后的文本
   *
   * 跳过XML 1.0 不允许的控制字符（保留制表符、换行符、回车符）。
   */
  static std::string escapeXML(std::string_view text, bool escape_quotes = true) {
    std::string result;
    result.reserve(text.size() + text.size() / 8);

    for (char c : text) {
      switch (c) {
      case '<':
        result.append("&lt;");
        break;
      case '>':
        result.append("&gt;");
        break;
      case '&':
        result.append("&amp;");
        break;
      case '"':
        if (escape_quotes) result.append("&quot;"); else result.push_back(c);
        break;
      case '\'':
        if (escape_quotes) result.append("&apos;"); else result.push_back(c);
        break;
      default: {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x20 && uc != 0x09 && uc != 0x0A && uc != 0x0D) {
          continue;
        }
        result.push_back(c);
        break;
      }
      }
    }

    return result;
  }

  /**
   * @brief 判断文本是否需要 xml:space="preserve"（首尾空白）
   */
  static bool needsSpacePreserve(std::string_view text) {
    if (text.empty()) return false;
    auto is_space = [](char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; };
    return is_space(text.front()) || is_space(text.back());
  }
};

}} // namespace sheetbinder::utils
