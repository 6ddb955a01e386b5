#pragma once

#include "sheetbinder/reader/BaseSAXParser.hpp"
#include <string>
#include <vector>

namespace sheetbinder {
namespace reader {

/**
 * @brief xl/sharedStrings.xml 解析器
 *
 * 富文本 <r> 中各段 <t> 拼接为一个字符串，拼音 <rPh> 内的文本忽略。
 */
class SharedStringsParser : public BaseSAXParser {
public:
    bool parse(const std::string& xml_content) {
        strings_.clear();
        in_si_ = false;
        return parseXML(xml_content);
    }

    /**
     * @return 字符串内容，索引无效时返回空字符串
     */
    const std::string& getString(int index) const;

    size_t getStringCount() const { return strings_.size(); }

    /**
     * @brief 取出全部字符串（解析器随后为空）
     */
    std::vector<std::string> takeStrings() { return std::move(strings_); }

private:
    std::vector<std::string> strings_;
    std::string current_;
    bool in_si_ = false;

    void onStartElement(const std::string& name, const std::vector<xml::XMLAttribute>& attributes, int depth) override;
    void onEndElement(const std::string& name, int depth) override;
};

}} // namespace sheetbinder::reader
