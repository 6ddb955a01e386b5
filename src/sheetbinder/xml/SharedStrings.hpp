#pragma once

#include "sheetbinder/xml/XMLStreamWriter.hpp"
#include <string>
#include <vector>
#include <unordered_map>

namespace sheetbinder {
namespace xml {

/**
 * @brief 共享字符串表（写入 sharedStrings.xml）
 *
 * 相同文本只保存一次，索引按首次加入的顺序分配。
 */
class SharedStrings {
public:
    SharedStrings() = default;
    SharedStrings(const SharedStrings&) = delete;
    SharedStrings& operator=(const SharedStrings&) = delete;

    /**
     * @brief 添加字符串
     * @return 字符串索引
     */
    int addString(const std::string& str);

    /**
     * @return 索引，不存在时返回 -1
     */
    int getStringIndex(const std::string& str) const;

    size_t size() const { return strings_.size(); }

    /**
     * @brief 引用次数（每次 addString 计一次）
     */
    size_t getReferenceCount() const { return reference_count_; }

    void generate(XMLStreamWriter& writer) const;
    void clear();

private:
    std::vector<std::string> strings_;
    std::unordered_map<std::string, int> string_map_;
    size_t reference_count_ = 0;
};

}} // namespace sheetbinder::xml
