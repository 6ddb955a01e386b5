#pragma once

#include <string>
#include <vector>

namespace sheetbinder {
namespace summary {

/**
 * @brief 工作表标签分配器
 *
 * 标签截断到最大长度（按 UTF-8 字符计）；与已用名称冲突时追加 _1、_2 ...，
 * 后缀完整保留，截断的是前面的基础部分。
 */
class TabLabelAllocator {
public:
    static constexpr size_t kMaxLabelLength = 31;

    static std::string allocate(const std::string& desired,
                                const std::vector<std::string>& used,
                                size_t max_length = kMaxLabelLength);
};

}} // namespace sheetbinder::summary
