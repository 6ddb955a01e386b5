#pragma once

#include "sheetbinder/core/StyleBundle.hpp"
#include <memory>
#include <unordered_map>
#include <vector>
#include <shared_mutex>

namespace sheetbinder {
namespace core {

/**
 * @brief 格式仓储 - 按值去重的样式表
 *
 * 保存工作簿时，把单元格引用的样式按值去重并编号，
 * 编号即 styles.xml 中 cellXfs 的下标。编号 0 固定为工作簿默认样式。
 */
class FormatRepository {
private:
    mutable std::shared_mutex mutex_;

    std::vector<StylePtr> formats_;

    // 哈希到ID的映射（同一哈希下可能有多个不相等的样式）
    std::unordered_map<size_t, std::vector<int>> hash_to_ids_;

    // 指针到ID的快速缓存
    std::unordered_map<const StyleBundle*, int> pointer_cache_;

    static constexpr int DEFAULT_FORMAT_ID = 0;

    int findExisting(const StyleBundle& format) const;

public:
    /**
     * @param default_style 工作簿默认样式，作为ID 0
     */
    explicit FormatRepository(StylePtr default_style);

    FormatRepository(const FormatRepository&) = delete;
    FormatRepository& operator=(const FormatRepository&) = delete;

    /**
     * @brief 添加样式（幂等操作）
     * @param format 样式，nullptr 表示默认样式
     * @return 样式ID，相等的样式返回同一ID
     */
    int addFormat(const StylePtr& format);

    /**
     * @brief 根据ID获取样式，无效ID返回默认样式
     */
    StylePtr getFormat(int id) const;

    int getDefaultFormatId() const { return DEFAULT_FORMAT_ID; }

    size_t getFormatCount() const {
        std::shared_lock lock(mutex_);
        return formats_.size();
    }
};

}} // namespace sheetbinder::core
