#pragma once

#include "sheetbinder/core/StyleBundle.hpp"
#include <unordered_map>
#include <memory>
#include <vector>

namespace sheetbinder {
namespace core {

/**
 * @brief 样式传输上下文 - 一次格式移植中的样式克隆映射
 *
 * 把模板工作表上的样式复制到目标工作簿时，每个源样式只克隆一次，
 * 之后引用同一源样式的单元格共享同一份克隆。克隆是独立的新对象，
 * 目标单元格永远不会持有模板工作簿中的样式指针。
 */
class StyleTransferContext {
private:
    // 源样式指针 -> 克隆样式
    std::unordered_map<const StyleBundle*, StylePtr> clone_cache_;

    // 保持源样式存活，避免地址被复用导致缓存误命中
    std::vector<StylePtr> sources_;

    size_t cloned_count_ = 0;
    size_t reused_count_ = 0;

public:
    StyleTransferContext() = default;
    ~StyleTransferContext() = default;

    StyleTransferContext(const StyleTransferContext&) = delete;
    StyleTransferContext& operator=(const StyleTransferContext&) = delete;
    StyleTransferContext(StyleTransferContext&&) = delete;
    StyleTransferContext& operator=(StyleTransferContext&&) = delete;

    /**
     * @brief 获取源样式对应的独立克隆
     * @param source 源样式，nullptr 表示工作簿默认样式
     * @return 克隆后的样式；source 为 nullptr 时返回 nullptr
     */
    StylePtr transfer(const StylePtr& source);

    struct TransferStats {
        size_t cloned_count;   // 新建的克隆数量
        size_t reused_count;   // 命中缓存的次数
    };

    TransferStats getTransferStats() const { return {cloned_count_, reused_count_}; }

    size_t getCacheSize() const { return clone_cache_.size(); }

    void clearCache();
};

}} // namespace sheetbinder::core
