#include "sheetbinder/core/StyleTransferContext.hpp"
#include "sheetbinder/core/StyleBuilder.hpp"
#include "sheetbinder/utils/ModuleLoggers.hpp"

namespace sheetbinder {
namespace core {

StylePtr StyleTransferContext::transfer(const StylePtr& source) {
    if (!source) {
        return nullptr;
    }

    auto it = clone_cache_.find(source.get());
    if (it != clone_cache_.end()) {
        ++reused_count_;
        return it->second;
    }

    StylePtr clone = StyleBuilder(*source).build();
    clone_cache_.emplace(source.get(), clone);
    sources_.push_back(source);
    ++cloned_count_;
    return clone;
}

void StyleTransferContext::clearCache() {
    CORE_DEBUG("Clearing style transfer cache: {} cloned, {} reused", cloned_count_, reused_count_);
    clone_cache_.clear();
    sources_.clear();
    cloned_count_ = 0;
    reused_count_ = 0;
}

}} // namespace sheetbinder::core
