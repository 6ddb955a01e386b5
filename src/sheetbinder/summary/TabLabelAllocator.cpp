#include "sheetbinder/summary/TabLabelAllocator.hpp"
#include "sheetbinder/utils/CommonUtils.hpp"
#include <algorithm>

namespace sheetbinder {
namespace summary {

std::string TabLabelAllocator::allocate(const std::string& desired,
                                        const std::vector<std::string>& used,
                                        size_t max_length) {
    // 工作表名称不区分大小写
    auto is_used = [&used](const std::string& candidate) {
        const std::string lowered = utils::CommonUtils::toLower(candidate);
        return std::any_of(used.begin(), used.end(), [&lowered](const std::string& name) {
            return utils::CommonUtils::toLower(name) == lowered;
        });
    };

    const std::string label = utils::CommonUtils::utf8Sanitize(desired);
    const std::string base = utils::CommonUtils::utf8Truncate(label.empty() ? "Sheet" : label, max_length);
    if (!is_used(base)) {
        return base;
    }

    for (size_t counter = 1;; ++counter) {
        const std::string suffix = "_" + std::to_string(counter);
        const size_t room = max_length > suffix.size() ? max_length - suffix.size() : 0;
        std::string candidate = utils::CommonUtils::utf8Truncate(base, room) + suffix;
        if (!is_used(candidate)) {
            return candidate;
        }
    }
}

}} // namespace sheetbinder::summary
