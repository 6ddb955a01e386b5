#pragma once

#include <string>
#include <vector>
#include <algorithm>

namespace sheetbinder {
namespace core {

/**
 * @brief 定义名称条目（workbook.xml 中的 <definedName>）
 */
struct DefinedName {
    std::string name;     ///< 名称，如 "Rate" 或 "_xlnm.Print_Area"
    std::string formula;  ///< 公式或引用，不含前导 '='
    std::string scope;    ///< 作用域工作表名，空字符串表示工作簿级
    bool hidden = false;

    DefinedName() = default;
    DefinedName(const std::string& n, const std::string& f, const std::string& s = "")
        : name(n), formula(f), scope(s) {}

    bool operator==(const DefinedName& other) const {
        return name == other.name && formula == other.formula && scope == other.scope;
    }
};

/**
 * @brief 定义名称管理器
 *
 * 同一作用域内名称唯一，重复定义时覆盖原值。
 */
class DefinedNameManager {
private:
    std::vector<DefinedName> defined_names_;

public:
    void define(const DefinedName& defined_name) {
        auto it = std::find_if(defined_names_.begin(), defined_names_.end(),
                               [&defined_name](const DefinedName& dn) {
                                   return dn.name == defined_name.name && dn.scope == defined_name.scope;
                               });
        if (it != defined_names_.end()) {
            *it = defined_name;
        } else {
            defined_names_.push_back(defined_name);
        }
    }

    /**
     * @brief 删除满足条件的名称
     * @return 删除的数量
     */
    template<typename Predicate>
    size_t removeIf(Predicate predicate) {
        auto it = std::remove_if(defined_names_.begin(), defined_names_.end(), predicate);
        size_t removed = static_cast<size_t>(std::distance(it, defined_names_.end()));
        defined_names_.erase(it, defined_names_.end());
        return removed;
    }

    const std::vector<DefinedName>& getAll() const { return defined_names_; }
    size_t size() const { return defined_names_.size(); }
    bool empty() const { return defined_names_.empty(); }
};

}} // namespace sheetbinder::core
