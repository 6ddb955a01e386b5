#pragma once

#include "sheetbinder/xml/XMLStreamWriter.hpp"
#include <string>
#include <vector>

namespace sheetbinder {
namespace xml {

struct Relationship {
    std::string id;
    std::string type;
    std::string target;
    std::string target_mode; // "Internal" 或 "External"
};

/**
 * @brief .rels 关系部件生成器
 */
class Relationships {
public:
    void addRelationship(const std::string& id, const std::string& type, const std::string& target);

    /**
     * @brief 以 rId1、rId2 ... 自动编号添加关系
     * @return 分配的关系ID
     */
    std::string addAutoRelationship(const std::string& type, const std::string& target);

    void generate(XMLStreamWriter& writer) const;

    size_t size() const { return relationships_.size(); }

private:
    std::vector<Relationship> relationships_;

    std::string generateId() const;
};

}} // namespace sheetbinder::xml
