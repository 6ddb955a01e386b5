#pragma once

#include "sheetbinder/reader/BaseSAXParser.hpp"
#include <string>
#include <vector>
#include <unordered_map>

namespace sheetbinder {
namespace reader {

/**
 * @brief .rels 关系文件解析器
 */
class RelationshipsParser : public BaseSAXParser {
public:
    struct Relationship {
        std::string id;          // 如 "rId1"
        std::string type;        // 关系类型URI
        std::string target;      // 如 "worksheets/sheet1.xml"
        std::string target_mode; // 默认 "Internal"
    };

    bool parse(const std::string& xml_content) {
        clear();
        return parseXML(xml_content);
    }

    const std::vector<Relationship>& getRelationships() const { return relationships_; }

    /**
     * @return 关系指针，未找到返回 nullptr
     */
    const Relationship* findById(const std::string& id) const;

    /**
     * @brief 第一个类型以 type_suffix 结尾的关系（如 "/officeDocument"）
     */
    const Relationship* findByTypeSuffix(const std::string& type_suffix) const;

    void clear() {
        relationships_.clear();
        id_index_.clear();
    }

private:
    std::vector<Relationship> relationships_;
    std::unordered_map<std::string, size_t> id_index_;

    void onStartElement(const std::string& name, const std::vector<xml::XMLAttribute>& attributes, int depth) override;
    void onEndElement(const std::string& name, int depth) override;
};

}} // namespace sheetbinder::reader
