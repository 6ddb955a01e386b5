#include "sheetbinder/reader/RelationshipsParser.hpp"

namespace sheetbinder {
namespace reader {

void RelationshipsParser::onStartElement(const std::string& name, const std::vector<xml::XMLAttribute>& attributes, int /*depth*/) {
    if (name != "Relationship") {
        return;
    }

    Relationship rel;
    rel.id = getAttributeOr(attributes, "Id", "");
    rel.type = getAttributeOr(attributes, "Type", "");
    rel.target = getAttributeOr(attributes, "Target", "");
    rel.target_mode = getAttributeOr(attributes, "TargetMode", "Internal");

    if (rel.id.empty() || rel.target.empty()) {
        READER_WARN("Skipping relationship without Id or Target");
        return;
    }

    id_index_[rel.id] = relationships_.size();
    relationships_.push_back(std::move(rel));
}

void RelationshipsParser::onEndElement(const std::string& /*name*/, int /*depth*/) {
}

const RelationshipsParser::Relationship* RelationshipsParser::findById(const std::string& id) const {
    auto it = id_index_.find(id);
    return it != id_index_.end() ? &relationships_[it->second] : nullptr;
}

const RelationshipsParser::Relationship* RelationshipsParser::findByTypeSuffix(const std::string& type_suffix) const {
    for (const auto& rel : relationships_) {
        if (rel.type.size() >= type_suffix.size() &&
            rel.type.compare(rel.type.size() - type_suffix.size(), type_suffix.size(), type_suffix) == 0) {
            return &rel;
        }
    }
    return nullptr;
}

}} // namespace sheetbinder::reader
