#include "sheetbinder/xml/SharedStrings.hpp"
#include "sheetbinder/utils/XMLUtils.hpp"

namespace sheetbinder {
namespace xml {

int SharedStrings::addString(const std::string& str) {
    ++reference_count_;
    auto it = string_map_.find(str);
    if (it != string_map_.end()) {
        return it->second;
    }

    int index = static_cast<int>(strings_.size());
    strings_.push_back(str);
    string_map_.emplace(str, index);
    return index;
}

int SharedStrings::getStringIndex(const std::string& str) const {
    auto it = string_map_.find(str);
    return it != string_map_.end() ? it->second : -1;
}

void SharedStrings::generate(XMLStreamWriter& writer) const {
    writer.startDocument();
    writer.startElement("sst");
    writer.writeAttribute("xmlns", "http://schemas.openxmlformats.org/spreadsheetml/2006/main");
    writer.writeAttribute("count", reference_count_);
    writer.writeAttribute("uniqueCount", strings_.size());

    for (const auto& str : strings_) {
        writer.startElement("si");
        writer.startElement("t");
        if (utils::XMLUtils::needsSpacePreserve(str)) {
            writer.writeAttribute("xml:space", "preserve");
        }
        writer.writeText(str);
        writer.endElement(); // t
        writer.endElement(); // si
    }

    writer.endElement(); // sst
    writer.endDocument();
}

void SharedStrings::clear() {
    strings_.clear();
    string_map_.clear();
    reference_count_ = 0;
}

}} // namespace sheetbinder::xml
