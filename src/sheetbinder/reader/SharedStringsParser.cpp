#include "sheetbinder/reader/SharedStringsParser.hpp"

namespace sheetbinder {
namespace reader {

void SharedStringsParser::onStartElement(const std::string& name, const std::vector<xml::XMLAttribute>& /*attributes*/, int /*depth*/) {
    if (name == "si") {
        in_si_ = true;
        current_.clear();
    } else if (name == "t" && in_si_ && !isInElement("rPh")) {
        startCollectingText();
    }
}

void SharedStringsParser::onEndElement(const std::string& name, int /*depth*/) {
    if (name == "t" && state_.collecting_text) {
        current_ += getCurrentText();
        stopCollectingText();
    } else if (name == "si" && in_si_) {
        strings_.push_back(std::move(current_));
        current_.clear();
        in_si_ = false;
    }
}

const std::string& SharedStringsParser::getString(int index) const {
    static const std::string empty;
    if (index < 0 || static_cast<size_t>(index) >= strings_.size()) {
        return empty;
    }
    return strings_[static_cast<size_t>(index)];
}

}} // namespace sheetbinder::reader
