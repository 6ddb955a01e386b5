#include "sheetbinder/reader/WorkbookParser.hpp"

namespace sheetbinder {
namespace reader {

void WorkbookParser::onStartElement(const std::string& name, const std::vector<xml::XMLAttribute>& attributes, int /*depth*/) {
    if (name == "workbookView") {
        int active = getIntAttributeOr(attributes, "activeTab", 0);
        active_tab_ = active > 0 ? static_cast<size_t>(active) : 0;
    } else if (name == "sheets") {
        in_sheets_ = true;
    } else if (name == "sheet" && in_sheets_) {
        SheetInfo info;
        info.name = getAttributeOr(attributes, "name", "");
        info.sheet_id = getIntAttributeOr(attributes, "sheetId", 0);
        info.rel_id = findPrefixedAttribute(attributes, "id").value_or("");
        info.state = getAttributeOr(attributes, "state", "visible");

        if (info.name.empty() || info.rel_id.empty()) {
            READER_WARN("Sheet element missing name or relationship id: name='{}', r:id='{}'",
                        info.name, info.rel_id);
            return;
        }
        READER_DEBUG("Found sheet '{}' (rel {})", info.name, info.rel_id);
        sheets_.push_back(std::move(info));
    } else if (name == "definedName") {
        current_name_ = DefinedNameInfo{};
        current_name_.name = getAttributeOr(attributes, "name", "");
        current_name_.local_sheet_id = getIntAttributeOr(attributes, "localSheetId", -1);
        current_name_.hidden = getAttributeOr(attributes, "hidden", "0") == "1" ||
                               getAttributeOr(attributes, "hidden", "0") == "true";
        in_defined_name_ = true;
        startCollectingText();
    }
}

void WorkbookParser::onEndElement(const std::string& name, int /*depth*/) {
    if (name == "sheets") {
        in_sheets_ = false;
    } else if (name == "definedName" && in_defined_name_) {
        current_name_.formula = getCurrentText();
        stopCollectingText();
        in_defined_name_ = false;
        if (current_name_.name.empty() || current_name_.formula.empty()) {
            READER_WARN("Skipping defined name without name or value: '{}'", current_name_.name);
            return;
        }
        defined_names_.push_back(std::move(current_name_));
    }
}

}} // namespace sheetbinder::reader
