#include "sheetbinder/xml/XMLStreamWriter.hpp"
#include "sheetbinder/core/Exception.hpp"
#include "sheetbinder/utils/XMLUtils.hpp"
#include <fmt/format.h>

namespace sheetbinder {
namespace xml {

void XMLStreamWriter::startDocument() {
    buffer_.append("<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n");
}

void XMLStreamWriter::endDocument() {
    while (!element_stack_.empty()) {
        endElement();
    }
}

void XMLStreamWriter::closeStartTag() {
    if (in_start_tag_) {
        buffer_.push_back('>');
        in_start_tag_ = false;
    }
}

void XMLStreamWriter::startElement(const std::string& name) {
    closeStartTag();
    buffer_.push_back('<');
    buffer_.append(name);
    element_stack_.push_back(name);
    in_start_tag_ = true;
}

void XMLStreamWriter::endElement() {
    if (element_stack_.empty()) {
        throw core::XMLException("endElement() without matching startElement()");
    }

    if (in_start_tag_) {
        buffer_.append("/>");
        in_start_tag_ = false;
    } else {
        buffer_.append("</");
        buffer_.append(element_stack_.back());
        buffer_.push_back('>');
    }
    element_stack_.pop_back();
}

void XMLStreamWriter::writeEmptyElement(const std::string& name) {
    startElement(name);
    endElement();
}

void XMLStreamWriter::writeAttribute(const std::string& name, std::string_view value) {
    if (!in_start_tag_) {
        throw core::XMLException(fmt::format("Attribute '{}' written outside of a start tag", name));
    }
    buffer_.push_back(' ');
    buffer_.append(name);
    buffer_.append("=\"");
    buffer_.append(utils::XMLUtils::escapeXML(value, true));
    buffer_.push_back('"');
}

void XMLStreamWriter::writeAttribute(const std::string& name, const char* value) {
    writeAttribute(name, std::string_view(value ? value : ""));
}

void XMLStreamWriter::writeAttribute(const std::string& name, const std::string& value) {
    writeAttribute(name, std::string_view(value));
}

void XMLStreamWriter::writeAttribute(const std::string& name, int value) {
    writeAttribute(name, std::string_view(fmt::format("{}", value)));
}

void XMLStreamWriter::writeAttribute(const std::string& name, unsigned int value) {
    writeAttribute(name, std::string_view(fmt::format("{}", value)));
}

void XMLStreamWriter::writeAttribute(const std::string& name, size_t value) {
    writeAttribute(name, std::string_view(fmt::format("{}", value)));
}

void XMLStreamWriter::writeAttribute(const std::string& name, double value) {
    writeAttribute(name, std::string_view(fmt::format("{}", value)));
}

void XMLStreamWriter::writeText(std::string_view text) {
    closeStartTag();
    buffer_.append(utils::XMLUtils::escapeXML(text, false));
}

void XMLStreamWriter::writeRaw(std::string_view data) {
    closeStartTag();
    buffer_.append(data);
}

std::string XMLStreamWriter::release() {
    std::string result;
    result.swap(buffer_);
    element_stack_.clear();
    in_start_tag_ = false;
    return result;
}

}} // namespace sheetbinder::xml
