#include "sheetbinder/xml/XMLStreamReader.hpp"
#include "sheetbinder/utils/ModuleLoggers.hpp"
#include <cstring>
#include <climits>
#include <fmt/format.h>

namespace sheetbinder {
namespace xml {

XMLStreamReader::~XMLStreamReader() {
    cleanupParser();
}

bool XMLStreamReader::initializeParser() {
    cleanupParser();

    parser_ = XML_ParserCreate(nullptr);
    if (!parser_) {
        handleError(XMLParseError::ParserCreateFailed, "Failed to create XML parser");
        return false;
    }

    XML_SetUserData(parser_, this);
    XML_SetElementHandler(parser_, startElementHandler, endElementHandler);
    XML_SetCharacterDataHandler(parser_, characterDataHandler);
    return true;
}

void XMLStreamReader::cleanupParser() {
    if (parser_) {
        XML_ParserFree(parser_);
        parser_ = nullptr;
    }
}

XMLParseError XMLStreamReader::parseFromString(const std::string& xml_content) {
    current_depth_ = 0;
    elements_parsed_ = 0;
    last_error_ = XMLParseError::Ok;
    last_error_message_.clear();

    if (xml_content.empty() || xml_content.size() > static_cast<size_t>(INT_MAX)) {
        handleError(XMLParseError::InvalidInput, "Invalid XML buffer size");
        return last_error_;
    }

    if (!initializeParser()) {
        return last_error_;
    }

    if (XML_Parse(parser_, xml_content.data(), static_cast<int>(xml_content.size()), 1) == XML_STATUS_ERROR) {
        // 回调出错时已记录了更具体的错误
        if (last_error_ == XMLParseError::Ok) {
            handleError(XMLParseError::ParseFailed,
                        fmt::format("Parse error at line {}, column {}: {}",
                                    XML_GetCurrentLineNumber(parser_),
                                    XML_GetCurrentColumnNumber(parser_),
                                    XML_ErrorString(XML_GetErrorCode(parser_))));
        }
        cleanupParser();
        return last_error_;
    }

    cleanupParser();
    return last_error_;
}

std::string XMLStreamReader::localName(const XML_Char* name) {
    const char* colon = std::strchr(name, ':');
    return colon ? std::string(colon + 1) : std::string(name);
}

void XMLCALL XMLStreamReader::startElementHandler(void* userData, const XML_Char* name, const XML_Char** attrs) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);
    reader->elements_parsed_++;

    reader->attributes_.clear();
    if (attrs) {
        for (int i = 0; attrs[i]; i += 2) {
            reader->attributes_.emplace_back(attrs[i], attrs[i + 1] ? attrs[i + 1] : "");
        }
    }

    if (reader->start_element_callback_) {
        try {
            reader->start_element_callback_(localName(name), reader->attributes_, reader->current_depth_);
        } catch (const std::exception& e) {
            reader->abortWithCallbackError(fmt::format("Start element callback error: {}", e.what()));
        }
    }
    reader->current_depth_++;
}

void XMLCALL XMLStreamReader::endElementHandler(void* userData, const XML_Char* name) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);
    reader->current_depth_--;

    if (reader->end_element_callback_) {
        try {
            reader->end_element_callback_(localName(name), reader->current_depth_);
        } catch (const std::exception& e) {
            reader->abortWithCallbackError(fmt::format("End element callback error: {}", e.what()));
        }
    }
}

void XMLCALL XMLStreamReader::characterDataHandler(void* userData, const XML_Char* data, int len) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);

    if (reader->text_callback_ && len > 0) {
        try {
            reader->text_callback_(std::string_view(data, static_cast<size_t>(len)), reader->current_depth_);
        } catch (const std::exception& e) {
            reader->abortWithCallbackError(fmt::format("Text callback error: {}", e.what()));
        }
    }
}

void XMLStreamReader::abortWithCallbackError(const std::string& message) {
    handleError(XMLParseError::CallbackError, message);
    XML_StopParser(parser_, XML_FALSE);
}

void XMLStreamReader::handleError(XMLParseError error, const std::string& message) {
    last_error_ = error;
    last_error_message_ = message;
    XML_ERROR("{}", message);

    if (error_callback_) {
        int line = parser_ ? static_cast<int>(XML_GetCurrentLineNumber(parser_)) : 0;
        int column = parser_ ? static_cast<int>(XML_GetCurrentColumnNumber(parser_)) : 0;
        error_callback_(error, message, line, column);
    }
}

}} // namespace sheetbinder::xml
