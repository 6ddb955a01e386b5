#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <functional>
#include <expat.h>

namespace sheetbinder {
namespace xml {

/**
 * @brief 流式XML解析器，基于libexpat
 *
 * SAX 事件回调：开始元素、结束元素、字符数据。
 * 元素名去掉命名空间前缀（"x:row" -> "row"），属性名保持原样。
 * 字符数据不做裁剪，实体已由 expat 解码。
 */

enum class XMLParseError {
    Ok,
    InvalidInput,
    ParserCreateFailed,
    ParseFailed,
    CallbackError
};

constexpr bool isSuccess(XMLParseError error) noexcept {
    return error == XMLParseError::Ok;
}

struct XMLAttribute {
    std::string name;
    std::string value;

    XMLAttribute(const std::string& n, const std::string& v) : name(n), value(v) {}
};

class XMLStreamReader {
public:
    using StartElementCallback = std::function<void(const std::string& name, const std::vector<XMLAttribute>& attributes, int depth)>;
    using EndElementCallback = std::function<void(const std::string& name, int depth)>;
    using TextCallback = std::function<void(std::string_view text, int depth)>;
    using ErrorCallback = std::function<void(XMLParseError error, const std::string& message, int line, int column)>;

private:
    XML_Parser parser_ = nullptr;

    int current_depth_ = 0;
    XMLParseError last_error_ = XMLParseError::Ok;
    std::string last_error_message_;
    size_t elements_parsed_ = 0;

    std::vector<XMLAttribute> attributes_;

    StartElementCallback start_element_callback_;
    EndElementCallback end_element_callback_;
    TextCallback text_callback_;
    ErrorCallback error_callback_;

    static void XMLCALL startElementHandler(void* userData, const XML_Char* name, const XML_Char** attrs);
    static void XMLCALL endElementHandler(void* userData, const XML_Char* name);
    static void XMLCALL characterDataHandler(void* userData, const XML_Char* data, int len);

    bool initializeParser();
    void cleanupParser();
    void handleError(XMLParseError error, const std::string& message);
    void abortWithCallbackError(const std::string& message);

    static std::string localName(const XML_Char* name);

public:
    XMLStreamReader() = default;
    ~XMLStreamReader();

    XMLStreamReader(const XMLStreamReader&) = delete;
    XMLStreamReader& operator=(const XMLStreamReader&) = delete;

    void setStartElementCallback(StartElementCallback callback) { start_element_callback_ = std::move(callback); }
    void setEndElementCallback(EndElementCallback callback) { end_element_callback_ = std::move(callback); }
    void setTextCallback(TextCallback callback) { text_callback_ = std::move(callback); }
    void setErrorCallback(ErrorCallback callback) { error_callback_ = std::move(callback); }

    /**
     * @brief 解析完整的 XML 文本
     * @return XMLParseError::Ok 表示成功
     */
    XMLParseError parseFromString(const std::string& xml_content);

    XMLParseError getLastError() const { return last_error_; }
    const std::string& getLastErrorMessage() const { return last_error_message_; }
    size_t getElementsParsed() const { return elements_parsed_; }
};

}} // namespace sheetbinder::xml
