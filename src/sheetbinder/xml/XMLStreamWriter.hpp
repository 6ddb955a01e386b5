/**
 * @file XMLStreamWriter.hpp
 * @brief 内存缓冲的XML流写入器
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace sheetbinder {
namespace xml {

/**
 * @brief XML流写入器
 *
 * 元素按栈管理；startElement 之后、写入任何子内容之前可以追加属性。
 * 没有子内容的元素在 endElement 时写成自闭合形式。
 */
class XMLStreamWriter {
private:
    std::string buffer_;
    std::vector<std::string> element_stack_;
    bool in_start_tag_ = false;   // 开始标签尚未闭合，可继续写属性

    void closeStartTag();

public:
    XMLStreamWriter() = default;

    XMLStreamWriter(const XMLStreamWriter&) = delete;
    XMLStreamWriter& operator=(const XMLStreamWriter&) = delete;

    /**
     * @brief 写入 XML 声明
     */
    void startDocument();

    /**
     * @brief 关闭所有未结束的元素
     */
    void endDocument();

    void startElement(const std::string& name);
    void endElement();

    /**
     * @brief 写入不含子内容的元素（之后不能再追加属性）
     */
    void writeEmptyElement(const std::string& name);

    /**
     * @brief 写入属性
     * @throws XMLException 当前没有可追加属性的开始标签
     */
    void writeAttribute(const std::string& name, std::string_view value);
    void writeAttribute(const std::string& name, const char* value);
    void writeAttribute(const std::string& name, const std::string& value);
    void writeAttribute(const std::string& name, int value);
    void writeAttribute(const std::string& name, unsigned int value);
    void writeAttribute(const std::string& name, size_t value);
    void writeAttribute(const std::string& name, double value);

    void writeText(std::string_view text);

    /**
     * @brief 原样写入（调用方保证内容是合法 XML）
     */
    void writeRaw(std::string_view data);

    const std::string& toString() const { return buffer_; }
    std::string release();
    size_t getBytesWritten() const { return buffer_.size(); }
};

}} // namespace sheetbinder::xml
