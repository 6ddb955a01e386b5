#pragma once

#include "sheetbinder/xml/XMLStreamReader.hpp"
#include "sheetbinder/utils/CommonUtils.hpp"
#include "sheetbinder/utils/ModuleLoggers.hpp"
#include <fast_float/fast_float.h>
#include <string>
#include <string_view>
#include <vector>
#include <optional>

namespace sheetbinder {
namespace reader {

/**
 * @brief SAX解析器基类 - 各 xlsx 部件解析器共用
 *
 * 负责驱动 XMLStreamReader、维护元素栈与文本收集，并提供属性提取工具。
 * 子类只需实现 onStartElement / onEndElement（以及可选的 onText）。
 */
class BaseSAXParser {
protected:
    struct ParseState {
        std::vector<std::string> element_stack;
        int current_depth = 0;
        std::string current_text;
        bool collecting_text = false;
        bool has_error = false;
        std::string error_message;

        void reset() {
            element_stack.clear();
            current_depth = 0;
            current_text.clear();
            collecting_text = false;
            has_error = false;
            error_message.clear();
        }

        bool isInElement(const std::string& element_name) const {
            for (const auto& name : element_stack) {
                if (name == element_name) return true;
            }
            return false;
        }
    };

    ParseState state_;

public:
    BaseSAXParser() = default;
    virtual ~BaseSAXParser() = default;

    BaseSAXParser(const BaseSAXParser&) = delete;
    BaseSAXParser& operator=(const BaseSAXParser&) = delete;

    /**
     * @brief 解析XML内容的统一入口
     * @param xml_content XML字符串内容
     * @return 是否解析成功
     */
    bool parseXML(const std::string& xml_content) {
        state_.reset();

        if (xml_content.empty()) {
            setError("Empty XML content");
            return false;
        }

        xml::XMLStreamReader reader;

        reader.setStartElementCallback([this](const std::string& name, const std::vector<xml::XMLAttribute>& attributes, int depth) {
            handleStartElement(name, attributes, depth);
        });
        reader.setEndElementCallback([this](const std::string& name, int depth) {
            handleEndElement(name, depth);
        });
        reader.setTextCallback([this](std::string_view text, int depth) {
            handleText(text, depth);
        });
        reader.setErrorCallback([this](xml::XMLParseError, const std::string& message, int line, int column) {
            state_.has_error = true;
            state_.error_message = "XML parse error at line " + std::to_string(line) +
                                   ", column " + std::to_string(column) + ": " + message;
        });

        auto result = reader.parseFromString(xml_content);
        if (result != xml::XMLParseError::Ok) {
            if (!state_.has_error) {
                state_.has_error = true;
                state_.error_message = reader.getLastErrorMessage();
            }
            READER_ERROR("SAX parser error: {}", state_.error_message);
            return false;
        }

        return !state_.has_error;
    }

    bool hasError() const { return state_.has_error; }
    const std::string& getErrorMessage() const { return state_.error_message; }

protected:
    void handleStartElement(const std::string& name, const std::vector<xml::XMLAttribute>& attributes, int depth) {
        state_.element_stack.push_back(name);
        state_.current_depth = depth;
        onStartElement(name, attributes, depth);
    }

    void handleEndElement(const std::string& name, int depth) {
        if (!state_.element_stack.empty()) {
            state_.element_stack.pop_back();
        }
        state_.current_depth = depth;
        onEndElement(name, depth);
    }

    void handleText(std::string_view text, int depth) {
        if (state_.collecting_text) {
            state_.current_text.append(text.data(), text.size());
        }
        onText(text, depth);
    }

    virtual void onStartElement(const std::string& name, const std::vector<xml::XMLAttribute>& attributes, int depth) = 0;
    virtual void onEndElement(const std::string& name, int depth) = 0;
    virtual void onText(std::string_view /*text*/, int /*depth*/) {}

    // ==================== 属性工具 ====================

    static std::optional<std::string> findAttribute(const std::vector<xml::XMLAttribute>& attributes, const std::string& name) {
        for (const auto& attr : attributes) {
            if (attr.name == name) {
                return attr.value;
            }
        }
        return std::nullopt;
    }

    /**
     * @brief 按本地名查找带命名空间前缀的属性（如 "r:id" 的前缀因文件而异）
     */
    static std::optional<std::string> findPrefixedAttribute(const std::vector<xml::XMLAttribute>& attributes, const std::string& local_name) {
        const std::string suffix = ":" + local_name;
        for (const auto& attr : attributes) {
            if (attr.name.size() > suffix.size() &&
                attr.name.compare(attr.name.size() - suffix.size(), suffix.size(), suffix) == 0) {
                return attr.value;
            }
        }
        return std::nullopt;
    }

    static std::optional<int> findIntAttribute(const std::vector<xml::XMLAttribute>& attributes, const std::string& name) {
        auto val = findAttribute(attributes, name);
        if (val) {
            try {
                return std::stoi(*val);
            } catch (const std::exception&) {
                return std::nullopt;
            }
        }
        return std::nullopt;
    }

    static std::optional<double> findDoubleAttribute(const std::vector<xml::XMLAttribute>& attributes, const std::string& name) {
        auto val = findAttribute(attributes, name);
        if (val) {
            return parseDouble(*val);
        }
        return std::nullopt;
    }

    /**
     * @brief 布尔属性：缺省值由调用方决定，"1"/"true" 为真
     */
    static std::optional<bool> findBoolAttribute(const std::vector<xml::XMLAttribute>& attributes, const std::string& name) {
        auto val = findAttribute(attributes, name);
        if (val) {
            return *val == "1" || *val == "true" || *val == "True" || *val == "TRUE";
        }
        return std::nullopt;
    }

    static std::string getAttributeOr(const std::vector<xml::XMLAttribute>& attributes, const std::string& name, const std::string& default_value) {
        auto val = findAttribute(attributes, name);
        return val ? *val : default_value;
    }

    static int getIntAttributeOr(const std::vector<xml::XMLAttribute>& attributes, const std::string& name, int default_value) {
        auto val = findIntAttribute(attributes, name);
        return val ? *val : default_value;
    }

    static double getDoubleAttributeOr(const std::vector<xml::XMLAttribute>& attributes, const std::string& name, double default_value) {
        auto val = findDoubleAttribute(attributes, name);
        return val ? *val : default_value;
    }

    static bool getBoolAttributeOr(const std::vector<xml::XMLAttribute>& attributes, const std::string& name, bool default_value) {
        auto val = findBoolAttribute(attributes, name);
        return val ? *val : default_value;
    }

    /**
     * @brief 解析完整的浮点数文本（不允许尾随字符）
     */
    static std::optional<double> parseDouble(std::string_view text) {
        while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) text.remove_prefix(1);
        while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) text.remove_suffix(1);
        if (text.empty()) {
            return std::nullopt;
        }
        double value = 0.0;
        auto result = fast_float::from_chars(text.data(), text.data() + text.size(), value);
        if (result.ec != std::errc() || result.ptr != text.data() + text.size()) {
            return std::nullopt;
        }
        return value;
    }

    // ==================== Excel 引用 ====================

    /**
     * @return (行, 列)，无效引用返回 (-1, -1)
     */
    static std::pair<int, int> parseCellReference(const std::string& ref) {
        try {
            return utils::CommonUtils::parseReference(ref);
        } catch (const std::invalid_argument&) {
            return {-1, -1};
        }
    }

    static bool parseRangeReference(const std::string& ref, int& first_row, int& first_col, int& last_row, int& last_col) {
        size_t colon = ref.find(':');
        if (colon == std::string::npos) {
            auto [row, col] = parseCellReference(ref);
            if (row < 0) return false;
            first_row = last_row = row;
            first_col = last_col = col;
            return true;
        }

        auto [r1, c1] = parseCellReference(ref.substr(0, colon));
        auto [r2, c2] = parseCellReference(ref.substr(colon + 1));
        if (r1 < 0 || r2 < 0) {
            return false;
        }
        first_row = r1;
        first_col = c1;
        last_row = r2;
        last_col = c2;
        return true;
    }

    // ==================== 文本收集 ====================

    void startCollectingText() {
        state_.collecting_text = true;
        state_.current_text.clear();
    }

    void stopCollectingText() {
        state_.collecting_text = false;
    }

    const std::string& getCurrentText() const {
        return state_.current_text;
    }

    bool isInElement(const std::string& element_name) const {
        return state_.isInElement(element_name);
    }

    void setError(const std::string& message) {
        state_.has_error = true;
        state_.error_message = message;
    }
};

}} // namespace sheetbinder::reader
