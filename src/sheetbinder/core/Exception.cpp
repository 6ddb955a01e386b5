/**
 * @file Exception.cpp
 * @brief SheetBinder异常类实现
 */

#include "sheetbinder/core/Exception.hpp"
#include <fmt/format.h>

namespace sheetbinder {
namespace core {

SheetBinderException::SheetBinderException(const std::string& message,
                                           ErrorCode code,
                                           const char* file,
                                           int line)
    : std::runtime_error(message)
    , error_code_(code)
    , file_(file)
    , line_(line) {
}

std::string SheetBinderException::getDetailedMessage() const {
    std::string result = fmt::format("[{}] {}", toString(error_code_), what());

    if (file_ && line_ > 0) {
        result += fmt::format(" (at {}:{})", file_, line_);
    }

    if (!context_.empty()) {
        result += "\nContext:";
        for (const auto& ctx : context_) {
            result += "\n  - " + ctx;
        }
    }

    return result;
}

void SheetBinderException::addContext(const std::string& context) {
    context_.push_back(context);
}

Error SheetBinderException::toError() const {
    std::string ctx;
    for (const auto& c : context_) {
        if (!ctx.empty()) ctx += "; ";
        ctx += c;
    }
    return Error(error_code_, what(), ctx);
}

// FileException 实现
FileException::FileException(const std::string& message, const std::string& filename,
                             ErrorCode code, const char* file, int line)
    : SheetBinderException(fmt::format("{} (file: {})", message, filename), code, file, line)
    , filename_(filename) {
}

// FormatException 实现
FormatException::FormatException(const std::string& message,
                                 ErrorCode code, const char* file, int line)
    : SheetBinderException(message, code, file, line) {
}

// ParameterException 实现
ParameterException::ParameterException(const std::string& message,
                                       const std::string& parameter_name,
                                       const char* file, int line)
    : SheetBinderException(fmt::format("{} (parameter: {})", message, parameter_name),
                           ErrorCode::InvalidArgument, file, line)
    , parameter_name_(parameter_name) {
}

// WorksheetException 实现
WorksheetException::WorksheetException(const std::string& message,
                                       const std::string& worksheet_name,
                                       ErrorCode code, const char* file, int line)
    : SheetBinderException(fmt::format("{} (worksheet: {})", message, worksheet_name), code, file, line)
    , worksheet_name_(worksheet_name) {
}

// XMLException 实现
XMLException::XMLException(const std::string& message,
                           const std::string& xml_path,
                           const char* file, int line)
    : SheetBinderException(xml_path.empty() ? message : fmt::format("{} (part: {})", message, xml_path),
                           ErrorCode::XmlParseError, file, line)
    , xml_path_(xml_path) {
}

}} // namespace sheetbinder::core
