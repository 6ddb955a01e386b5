/**
 * @file Exception.hpp
 * @brief SheetBinder异常类定义
 */

#ifndef SHEETBINDER_EXCEPTION_HPP
#define SHEETBINDER_EXCEPTION_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include "ErrorCode.hpp"

namespace sheetbinder {
namespace core {

/**
 * @brief SheetBinder基础异常类
 */
class SheetBinderException : public std::runtime_error {
public:
    /**
     * @brief 构造函数
     * @param message 错误消息
     * @param code 错误代码
     * @param file 发生错误的文件名
     * @param line 发生错误的行号
     */
    SheetBinderException(const std::string& message,
                         ErrorCode code = ErrorCode::InternalError,
                         const char* file = nullptr,
                         int line = 0);

    ErrorCode getErrorCode() const noexcept { return error_code_; }

    /**
     * @brief 获取详细错误信息（含错误码、位置与上下文）
     */
    std::string getDetailedMessage() const;

    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

    void addContext(const std::string& context);
    const std::vector<std::string>& getContext() const { return context_; }

    /**
     * @brief 转换为错误值，用于在边界处把异常变为结果
     */
    Error toError() const;

private:
    ErrorCode error_code_;
    const char* file_;
    int line_;
    std::vector<std::string> context_;
};

/**
 * @brief 文件相关异常
 */
class FileException : public SheetBinderException {
public:
    FileException(const std::string& message, const std::string& filename,
                  ErrorCode code = ErrorCode::FileNotFound,
                  const char* file = nullptr, int line = 0);

    const std::string& getFilename() const { return filename_; }

private:
    std::string filename_;
};

/**
 * @brief 格式相关异常
 */
class FormatException : public SheetBinderException {
public:
    FormatException(const std::string& message,
                    ErrorCode code = ErrorCode::InvalidFormat,
                    const char* file = nullptr, int line = 0);
};

/**
 * @brief 参数相关异常
 */
class ParameterException : public SheetBinderException {
public:
    ParameterException(const std::string& message,
                       const std::string& parameter_name = "",
                       const char* file = nullptr, int line = 0);

    const std::string& getParameterName() const { return parameter_name_; }

private:
    std::string parameter_name_;
};

/**
 * @brief 工作表相关异常
 */
class WorksheetException : public SheetBinderException {
public:
    WorksheetException(const std::string& message,
                       const std::string& worksheet_name = "",
                       ErrorCode code = ErrorCode::InvalidWorksheet,
                       const char* file = nullptr, int line = 0);

    const std::string& getWorksheetName() const { return worksheet_name_; }

private:
    std::string worksheet_name_;
};

/**
 * @brief XML解析异常
 */
class XMLException : public SheetBinderException {
public:
    XMLException(const std::string& message,
                 const std::string& xml_path = "",
                 const char* file = nullptr, int line = 0);

    const std::string& getXMLPath() const { return xml_path_; }

private:
    std::string xml_path_;
};

} // namespace core
} // namespace sheetbinder

#endif // SHEETBINDER_EXCEPTION_HPP
