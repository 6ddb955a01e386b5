#pragma once

#include <cstdint>
#include <string>
#include <fmt/format.h>

namespace sheetbinder {
namespace core {

/**
 * @brief SheetBinder统一错误码
 *
 * 引擎内部（读写xlsx）与汇总流程（批次/客户/文件）共用同一套错误码，
 * 以便逐层向上传递为结果值。
 */
enum class ErrorCode : uint8_t {
    // 成功
    Ok = 0,

    // 通用错误 (1-19)
    InvalidArgument = 1,
    InternalError = 3,

    // 文件操作错误 (20-39)
    FileNotFound = 20,
    FileAccessDenied = 21,
    FileCorrupted = 22,
    FileWriteError = 23,
    FileReadError = 24,
    FileReadFailure = 25,   // 单个输入文件无法处理（跳过该文件）
    PersistFailure = 26,    // 汇总工作簿保存失败（客户失败）

    // Excel格式错误 (40-59)
    InvalidWorkbook = 40,
    InvalidWorksheet = 41,
    InvalidCellReference = 42,
    InvalidFormat = 43,
    CorruptedStyles = 45,
    CorruptedSharedStrings = 46,

    // ZIP/XML处理错误 (60-79)
    ZipError = 60,
    XmlParseError = 61,
    XmlInvalidFormat = 62,
    XmlMissingElement = 63,

    // 汇总批次错误 (90-99)
    TemplateMissing = 90,     // 模板文件不存在（整个批次终止）
    TemplateTabMissing = 91,  // 模板中缺少样式来源工作表（单个客户失败）
    RosterUnavailable = 92    // 客户名单不可用（按无名单处理）
};

/**
 * @brief 错误信息结构
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::string context;  // 额外上下文信息

    Error() : code(ErrorCode::Ok) {}

    explicit Error(ErrorCode c);

    Error(ErrorCode c, const std::string& msg) : code(c), message(msg) {}

    Error(ErrorCode c, const std::string& msg, const std::string& ctx)
        : code(c), message(msg), context(ctx) {}

    bool isOk() const noexcept { return code == ErrorCode::Ok; }
    bool isError() const noexcept { return code != ErrorCode::Ok; }

    std::string fullMessage() const {
        if (context.empty()) {
            return message;
        }
        return fmt::format("{} (Context: {})", message, context);
    }
};

/**
 * @brief 错误码转字符串
 */
const char* toString(ErrorCode code) noexcept;

inline Error makeError(ErrorCode code) {
    return Error(code);
}

inline Error makeError(ErrorCode code, const std::string& message) {
    return Error(code, message);
}

inline Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    return Error(code, message, context);
}

inline Error success() {
    return Error(ErrorCode::Ok);
}

}} // namespace sheetbinder::core
