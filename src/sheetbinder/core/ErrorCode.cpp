#include "sheetbinder/core/ErrorCode.hpp"

namespace sheetbinder {
namespace core {

Error::Error(ErrorCode c) : code(c), message(toString(c)) {}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:
            return "Success";

        // 通用错误
        case ErrorCode::InvalidArgument:
            return "Invalid argument";
        case ErrorCode::InternalError:
            return "Internal error";

        // 文件操作错误
        case ErrorCode::FileNotFound:
            return "File not found";
        case ErrorCode::FileAccessDenied:
            return "File access denied";
        case ErrorCode::FileCorrupted:
            return "File corrupted";
        case ErrorCode::FileWriteError:
            return "File write error";
        case ErrorCode::FileReadError:
            return "File read error";
        case ErrorCode::FileReadFailure:
            return "Input file could not be processed";
        case ErrorCode::PersistFailure:
            return "Summary workbook could not be saved";

        // Excel格式错误
        case ErrorCode::InvalidWorkbook:
            return "Invalid workbook";
        case ErrorCode::InvalidWorksheet:
            return "Invalid worksheet";
        case ErrorCode::InvalidCellReference:
            return "Invalid cell reference";
        case ErrorCode::InvalidFormat:
            return "Invalid format";
        case ErrorCode::CorruptedStyles:
            return "Corrupted styles";
        case ErrorCode::CorruptedSharedStrings:
            return "Corrupted shared strings";

        // ZIP/XML处理错误
        case ErrorCode::ZipError:
            return "ZIP error";
        case ErrorCode::XmlParseError:
            return "XML parse error";
        case ErrorCode::XmlInvalidFormat:
            return "Invalid XML format";
        case ErrorCode::XmlMissingElement:
            return "Missing XML element";

        // 汇总批次错误
        case ErrorCode::TemplateMissing:
            return "Template workbook missing";
        case ErrorCode::TemplateTabMissing:
            return "Template tab missing";
        case ErrorCode::RosterUnavailable:
            return "Client roster unavailable";

        default:
            return "Unknown error";
    }
}

}} // namespace sheetbinder::core
