#include "sheetbinder/core/Workbook.hpp"
#include "sheetbinder/core/Exception.hpp"
#include "sheetbinder/core/StyleBuilder.hpp"
#include "sheetbinder/reader/XLSXReader.hpp"
#include "sheetbinder/xml/XLSXWriter.hpp"
#include "sheetbinder/utils/CommonUtils.hpp"
#include "sheetbinder/utils/ModuleLoggers.hpp"
#include <algorithm>
#include <cctype>
#include <fmt/format.h>

namespace sheetbinder {
namespace core {

Workbook::Workbook()
    : default_style_(StyleBuilder(StyleBundle::getDefault()).build()) {
}

std::unique_ptr<Workbook> Workbook::create() {
    return std::make_unique<Workbook>();
}

std::unique_ptr<Workbook> Workbook::open(const Path& path) {
    if (!path.exists()) {
        throw FileException("Workbook file not found", path.string(), ErrorCode::FileNotFound);
    }

    reader::XLSXReader reader(path);
    ErrorCode result = reader.open();
    if (result != ErrorCode::Ok) {
        CORE_ERROR("Failed to open XLSX file: {}, error: {}", path.string(), toString(result));
        throw FileException(fmt::format("Cannot open workbook: {}", toString(result)),
                            path.string(), result);
    }

    std::unique_ptr<Workbook> workbook;
    result = reader.loadWorkbook(workbook);
    reader.close();

    if (result != ErrorCode::Ok || !workbook) {
        CORE_ERROR("Failed to load workbook content: {}, error: {}", path.string(), toString(result));
        throw FileException(fmt::format("Cannot load workbook: {}", toString(result)),
                            path.string(), result == ErrorCode::Ok ? ErrorCode::InvalidWorkbook : result);
    }

    CORE_DEBUG("Opened workbook {} with {} sheets", path.string(), workbook->getSheetCount());
    return workbook;
}

ErrorCode Workbook::save(const Path& path) const {
    if (worksheets_.empty()) {
        CORE_ERROR("Cannot save workbook without worksheets: {}", path.string());
        return ErrorCode::InvalidWorkbook;
    }

    xml::XLSXWriter writer(*this);
    ErrorCode result = writer.write(path);
    if (result != ErrorCode::Ok) {
        CORE_ERROR("Failed to save workbook {}: {}", path.string(), toString(result));
    }
    return result;
}

namespace {

/**
 * @brief 公式是否以 Name! 或 'Name'! 的形式引用了指定工作表
 */
bool referencesSheet(const std::string& formula, const std::string& sheet) {
    std::string quoted = "'";
    for (char c : sheet) {
        quoted += c;
        if (c == '\'') quoted += c;
    }
    quoted += "'!";
    if (formula.find(quoted) != std::string::npos) {
        return true;
    }

    const std::string plain = sheet + "!";
    for (size_t pos = formula.find(plain); pos != std::string::npos; pos = formula.find(plain, pos + 1)) {
        if (pos == 0) return true;
        char before = formula[pos - 1];
        if (!std::isalnum(static_cast<unsigned char>(before)) && before != '_' && before != '.' && before != '\'') {
            return true;
        }
    }
    return false;
}

} // namespace

// ========== 工作表管理 ==========

std::shared_ptr<Worksheet> Workbook::addSheet(const std::string& name) {
    if (!utils::CommonUtils::isValidSheetName(name)) {
        throw WorksheetException(fmt::format("Invalid sheet name '{}'", name), name);
    }
    if (hasSheet(name)) {
        throw WorksheetException(fmt::format("Sheet '{}' already exists", name), name);
    }

    auto sheet = std::make_shared<Worksheet>(name);
    worksheets_.push_back(sheet);
    CORE_DEBUG("Added sheet '{}' (position {})", name, worksheets_.size());
    return sheet;
}

bool Workbook::removeSheet(const std::string& name) {
    auto it = std::find_if(worksheets_.begin(), worksheets_.end(),
                           [&name](const std::shared_ptr<Worksheet>& ws) { return ws->getName() == name; });
    if (it == worksheets_.end()) {
        return false;
    }
    return removeSheet(static_cast<size_t>(std::distance(worksheets_.begin(), it)));
}

bool Workbook::removeSheet(size_t index) {
    if (index >= worksheets_.size()) {
        return false;
    }

    const std::string name = worksheets_[index]->getName();
    CORE_DEBUG("Removing sheet '{}'", name);
    worksheets_.erase(worksheets_.begin() + static_cast<std::ptrdiff_t>(index));

    size_t dropped = defined_names_.removeIf([&name](const DefinedName& dn) {
        return dn.scope == name || referencesSheet(dn.formula, name);
    });
    if (dropped > 0) {
        CORE_DEBUG("Dropped {} defined names tied to sheet '{}'", dropped, name);
    }

    // 活动工作表跟随原先的工作表，被删除时退到前一个
    if (active_sheet_index_ > index || active_sheet_index_ >= worksheets_.size()) {
        active_sheet_index_ = active_sheet_index_ > 0 ? active_sheet_index_ - 1 : 0;
    }
    return true;
}

std::shared_ptr<Worksheet> Workbook::getSheet(const std::string& name) {
    for (auto& ws : worksheets_) {
        if (ws->getName() == name) {
            return ws;
        }
    }
    return nullptr;
}

std::shared_ptr<Worksheet> Workbook::getSheet(size_t index) {
    return index < worksheets_.size() ? worksheets_[index] : nullptr;
}

std::shared_ptr<const Worksheet> Workbook::getSheet(const std::string& name) const {
    for (const auto& ws : worksheets_) {
        if (ws->getName() == name) {
            return ws;
        }
    }
    return nullptr;
}

std::shared_ptr<const Worksheet> Workbook::getSheet(size_t index) const {
    return index < worksheets_.size() ? worksheets_[index] : nullptr;
}

bool Workbook::hasSheet(const std::string& name) const {
    // Excel 要求工作表名称在忽略大小写时唯一
    const std::string lowered = utils::CommonUtils::toLower(name);
    for (const auto& ws : worksheets_) {
        if (utils::CommonUtils::toLower(ws->getName()) == lowered) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> Workbook::getSheetNames() const {
    std::vector<std::string> names;
    names.reserve(worksheets_.size());
    for (const auto& ws : worksheets_) {
        names.push_back(ws->getName());
    }
    return names;
}

void Workbook::setActiveWorksheet(size_t index) {
    if (index >= worksheets_.size()) {
        throw ParameterException(
            fmt::format("Active sheet index {} out of range ({} sheets)", index, worksheets_.size()), "index");
    }
    active_sheet_index_ = index;
}

std::shared_ptr<Worksheet> Workbook::getActiveWorksheet() {
    return getSheet(active_sheet_index_);
}

std::shared_ptr<const Worksheet> Workbook::getActiveWorksheet() const {
    return getSheet(active_sheet_index_);
}

void Workbook::setDefaultStyle(StylePtr style) {
    if (style) {
        default_style_ = std::move(style);
    }
}

}} // namespace sheetbinder::core
