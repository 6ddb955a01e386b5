#include "sheetbinder/summary/RosterReader.hpp"
#include "sheetbinder/core/Exception.hpp"
#include "sheetbinder/core/Workbook.hpp"
#include "sheetbinder/utils/ModuleLoggers.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace sheetbinder {
namespace summary {

core::Expected<std::vector<std::string>> RosterReader::read(const core::Path& path, const std::string& column) {
    if (!path.isFile()) {
        return core::makeUnexpected<std::vector<std::string>>(
            core::ErrorCode::RosterUnavailable, "Roster file not found", path.string());
    }

    std::unique_ptr<core::Workbook> workbook;
    try {
        workbook = core::Workbook::open(path);
    } catch (const core::SheetBinderException& e) {
        return core::makeUnexpected<std::vector<std::string>>(
            core::ErrorCode::RosterUnavailable, fmt::format("Cannot open roster: {}", e.what()), path.string());
    }

    auto sheet = workbook->getActiveWorksheet();
    if (!sheet) {
        return core::makeUnexpected<std::vector<std::string>>(
            core::ErrorCode::RosterUnavailable, "Roster has no worksheet", path.string());
    }

    // 表头只在第一行查找
    int header_col = -1;
    for (const auto& [position, cell] : sheet->getCells()) {
        if (position.first != 1) {
            break;
        }
        if (cellText(cell) == column) {
            header_col = position.second;
            break;
        }
    }
    if (header_col < 0) {
        return core::makeUnexpected<std::vector<std::string>>(
            core::ErrorCode::RosterUnavailable,
            fmt::format("Column '{}' not found in roster header", column), path.string());
    }

    std::vector<std::string> clients;
    for (const auto& [position, cell] : sheet->getCells()) {
        if (position.first == 1 || position.second != header_col) {
            continue;
        }
        std::string value = cellText(cell);
        if (value.empty()) {
            continue;
        }
        if (std::find(clients.begin(), clients.end(), value) == clients.end()) {
            clients.push_back(std::move(value));
        }
    }

    SUMMARY_INFO("Roster '{}' lists {} clients", path.string(), clients.size());
    return clients;
}

std::string RosterReader::cellText(const core::Cell& cell) {
    switch (cell.getType()) {
        case core::CellType::String:
            return cell.getStringValue();
        case core::CellType::Number:
        case core::CellType::Date:
            return fmt::format("{}", cell.getNumberValue());
        case core::CellType::Formula:
            if (cell.getFormulaResultType() == core::CellType::Number) {
                return fmt::format("{}", cell.getFormulaResult());
            }
            return cell.getFormulaResultText();
        default:
            return "";
    }
}

}} // namespace sheetbinder::summary
