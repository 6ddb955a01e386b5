#include "sheetbinder/summary/LinkSanitizer.hpp"
#include "sheetbinder/utils/ModuleLoggers.hpp"
#include <regex>

namespace sheetbinder {
namespace summary {

bool LinkSanitizer::looksLikeExternalReference(const std::string& formula_text) {
    static const std::regex kWorkbookReference(R"(\[.*\.xl.*\])");

    bool candidate = formula_text.find('\'') != std::string::npos ||
                     std::regex_search(formula_text, kWorkbookReference);
    if (!candidate) {
        return false;
    }
    return formula_text.find('[') != std::string::npos &&
           formula_text.find(']') != std::string::npos;
}

bool LinkSanitizer::isExternalDefinedName(const std::string& formula) {
    static const std::regex kExternalIndex(R"(\[\d+\])");
    return looksLikeExternalReference("=" + formula) || std::regex_search(formula, kExternalIndex);
}

LinkSanitizer::SanitizeStats LinkSanitizer::sanitize(core::Workbook& workbook) {
    SanitizeStats stats;

    for (size_t i = 0; i < workbook.getSheetCount(); ++i) {
        auto sheet = workbook.getSheet(i);
        for (auto& [position, cell] : sheet->getCells()) {
            ++stats.cells_scanned;
            if (!cell.isFormula()) {
                continue;
            }
            if (looksLikeExternalReference("=" + cell.getFormula())) {
                SUMMARY_DEBUG("Clearing external reference in '{}' at ({}, {}): ={}",
                              sheet->getName(), position.first, position.second, cell.getFormula());
                cell.clearValue();
                ++stats.cells_cleared;
            }
        }
    }

    stats.names_removed = workbook.getDefinedNames().removeIf([](const core::DefinedName& dn) {
        if (!isExternalDefinedName(dn.formula)) {
            return false;
        }
        SUMMARY_DEBUG("Removing defined name '{}' with external reference {}", dn.name, dn.formula);
        return true;
    });

    SUMMARY_INFO("Link sanitizer: scanned {} cells, cleared {}, removed {} defined names",
                 stats.cells_scanned, stats.cells_cleared, stats.names_removed);
    return stats;
}

}} // namespace sheetbinder::summary
