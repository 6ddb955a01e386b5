#include "sheetbinder/summary/ClientFileSet.hpp"
#include "sheetbinder/utils/CommonUtils.hpp"
#include "sheetbinder/utils/ModuleLoggers.hpp"
#include <algorithm>

namespace sheetbinder {
namespace summary {

std::string ClientFileSet::clientNameOf(const core::Path& path) {
    std::string stem = path.stem();
    size_t pos = stem.rfind('_');
    if (pos == std::string::npos) {
        return stem;
    }
    return stem.substr(0, pos);
}

std::string ClientFileSet::dateTokenOf(const core::Path& path) {
    std::string stem = path.stem();
    size_t pos = stem.rfind('_');
    if (pos == std::string::npos) {
        return "";
    }
    return stem.substr(pos + 1);
}

std::vector<core::Path> ClientFileSet::discover(const SummaryOptions& options) {
    std::vector<core::Path> result;
    core::Path dir(options.input_dir);

    if (!dir.isDirectory()) {
        SUMMARY_WARN("Input directory '{}' does not exist", options.input_dir);
        return result;
    }

    for (const auto& file : dir.listFiles()) {
        const std::string name = file.filename();
        if (!options.temp_file_prefix.empty() && name.rfind(options.temp_file_prefix, 0) == 0) {
            SUMMARY_DEBUG("Ignoring temporary file '{}'", name);
            continue;
        }

        const std::string ext = utils::CommonUtils::toLower(file.extension());
        bool accepted = std::any_of(options.input_extensions.begin(), options.input_extensions.end(),
                                    [&ext](const std::string& candidate) {
                                        return utils::CommonUtils::toLower(candidate) == ext;
                                    });
        if (accepted) {
            if (!file.isValidUtf8()) {
                SUMMARY_WARN("File name '{}' is not valid UTF-8, its tab label will be sanitized",
                             utils::CommonUtils::utf8Sanitize(name));
            }
            result.push_back(file);
        }
    }

    std::sort(result.begin(), result.end());
    SUMMARY_INFO("Found {} client files in '{}'", result.size(), options.input_dir);
    return result;
}

ClientFileSet::ClientGroups ClientFileSet::group(const std::vector<core::Path>& paths) {
    ClientGroups groups;
    for (const auto& path : paths) {
        groups[clientNameOf(path)].push_back(path);
    }
    return groups;
}

void ClientFileSet::sortByDateToken(std::vector<core::Path>& paths) {
    std::stable_sort(paths.begin(), paths.end(), [](const core::Path& a, const core::Path& b) {
        return dateTokenOf(a) < dateTokenOf(b);
    });
}

}} // namespace sheetbinder::summary
