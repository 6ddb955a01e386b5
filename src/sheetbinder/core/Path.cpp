#include "sheetbinder/core/Path.hpp"
#include "sheetbinder/utils/ModuleLoggers.hpp"
#include <filesystem>
#include <algorithm>
#include <utf8.h>

namespace sheetbinder {
namespace core {

namespace fs = std::filesystem;

namespace {

fs::path toFsPath(const std::string& utf8) {
    return fs::u8path(utf8);
}

std::string toUtf8(const fs::path& p) {
    return p.u8string();
}

} // namespace

bool Path::isValidUtf8() const {
    return utf8::is_valid(utf8_path_.begin(), utf8_path_.end());
}

std::string Path::filename() const {
    return toUtf8(toFsPath(utf8_path_).filename());
}

std::string Path::stem() const {
    return toUtf8(toFsPath(utf8_path_).stem());
}

std::string Path::extension() const {
    return toUtf8(toFsPath(utf8_path_).extension());
}

Path Path::parent() const {
    return Path(toUtf8(toFsPath(utf8_path_).parent_path()));
}

Path Path::operator/(const std::string& child) const {
    if (utf8_path_.empty()) {
        return Path(child);
    }
    return Path(toUtf8(toFsPath(utf8_path_) / toFsPath(child)));
}

bool Path::exists() const {
    if (utf8_path_.empty()) return false;
    std::error_code ec;
    return fs::exists(toFsPath(utf8_path_), ec);
}

bool Path::isFile() const {
    if (utf8_path_.empty()) return false;
    std::error_code ec;
    return fs::is_regular_file(toFsPath(utf8_path_), ec);
}

bool Path::isDirectory() const {
    if (utf8_path_.empty()) return false;
    std::error_code ec;
    return fs::is_directory(toFsPath(utf8_path_), ec);
}

uintmax_t Path::fileSize() const {
    std::error_code ec;
    uintmax_t size = fs::file_size(toFsPath(utf8_path_), ec);
    return ec ? 0 : size;
}

bool Path::remove() const {
    std::error_code ec;
    bool removed = fs::remove(toFsPath(utf8_path_), ec);
    if (ec) {
        UTILS_WARN("Failed to remove {}: {}", utf8_path_, ec.message());
        return false;
    }
    return removed;
}

bool Path::copyTo(const Path& target, bool overwrite) const {
    std::error_code ec;
    auto options = overwrite ? fs::copy_options::overwrite_existing : fs::copy_options::none;
    fs::copy_file(toFsPath(utf8_path_), toFsPath(target.utf8_path_), options, ec);
    if (ec) {
        UTILS_ERROR("Failed to copy {} to {}: {}", utf8_path_, target.utf8_path_, ec.message());
        return false;
    }
    return true;
}

bool Path::createDirectories() const {
    if (utf8_path_.empty()) return true;
    std::error_code ec;
    fs::create_directories(toFsPath(utf8_path_), ec);
    if (ec) {
        UTILS_ERROR("Failed to create directory {}: {}", utf8_path_, ec.message());
        return false;
    }
    return true;
}

std::vector<Path> Path::listFiles() const {
    std::vector<Path> files;
    std::error_code ec;
    fs::directory_iterator it(toFsPath(utf8_path_), ec);
    if (ec) {
        UTILS_WARN("Cannot list directory {}: {}", utf8_path_, ec.message());
        return files;
    }
    for (const auto& entry : it) {
        std::error_code type_ec;
        if (entry.is_regular_file(type_ec)) {
            files.emplace_back(toUtf8(entry.path()));
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

}} // namespace sheetbinder::core
