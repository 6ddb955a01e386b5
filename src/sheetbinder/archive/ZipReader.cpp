#include "sheetbinder/archive/ZipReader.hpp"
#include "sheetbinder/utils/ModuleLoggers.hpp"
#include <mz.h>
#include <mz_strm.h>
#include <mz_zip.h>
#include <mz_zip_rw.h>
#include <array>

namespace sheetbinder {
namespace archive {

ZipReader::ZipReader(const core::Path& path)
    : filepath_(path) {
}

ZipReader::~ZipReader() {
    cleanup();
}

bool ZipReader::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    cleanup();
    return initializeReader();
}

void ZipReader::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    cleanup();
}

std::vector<std::string> ZipReader::listFiles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> files;
    files.reserve(entry_cache_.size());
    for (const auto& [path, info] : entry_cache_) {
        files.push_back(path);
    }
    return files;
}

ZipError ZipReader::fileExists(std::string_view internal_path) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!is_open_ || !unzip_handle_) {
        return ZipError::NotOpen;
    }

    if (entry_cache_.find(std::string(internal_path)) != entry_cache_.end()) {
        return ZipError::Ok;
    }
    return ZipError::FileNotFound;
}

bool ZipReader::getEntryInfo(std::string_view internal_path, EntryInfo& info) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entry_cache_.find(std::string(internal_path));
    if (it == entry_cache_.end()) {
        return false;
    }
    info = it->second;
    return true;
}

ZipError ZipReader::extractFile(std::string_view internal_path, std::string& content) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!is_open_ || !unzip_handle_) {
        ARCHIVE_ERROR("Zip archive not opened for reading");
        return ZipError::NotOpen;
    }

    std::string path_str(internal_path);
    if (mz_zip_reader_locate_entry(unzip_handle_, path_str.c_str(), 1) != MZ_OK) {
        ARCHIVE_DEBUG("File {} not found in zip archive", internal_path);
        return ZipError::FileNotFound;
    }

    if (mz_zip_reader_entry_open(unzip_handle_) != MZ_OK) {
        ARCHIVE_ERROR("Failed to open entry: {}", internal_path);
        return ZipError::IoFail;
    }

    content.clear();
    constexpr size_t BUFFER_SIZE = 65536;
    std::array<char, BUFFER_SIZE> buffer;
    int32_t bytes_read = 0;
    do {
        bytes_read = mz_zip_reader_entry_read(unzip_handle_, buffer.data(),
                                              static_cast<int32_t>(buffer.size()));
        if (bytes_read > 0) {
            content.append(buffer.data(), static_cast<size_t>(bytes_read));
        }
    } while (bytes_read > 0);

    mz_zip_reader_entry_close(unzip_handle_);

    if (bytes_read < 0) {
        ARCHIVE_ERROR("Failed to read entry {}, error: {}", internal_path, bytes_read);
        return ZipError::BadFormat;
    }

    ARCHIVE_DEBUG("Extracted file {} from zip, size: {} bytes", internal_path, content.size());
    return ZipError::Ok;
}

bool ZipReader::initializeReader() {
    unzip_handle_ = mz_zip_reader_create();
    if (!unzip_handle_) {
        ARCHIVE_ERROR("Failed to create zip reader");
        return false;
    }

    int32_t result = mz_zip_reader_open_file(unzip_handle_, filepath_.c_str());
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to open zip file for reading: {}, error: {}", filepath_.string(), result);
        mz_zip_reader_delete(&unzip_handle_);
        unzip_handle_ = nullptr;
        return false;
    }

    is_open_ = true;
    ARCHIVE_DEBUG("Zip archive opened for reading: {}", filepath_.string());

    buildEntryCache();
    return true;
}

void ZipReader::cleanup() {
    if (unzip_handle_) {
        mz_zip_reader_close(unzip_handle_);
        mz_zip_reader_delete(&unzip_handle_);
        unzip_handle_ = nullptr;
    }
    is_open_ = false;
    entry_cache_.clear();
}

void ZipReader::buildEntryCache() {
    entry_cache_.clear();

    if (mz_zip_reader_goto_first_entry(unzip_handle_) != MZ_OK) {
        return;
    }

    do {
        mz_zip_file* file_info = nullptr;
        if (mz_zip_reader_entry_get_info(unzip_handle_, &file_info) == MZ_OK && file_info) {
            if (file_info->filename && file_info->filename[0] != '\0') {
                EntryInfo info;
                info.path = file_info->filename;
                info.compressed_size = static_cast<uint64_t>(file_info->compressed_size);
                info.uncompressed_size = static_cast<uint64_t>(file_info->uncompressed_size);
                info.is_directory = (info.path.back() == '/');
                entry_cache_[info.path] = info;
            }
        }
    } while (mz_zip_reader_goto_next_entry(unzip_handle_) == MZ_OK);

    ARCHIVE_DEBUG("Built entry cache with {} entries", entry_cache_.size());
}

}} // namespace sheetbinder::archive
