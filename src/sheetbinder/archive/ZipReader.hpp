#pragma once

#include "sheetbinder/core/Path.hpp"
#include "sheetbinder/archive/ZipError.hpp"
#include <string>
#include <vector>
#include <string_view>
#include <mutex>
#include <map>
#include <cstdint>

namespace sheetbinder {
namespace archive {

/**
 * @brief ZIP读取器（基于 minizip-ng）
 *
 * 打开时建立条目缓存，之后按路径定位并解压单个条目。
 */
class ZipReader {
public:
    struct EntryInfo {
        std::string path;
        uint64_t compressed_size = 0;
        uint64_t uncompressed_size = 0;
        bool is_directory = false;
    };

    explicit ZipReader(const core::Path& path);
    ~ZipReader();

    ZipReader(const ZipReader&) = delete;
    ZipReader& operator=(const ZipReader&) = delete;

    /**
     * 打开ZIP文件进行读取
     * @return 是否成功
     */
    bool open();

    void close();

    bool isOpen() const { return is_open_; }

    /**
     * 获取所有条目路径（按路径排序）
     */
    std::vector<std::string> listFiles() const;

    ZipError fileExists(std::string_view internal_path) const;

    bool getEntryInfo(std::string_view internal_path, EntryInfo& info) const;

    /**
     * 提取条目到字符串
     * @param internal_path ZIP内部路径
     * @param content 输出内容
     * @return 错误码
     */
    ZipError extractFile(std::string_view internal_path, std::string& content);

    const core::Path& getPath() const { return filepath_; }

private:
    void* unzip_handle_ = nullptr;
    core::Path filepath_;
    bool is_open_ = false;
    mutable std::mutex mutex_;

    std::map<std::string, EntryInfo> entry_cache_;

    bool initializeReader();
    void cleanup();
    void buildEntryCache();
};

}} // namespace sheetbinder::archive
