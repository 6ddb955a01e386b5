#pragma once

#include "sheetbinder/core/Path.hpp"
#include "sheetbinder/archive/ZipError.hpp"
#include <string>
#include <cstdint>
#include <string_view>
#include <mutex>
#include <unordered_set>

namespace sheetbinder {
namespace archive {

/**
 * @brief ZIP写入器（基于 minizip-ng）
 *
 * 创建新的 ZIP 文件（已存在时先删除），逐个写入条目，
 * 同一路径只写入一次。
 */
class ZipWriter {
public:
    /**
     * @param path 目标文件
     * @param compression_level 压缩级别（0 表示仅存储）
     */
    explicit ZipWriter(const core::Path& path, int compression_level = 6);
    ~ZipWriter();

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    /**
     * 创建ZIP文件进行写入
     * @return 是否成功
     */
    bool open();

    /**
     * 写入中央目录并关闭文件
     * @return 是否成功
     */
    bool close();

    bool isOpen() const { return is_open_; }

    /**
     * 添加条目
     * @param internal_path ZIP内部路径
     * @param content 条目内容
     * @return 错误码
     */
    ZipError addFile(std::string_view internal_path, std::string_view content);

    struct Stats {
        size_t entries_written = 0;
        size_t bytes_written = 0;
    };
    const Stats& getStats() const { return stats_; }

private:
    void* zip_handle_ = nullptr;
    core::Path filepath_;
    int compression_level_;
    bool is_open_ = false;
    mutable std::mutex mutex_;

    std::unordered_set<std::string> written_paths_;
    Stats stats_;

    bool initializeWriter();
    bool closeInternal();
    void initializeFileInfo(void* file_info_ptr, const std::string& path, size_t size);
    ZipError writeFileEntry(const std::string& internal_path, const void* data, size_t size);
};

}} // namespace sheetbinder::archive
