#pragma once

#include <string>
#include <vector>
#include <ostream>
#include <cstdint>

namespace sheetbinder {
namespace core {

/**
 * @brief UTF-8路径封装
 *
 * 以UTF-8字符串保存路径，文件系统操作基于 std::filesystem，
 * 所有操作都不抛异常，失败时返回 false / 空值。
 */
class Path {
private:
    std::string utf8_path_;

public:
    explicit Path(const std::string& path) : utf8_path_(path) {}
    explicit Path(const char* path) : utf8_path_(path ? path : "") {}
    Path() = default;

    const std::string& string() const { return utf8_path_; }
    const char* c_str() const { return utf8_path_.c_str(); }
    bool empty() const { return utf8_path_.empty(); }

    /**
     * @brief 路径是否为合法 UTF-8
     */
    bool isValidUtf8() const;

    // ========== 路径分解 ==========

    /**
     * @brief 文件名（含扩展名），如 "Acme_20240101.xlsx"
     */
    std::string filename() const;

    /**
     * @brief 去掉扩展名的文件名，如 "Acme_20240101"
     */
    std::string stem() const;

    /**
     * @brief 扩展名（含点），如 ".xlsx"；无扩展名时为空
     */
    std::string extension() const;

    Path parent() const;

    /**
     * @brief 拼接子路径
     */
    Path operator/(const std::string& child) const;

    // ========== 文件操作 ==========

    bool exists() const;
    bool isFile() const;
    bool isDirectory() const;
    uintmax_t fileSize() const;
    bool remove() const;

    /**
     * @brief 复制文件到目标路径
     * @param target 目标路径
     * @param overwrite 是否覆盖已存在的文件
     * @return 是否成功
     */
    bool copyTo(const Path& target, bool overwrite = true) const;

    /**
     * @brief 创建目录（含父目录），已存在时返回 true
     */
    bool createDirectories() const;

    /**
     * @brief 列出目录下的普通文件（不递归），结果按路径排序
     */
    std::vector<Path> listFiles() const;

    bool operator==(const Path& other) const { return utf8_path_ == other.utf8_path_; }
    bool operator!=(const Path& other) const { return utf8_path_ != other.utf8_path_; }
    bool operator<(const Path& other) const { return utf8_path_ < other.utf8_path_; }

    friend std::ostream& operator<<(std::ostream& os, const Path& path) {
        return os << path.utf8_path_;
    }
};

}} // namespace sheetbinder::core
