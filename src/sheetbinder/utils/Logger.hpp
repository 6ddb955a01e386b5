#pragma once

#include <memory>
#include <string>
#include <fstream>
#include <iostream>
#include <mutex>
#include <atomic>
#include <cstring>
#include <algorithm>
#include <fmt/format.h>

#ifdef ERROR
#undef ERROR
#endif

namespace sheetbinder {

/**
 * @brief 进程级日志器
 *
 * 控制台彩色输出 + 文件输出（按大小轮转）。
 * 各模块通过 ModuleLoggers.hpp 中的宏记录日志。
 */
class Logger {
public:
    enum class Level {
        TRACE = 0,
        DEBUG = 1,
        INFO = 2,
        WARN = 3,
        ERROR = 4,
        CRITICAL = 5,
        OFF = 6
    };

    enum class WriteMode {
        TRUNCATE = 0,  // 覆盖模式（默认）
        APPEND = 1     // 追加模式
    };

    static Logger& getInstance();

    /**
     * @brief 初始化日志器
     * @param log_file_path 日志文件路径，为空时仅输出到控制台
     * @param level 最低输出级别
     * @param enable_console 是否输出到控制台
     * @param max_file_size 单个日志文件最大字节数
     * @param max_files 轮转保留的文件数
     * @param write_mode 写入模式
     */
    void initialize(const std::string& log_file_path = "logs/sheetbinder.log",
                    Level level = Level::INFO,
                    bool enable_console = true,
                    size_t max_file_size = 10 * 1024 * 1024,
                    size_t max_files = 5,
                    WriteMode write_mode = WriteMode::TRUNCATE);

    void setLevel(Level level);
    Level getLevel() const;
    void setConsoleEnabled(bool enabled) { enable_console_.store(enabled); }

    void log(Level level, const std::string& message);

    template<typename... Args>
    inline void logFormatted(Level level, const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) return;
        try {
            log(level, fmt::vformat(fmt_str, fmt::make_format_args(args...)));
        } catch (const fmt::format_error&) {
            // 格式串与参数不匹配时输出原始格式串
            log(level, fmt_str);
        }
    }

    /**
     * @brief 带源码位置信息的接口（在宏中使用）
     */
    template<typename... Args>
    inline void logCtx(Level level, const char* file, int line, const char* func,
                       const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) return;
        const std::string fmt_with_ctx = fmt::format("[{}:{}:{}] {}", baseFilename(file), line, func ? func : "", fmt_str);
        logFormatted(level, fmt_with_ctx, std::forward<Args>(args)...);
    }

    void flush();
    void shutdown();

    static Level parseLevel(const std::string& name, Level fallback = Level::INFO);

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool should_log(Level level) const;
    void log_to_console(Level level, const std::string& message);
    void log_to_file(const std::string& message);
    std::string format_message(Level level, const std::string& message) const;
    const char* level_to_string(Level level) const;
    std::string get_timestamp() const;
    void rotate_file_if_needed();
    std::string get_rotated_filename(size_t index) const;

    // 提取文件名（去除路径）
    static inline const char* baseFilename(const char* path) {
        if (!path) return "";
        const char* slash1 = std::strrchr(path, '/');
        const char* slash2 = std::strrchr(path, '\\');
        const char* p = (slash1 && slash2) ? (std::max(slash1, slash2)) : (slash1 ? slash1 : slash2);
        return p ? (p + 1) : path;
    }

    mutable std::mutex mutex_;
    std::atomic<Level> current_level_{Level::INFO};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> enable_console_{true};
    std::atomic<bool> shutting_down_{false};

    std::string log_file_path_;
    std::ofstream file_stream_;
    size_t current_file_size_ = 0;
    size_t max_file_size_ = 10 * 1024 * 1024;
    size_t max_files_ = 5;
    WriteMode write_mode_ = WriteMode::TRUNCATE;
};

#define SHEETBINDER_FUNC __func__

// 统一日志宏（带源码位置信息，不包含模块前缀）
#define SHEETBINDER_LOG_TRACE(fmt, ...)    sheetbinder::Logger::getInstance().logCtx(sheetbinder::Logger::Level::TRACE,    __FILE__, __LINE__, SHEETBINDER_FUNC, fmt, ##__VA_ARGS__)
#define SHEETBINDER_LOG_DEBUG(fmt, ...)    sheetbinder::Logger::getInstance().logCtx(sheetbinder::Logger::Level::DEBUG,    __FILE__, __LINE__, SHEETBINDER_FUNC, fmt, ##__VA_ARGS__)
#define SHEETBINDER_LOG_INFO(fmt, ...)     sheetbinder::Logger::getInstance().logCtx(sheetbinder::Logger::Level::INFO,     __FILE__, __LINE__, SHEETBINDER_FUNC, fmt, ##__VA_ARGS__)
#define SHEETBINDER_LOG_WARN(fmt, ...)     sheetbinder::Logger::getInstance().logCtx(sheetbinder::Logger::Level::WARN,     __FILE__, __LINE__, SHEETBINDER_FUNC, fmt, ##__VA_ARGS__)
#define SHEETBINDER_LOG_ERROR(fmt, ...)    sheetbinder::Logger::getInstance().logCtx(sheetbinder::Logger::Level::ERROR,    __FILE__, __LINE__, SHEETBINDER_FUNC, fmt, ##__VA_ARGS__)
#define SHEETBINDER_LOG_CRITICAL(fmt, ...) sheetbinder::Logger::getInstance().logCtx(sheetbinder::Logger::Level::CRITICAL, __FILE__, __LINE__, SHEETBINDER_FUNC, fmt, ##__VA_ARGS__)

} // namespace sheetbinder
