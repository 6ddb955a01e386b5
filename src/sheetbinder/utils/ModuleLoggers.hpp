#pragma once
#include "Logger.hpp"

/**
 * @file ModuleLoggers.hpp
 * @brief 模块化日志宏定义
 *
 * 每个模块都有自己的日志宏，格式: [等级][模块] 消息
 */

// 核心模块 (core)
#define CORE_DEBUG(...)    SHEETBINDER_LOG_DEBUG("[DBG][core] " __VA_ARGS__)
#define CORE_INFO(...)     SHEETBINDER_LOG_INFO("[INF][core] " __VA_ARGS__)
#define CORE_WARN(...)     SHEETBINDER_LOG_WARN("[WRN][core] " __VA_ARGS__)
#define CORE_ERROR(...)    SHEETBINDER_LOG_ERROR("[ERR][core] " __VA_ARGS__)

// 读取模块 (reader)
#define READER_DEBUG(...)  SHEETBINDER_LOG_DEBUG("[DBG][read] " __VA_ARGS__)
#define READER_INFO(...)   SHEETBINDER_LOG_INFO("[INF][read] " __VA_ARGS__)
#define READER_WARN(...)   SHEETBINDER_LOG_WARN("[WRN][read] " __VA_ARGS__)
#define READER_ERROR(...)  SHEETBINDER_LOG_ERROR("[ERR][read] " __VA_ARGS__)

// XML模块 (xml)
#define XML_DEBUG(...)     SHEETBINDER_LOG_DEBUG("[DBG][xml ] " __VA_ARGS__)
#define XML_INFO(...)      SHEETBINDER_LOG_INFO("[INF][xml ] " __VA_ARGS__)
#define XML_WARN(...)      SHEETBINDER_LOG_WARN("[WRN][xml ] " __VA_ARGS__)
#define XML_ERROR(...)     SHEETBINDER_LOG_ERROR("[ERR][xml ] " __VA_ARGS__)

// 归档模块 (archive)
#define ARCHIVE_DEBUG(...) SHEETBINDER_LOG_DEBUG("[DBG][arch] " __VA_ARGS__)
#define ARCHIVE_INFO(...)  SHEETBINDER_LOG_INFO("[INF][arch] " __VA_ARGS__)
#define ARCHIVE_WARN(...)  SHEETBINDER_LOG_WARN("[WRN][arch] " __VA_ARGS__)
#define ARCHIVE_ERROR(...) SHEETBINDER_LOG_ERROR("[ERR][arch] " __VA_ARGS__)

// 汇总模块 (summary)
#define SUMMARY_DEBUG(...) SHEETBINDER_LOG_DEBUG("[DBG][summ] " __VA_ARGS__)
#define SUMMARY_INFO(...)  SHEETBINDER_LOG_INFO("[INF][summ] " __VA_ARGS__)
#define SUMMARY_WARN(...)  SHEETBINDER_LOG_WARN("[WRN][summ] " __VA_ARGS__)
#define SUMMARY_ERROR(...) SHEETBINDER_LOG_ERROR("[ERR][summ] " __VA_ARGS__)

// 工具模块 (utils)
#define UTILS_DEBUG(...)   SHEETBINDER_LOG_DEBUG("[DBG][util] " __VA_ARGS__)
#define UTILS_INFO(...)    SHEETBINDER_LOG_INFO("[INF][util] " __VA_ARGS__)
#define UTILS_WARN(...)    SHEETBINDER_LOG_WARN("[WRN][util] " __VA_ARGS__)
#define UTILS_ERROR(...)   SHEETBINDER_LOG_ERROR("[ERR][util] " __VA_ARGS__)
