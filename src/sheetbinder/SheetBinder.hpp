#pragma once

// SheetBinder - 客户xlsx报表汇总库

#include <string>

#include "sheetbinder/core/ErrorCode.hpp"
#include "sheetbinder/core/Exception.hpp"
#include "sheetbinder/core/Expected.hpp"
#include "sheetbinder/core/Path.hpp"
#include "sheetbinder/core/StyleBuilder.hpp"
#include "sheetbinder/core/Workbook.hpp"
#include "sheetbinder/core/Worksheet.hpp"
#include "sheetbinder/summary/BatchRunner.hpp"
#include "sheetbinder/summary/ClientFileSet.hpp"
#include "sheetbinder/summary/ClientSummaryBuilder.hpp"
#include "sheetbinder/summary/DateResolver.hpp"
#include "sheetbinder/summary/FormatTransplanter.hpp"
#include "sheetbinder/summary/LinkSanitizer.hpp"
#include "sheetbinder/summary/RosterReader.hpp"
#include "sheetbinder/summary/SummaryOptions.hpp"
#include "sheetbinder/summary/TabLabelAllocator.hpp"
#include "sheetbinder/utils/Logger.hpp"

// 版本信息
#define SHEETBINDER_VERSION_MAJOR 1
#define SHEETBINDER_VERSION_MINOR 0
#define SHEETBINDER_VERSION_PATCH 0
#define SHEETBINDER_VERSION_STRING "1.0.0"

namespace sheetbinder {

inline std::string getVersion() {
    return SHEETBINDER_VERSION_STRING;
}

/**
 * @brief 初始化SheetBinder库（日志系统）
 * @param log_file_path 日志文件路径，为空时只输出到控制台
 * @param level 最低日志级别
 * @param enable_console 是否启用控制台日志
 * @return 初始化是否成功
 */
bool initialize(const std::string& log_file_path = "logs/sheetbinder.log",
                Logger::Level level = Logger::Level::INFO,
                bool enable_console = true);

/**
 * @brief 刷新并关闭日志
 */
void cleanup();

} // namespace sheetbinder
