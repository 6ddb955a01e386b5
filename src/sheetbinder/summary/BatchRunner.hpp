#pragma once

#include "sheetbinder/core/Expected.hpp"
#include "sheetbinder/summary/ClientSummaryBuilder.hpp"
#include "sheetbinder/summary/SummaryOptions.hpp"
#include <string>
#include <vector>

namespace sheetbinder {
namespace summary {

/**
 * @brief 一次批处理的结果
 */
struct BatchReport {
    std::vector<ClientOutcome> outcomes;           // 按客户名排序
    std::vector<std::string> unlisted_clients;     // 不在名单中而被跳过的客户
    bool roster_applied = false;

    std::vector<std::string> succeeded() const;
    std::vector<std::string> failed() const;

    bool empty() const { return outcomes.empty(); }
    bool allSucceeded() const { return failed().empty(); }

    /**
     * @brief 渲染最终报告文本
     */
    std::string format() const;
};

/**
 * @brief 批处理入口：检查模板，读取名单，发现文件，按客户构建汇总
 */
class BatchRunner {
public:
    /**
     * @return 批处理报告；模板缺失时返回 TemplateMissing
     */
    static core::Expected<BatchReport> run(const SummaryOptions& options);
};

}} // namespace sheetbinder::summary
