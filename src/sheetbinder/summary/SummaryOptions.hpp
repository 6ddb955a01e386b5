#pragma once

#include <string>
#include <vector>

namespace sheetbinder {
namespace summary {

/**
 * @brief 汇总流程配置
 *
 * 路径、工作表名称与文件命名约定都显式给出，由命令行或调用方填写。
 */
struct SummaryOptions {
    // 路径
    std::string template_path = "Template.xlsx";     // 模板工作簿
    std::string input_dir = "client_portfolio";      // 客户数据文件目录
    std::string output_dir = ".";                    // 汇总文件输出目录
    std::string roster_path = "account_list.xlsx";   // 客户名单，为空表示不使用名单
    std::string roster_column = "Client";            // 名单中客户名所在列的表头

    // 模板
    std::string template_tab = "tab1";                       // 样式来源工作表
    std::vector<std::string> pruned_sheets = {"Calculations"};  // 复制模板后删除的工作表

    // 文件命名
    std::vector<std::string> input_extensions = {".xlsx", ".xls", ".xlsm"};
    std::string temp_file_prefix = "~$";             // Excel 锁文件前缀
    std::string summary_suffix = "_summary";
    std::string output_extension = ".xlsx";

    // 标签与日期探测
    size_t max_label_length = 31;
    int date_scan_rows = 5;
    int date_scan_cols = 5;
};

}} // namespace sheetbinder::summary
