#pragma once

#include "sheetbinder/core/ErrorCode.hpp"
#include "sheetbinder/core/Expected.hpp"
#include "sheetbinder/core/Path.hpp"
#include "sheetbinder/summary/SummaryOptions.hpp"
#include <string>
#include <vector>

namespace sheetbinder {
namespace core {
class Workbook;
class Worksheet;
}

namespace summary {

/**
 * @brief 单个客户汇总的构建阶段
 */
enum class BuildState : uint8_t {
    Init,
    TemplateCopied,
    Sanitized,
    SheetsPruned,
    IteratingFiles,
    Saved,
    Failed
};

const char* toString(BuildState state) noexcept;

/**
 * @brief 被跳过的输入文件及原因
 */
struct SkippedFile {
    core::Path path;
    core::Error error;
};

/**
 * @brief 单个客户的处理结果
 */
struct ClientOutcome {
    std::string client;
    bool success = false;
    size_t tab_count = 0;                  // 新建的数据工作表数量
    std::vector<std::string> tab_names;    // 新建工作表的名称，按创建顺序
    core::Error error;                     // 失败原因，成功时为 Ok
    std::vector<SkippedFile> skipped_files;
    core::Path output_path;
    BuildState state = BuildState::Init;
};

/**
 * @brief 客户汇总构建器
 *
 * 复制模板为 <客户名><后缀><扩展名>，清理外部链接，删除辅助工作表，
 * 然后为每个数据文件移植一张新工作表并保存。
 * 单个文件的错误只导致跳过该文件，所有错误都以 ClientOutcome 返回，不向外抛出。
 */
class ClientSummaryBuilder {
public:
    explicit ClientSummaryBuilder(SummaryOptions options);

    ClientOutcome build(const std::string& client, std::vector<core::Path> files) const;

    core::Path outputPathFor(const std::string& client) const;

    const SummaryOptions& getOptions() const { return options_; }

private:
    SummaryOptions options_;

    /**
     * @brief 处理一个数据文件，成功时返回新工作表名称
     */
    core::Expected<std::string> appendFile(core::Workbook& summary,
                                           const core::Worksheet& template_sheet,
                                           const core::Path& file) const;

    std::string desiredLabel(const core::Worksheet& data_sheet, const core::Path& file) const;

    ClientOutcome& fail(ClientOutcome& outcome, core::Error error) const;
};

}} // namespace sheetbinder::summary
