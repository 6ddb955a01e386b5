#pragma once

#include "sheetbinder/reader/BaseSAXParser.hpp"
#include "sheetbinder/core/StyleBundle.hpp"
#include <string>
#include <vector>
#include <unordered_map>
#include <optional>

namespace sheetbinder {
namespace reader {

/**
 * @brief xl/styles.xml 解析器
 *
 * 读取顶层的 numFmts、fonts、fills、borders 与 cellXfs，
 * 把每个 cellXfs 项组装成不可变的 StyleBundle。cellStyleXfs 与 dxfs
 * 中的同名元素不参与组装。
 */
class StylesParser : public BaseSAXParser {
public:
    bool parse(const std::string& xml_content);

    /**
     * @brief cellXfs 下标对应的样式，越界返回 nullptr
     */
    core::StylePtr getStyle(int xf_index) const;

    const std::vector<core::StylePtr>& getStyles() const { return styles_; }
    size_t getStyleCount() const { return styles_.size(); }

    /**
     * @brief 自定义数字格式码，未定义时返回空
     */
    std::optional<std::string> getNumberFormatCode(uint32_t id) const;

private:
    enum class Region {
        None,
        NumFmts,
        Fonts,
        Fills,
        Borders,
        CellXfs,
        Other      // cellStyleXfs、dxfs 等不关心的区域
    };

    struct CellXf {
        uint32_t num_fmt_id = 0;
        int font_id = 0;
        int fill_id = 0;
        int border_id = 0;
        core::AlignmentStyle alignment;
        core::ProtectionStyle protection;
    };

    Region region_ = Region::None;

    std::unordered_map<uint32_t, std::string> number_formats_;
    std::vector<core::FontStyle> fonts_;
    std::vector<core::FillStyle> fills_;
    std::vector<core::BorderSet> borders_;
    std::vector<CellXf> cell_xfs_;
    std::vector<core::StylePtr> styles_;

    // 正在解析的项
    core::FontStyle current_font_;
    core::FillStyle current_fill_;
    core::BorderSet current_border_;
    core::BorderSide* current_side_ = nullptr;
    CellXf current_xf_;
    bool in_item_ = false;

    void onStartElement(const std::string& name, const std::vector<xml::XMLAttribute>& attributes, int depth) override;
    void onEndElement(const std::string& name, int depth) override;

    void handleFontChild(const std::string& name, const std::vector<xml::XMLAttribute>& attributes);
    void handleFillChild(const std::string& name, const std::vector<xml::XMLAttribute>& attributes);
    void handleBorderChild(const std::string& name, const std::vector<xml::XMLAttribute>& attributes);
    void handleXfChild(const std::string& name, const std::vector<xml::XMLAttribute>& attributes);

    static core::Color parseColor(const std::vector<xml::XMLAttribute>& attributes);

    void buildStyles();
};

}} // namespace sheetbinder::reader
