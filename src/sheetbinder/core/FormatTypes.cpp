#include "sheetbinder/core/FormatTypes.hpp"

namespace sheetbinder {
namespace core {

namespace {

template <typename Enum, size_t N>
Enum lookup(const char* const (&names)[N], std::string_view value) {
    for (size_t i = 0; i < N; ++i) {
        if (value == names[i]) {
            return static_cast<Enum>(i);
        }
    }
    return static_cast<Enum>(0);
}

template <typename Enum, size_t N>
const char* name(const char* const (&names)[N], Enum e) {
    size_t index = static_cast<size_t>(e);
    return index < N ? names[index] : names[0];
}

// 数组下标与枚举值一一对应
const char* const kUnderlineNames[] = {
    "none", "single", "double", "singleAccounting", "doubleAccounting"
};

const char* const kScriptNames[] = {
    "baseline", "superscript", "subscript"
};

const char* const kHorizontalNames[] = {
    "general", "left", "center", "right", "fill", "justify", "centerContinuous", "distributed"
};

const char* const kVerticalNames[] = {
    "", "top", "center", "bottom", "justify", "distributed"
};

const char* const kPatternNames[] = {
    "none", "solid", "mediumGray", "darkGray", "lightGray",
    "darkHorizontal", "darkVertical", "darkDown", "darkUp", "darkGrid", "darkTrellis",
    "lightHorizontal", "lightVertical", "lightDown", "lightUp", "lightGrid", "lightTrellis",
    "gray125", "gray0625"
};

const char* const kBorderNames[] = {
    "none", "thin", "medium", "thick", "double", "hair", "dotted", "dashed",
    "dashDot", "dashDotDot", "mediumDashed", "mediumDashDot", "mediumDashDotDot", "slantDashDot"
};

} // namespace

const char* toXMLValue(UnderlineType type) { return name(kUnderlineNames, type); }
const char* toXMLValue(FontScript script) { return name(kScriptNames, script); }
const char* toXMLValue(HorizontalAlign align) { return name(kHorizontalNames, align); }
const char* toXMLValue(VerticalAlign align) { return name(kVerticalNames, align); }
const char* toXMLValue(PatternType pattern) { return name(kPatternNames, pattern); }
const char* toXMLValue(BorderStyle style) { return name(kBorderNames, style); }

UnderlineType underlineFromXML(std::string_view value) {
    // <u/> 不带 val 属性时表示单下划线
    if (value.empty()) return UnderlineType::Single;
    return lookup<UnderlineType>(kUnderlineNames, value);
}

FontScript scriptFromXML(std::string_view value) {
    return lookup<FontScript>(kScriptNames, value);
}

HorizontalAlign horizontalAlignFromXML(std::string_view value) {
    return lookup<HorizontalAlign>(kHorizontalNames, value);
}

VerticalAlign verticalAlignFromXML(std::string_view value) {
    if (value.empty()) return VerticalAlign::None;
    return lookup<VerticalAlign>(kVerticalNames, value);
}

PatternType patternFromXML(std::string_view value) {
    return lookup<PatternType>(kPatternNames, value);
}

BorderStyle borderStyleFromXML(std::string_view value) {
    return lookup<BorderStyle>(kBorderNames, value);
}

}} // namespace sheetbinder::core
