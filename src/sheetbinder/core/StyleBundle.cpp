#include "sheetbinder/core/StyleBundle.hpp"
#include <cctype>

namespace sheetbinder {
namespace core {

namespace {

inline void combine(size_t& seed, size_t value) {
    seed ^= value + 0x9e3779b9 + (seed << 6) + (seed >> 2);
}

inline size_t colorHash(const std::optional<Color>& color) {
    return color ? color->hash() : 0x51ed270b;
}

} // namespace

size_t FontStyle::hash() const {
    size_t seed = std::hash<std::string>{}(name);
    combine(seed, std::hash<double>{}(size));
    combine(seed, (bold ? 1u : 0u) | (italic ? 2u : 0u) | (strikeout ? 4u : 0u));
    combine(seed, static_cast<size_t>(underline));
    combine(seed, static_cast<size_t>(script));
    combine(seed, colorHash(color));
    combine(seed, static_cast<size_t>(family.value_or(-1)));
    combine(seed, static_cast<size_t>(charset.value_or(-1)));
    combine(seed, std::hash<std::string>{}(scheme));
    return seed;
}

size_t FillStyle::hash() const {
    size_t seed = static_cast<size_t>(pattern);
    combine(seed, colorHash(fg_color));
    combine(seed, colorHash(bg_color));
    return seed;
}

size_t BorderSet::hash() const {
    size_t seed = 0;
    for (const BorderSide* side : {&left, &right, &top, &bottom, &diagonal}) {
        combine(seed, static_cast<size_t>(side->style));
        combine(seed, colorHash(side->color));
    }
    combine(seed, (diagonal_up ? 1u : 0u) | (diagonal_down ? 2u : 0u));
    return seed;
}

bool NumberFormat::isDate() const {
    if ((id >= 14 && id <= 22) || (id >= 45 && id <= 47)) {
        return true;
    }
    if (code.empty()) {
        return false;
    }

    bool in_quotes = false;
    bool in_brackets = false;
    for (size_t i = 0; i < code.size(); ++i) {
        char c = code[i];
        if (in_quotes) {
            if (c == '"') in_quotes = false;
            continue;
        }
        if (in_brackets) {
            if (c == ']') in_brackets = false;
            continue;
        }
        switch (c) {
            case '"':
                in_quotes = true;
                break;
            case '[':
                in_brackets = true;
                break;
            case '\\':
            case '_':
            case '*':
                ++i;  // 跳过被转义或用作填充的下一个字符
                break;
            default: {
                char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
                if (lower == 'd' || lower == 'm' || lower == 'y' || lower == 'h' || lower == 's') {
                    return true;
                }
                break;
            }
        }
    }
    return false;
}

StyleBundle::StyleBundle(FontStyle font, FillStyle fill, BorderSet border,
                         AlignmentStyle alignment, ProtectionStyle protection,
                         NumberFormat number_format)
    : font_(std::move(font)),
      fill_(std::move(fill)),
      border_(std::move(border)),
      alignment_(alignment),
      protection_(protection),
      number_format_(std::move(number_format)),
      hash_value_(calculateHash()) {
}

const StyleBundle& StyleBundle::getDefault() {
    static const StyleBundle default_style = [] {
        FontStyle font;
        font.color = Color::fromTheme(1);
        font.family = 2;
        font.scheme = "minor";
        return StyleBundle(font, FillStyle{}, BorderSet{}, AlignmentStyle{},
                           ProtectionStyle{}, NumberFormat{});
    }();
    return default_style;
}

bool StyleBundle::operator==(const StyleBundle& other) const {
    if (hash_value_ != other.hash_value_) {
        return false;
    }
    return font_ == other.font_ &&
           fill_ == other.fill_ &&
           border_ == other.border_ &&
           alignment_ == other.alignment_ &&
           protection_ == other.protection_ &&
           number_format_ == other.number_format_;
}

size_t StyleBundle::calculateHash() const {
    size_t result = font_.hash();
    combine(result, fill_.hash());
    combine(result, border_.hash());
    combine(result, static_cast<size_t>(alignment_.horizontal));
    combine(result, static_cast<size_t>(alignment_.vertical));
    combine(result, (alignment_.wrap_text ? 1u : 0u) | (alignment_.shrink_to_fit ? 2u : 0u));
    combine(result, static_cast<size_t>(alignment_.rotation));
    combine(result, static_cast<size_t>(alignment_.indent));
    combine(result, (protection_.locked ? 1u : 0u) | (protection_.hidden ? 2u : 0u));
    combine(result, number_format_.id);
    combine(result, std::hash<std::string>{}(number_format_.code));
    return result;
}

}} // namespace sheetbinder::core
