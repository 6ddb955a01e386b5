#include "sheetbinder/core/Color.hpp"
#include <fmt/format.h>
#include <cctype>

namespace sheetbinder {
namespace core {

const Color Color::BLACK(static_cast<uint32_t>(0xFF000000));
const Color Color::WHITE(static_cast<uint32_t>(0xFFFFFFFF));

Color Color::fromHex(const std::string& hex_string) {
    std::string hex = hex_string;

    if (!hex.empty() && hex[0] == '#') {
        hex = hex.substr(1);
    }

    if (hex.length() != 6 && hex.length() != 8) {
        return Color::BLACK;
    }

    uint32_t value = 0;
    for (char c : hex) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isxdigit(uc)) {
            return Color::BLACK;
        }
        uint32_t digit = std::isdigit(uc) ? static_cast<uint32_t>(uc - '0')
                                          : static_cast<uint32_t>(std::toupper(uc) - 'A' + 10);
        value = (value << 4) | digit;
    }

    if (hex.length() == 6) {
        value |= 0xFF000000;
    }
    return Color(value);
}

std::string Color::toHex() const {
    return fmt::format("{:08X}", value_);
}

}} // namespace sheetbinder::core
