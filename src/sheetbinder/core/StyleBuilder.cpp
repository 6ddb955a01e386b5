#include "sheetbinder/core/StyleBuilder.hpp"

namespace sheetbinder {
namespace core {

StyleBuilder::StyleBuilder(const StyleBundle& style)
    : font_(style.getFont()),
      fill_(style.getFill()),
      border_(style.getBorder()),
      alignment_(style.getAlignment()),
      protection_(style.getProtection()),
      number_format_(style.getNumberFormat()) {
}

StylePtr StyleBuilder::build() const {
    // StyleBuilder 是 StyleBundle 的友元，可以调用私有构造函数
    return StylePtr(new StyleBundle(font_, fill_, border_, alignment_, protection_, number_format_));
}

}} // namespace sheetbinder::core
