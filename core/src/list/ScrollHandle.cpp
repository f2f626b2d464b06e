#include "lc/list/ScrollHandle.hpp"

#include <algorithm>

namespace lc {

Size ScrollHandle::maxScroll() const {
  if (!lastItemSize_) return Size{};
  const Size& c = lastItemSize_->contents;
  return Size{std::max(0.0f, c.width - bounds_.size.width),
              std::max(0.0f, c.height - bounds_.size.height)};
}

bool ScrollHandle::clampToContent() {
  Size max = maxScroll();
  Point clamped{std::min(0.0f, std::max(-max.width, offset_.x)),
                std::min(0.0f, std::max(-max.height, offset_.y))};
  if (clamped.x == offset_.x && clamped.y == offset_.y) return false;
  offset_ = clamped;
  return true;
}

} // namespace lc
