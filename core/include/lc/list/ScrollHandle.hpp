#pragma once
#include "lc/geom/Types.hpp"

#include <optional>

namespace lc {

// Measured sizes of a uniform list: one item, and the whole content.
struct ItemSize {
  Size item;
  Size contents;
};

// Scroll position of a uniform list. Offsets are <= 0 once scrolled:
// offset.y == -250 means the viewport starts 250 px into the content.
class ScrollHandle {
public:
  Point offset() const { return offset_; }
  void setOffset(Point offset) { offset_ = offset; }

  // Viewport bounds of the list in window pixels.
  const Bounds& bounds() const { return bounds_; }
  void setBounds(const Bounds& bounds) { bounds_ = bounds; }

  // Unset until the list has been measured once.
  const std::optional<ItemSize>& lastItemSize() const { return lastItemSize_; }
  void setLastItemSize(const ItemSize& size) { lastItemSize_ = size; }

  // Largest scroll distance per axis (>= 0), from the last measurement.
  Size maxScroll() const;

  // Clamp the offset into [-maxScroll, 0] on both axes.
  // Returns true if the offset changed.
  bool clampToContent();

private:
  Point offset_;
  Bounds bounds_;
  std::optional<ItemSize> lastItemSize_;
};

} // namespace lc
