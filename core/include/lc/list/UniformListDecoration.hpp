#pragma once
#include "lc/geom/Types.hpp"
#include "lc/paint/PaintList.hpp"

namespace lc {

// Something painted over a uniform list, laid out against its visible rows.
// The host calls prepaint() then paint() once per frame, in that order.
// Layout computed in prepaint() is only valid for the paint() that follows.
class UniformListDecoration {
public:
  virtual ~UniformListDecoration() = default;

  virtual void prepaint(const RowRange& visibleRange, const Bounds& bounds, float itemHeight) = 0;
  virtual void paint(PaintList& out) const = 0;
};

} // namespace lc
