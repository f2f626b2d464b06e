#include "lc/scrollbar/Scrollbar.hpp"

#include <algorithm>

namespace lc {

Scrollbar::Scrollbar(ScrollbarKind kind, ThumbRange thumb, ScrollHandle& scroll,
                     ScrollbarDragState& dragState, ViewId parent)
  : kind_(kind), thumb_(thumb), scroll_(&scroll), dragState_(&dragState), parent_(parent) {}

Scrollbar Scrollbar::vertical(ThumbRange thumb, ScrollHandle& scroll,
                              ScrollbarDragState& dragState, ViewId parent) {
  return Scrollbar(ScrollbarKind::Vertical, thumb, scroll, dragState, parent);
}

Scrollbar Scrollbar::horizontal(ThumbRange thumb, ScrollHandle& scroll,
                                ScrollbarDragState& dragState, ViewId parent) {
  return Scrollbar(ScrollbarKind::Horizontal, thumb, scroll, dragState, parent);
}

Scrollbar& Scrollbar::withStyle(const ScrollbarStyle& style) {
  style_ = style;
  return *this;
}

LayoutRequest Scrollbar::requestLayout() const {
  LayoutRequest req;
  req.flexGrow = 1.0f;
  req.flexShrink = 1.0f;
  if (isVertical()) {
    req.width = Length::px(style_.thickness);
    req.height = Length::relative(1.0f);
  } else {
    req.width = Length::relative(1.0f);
    req.height = Length::px(style_.thickness);
  }
  return req;
}

Hitbox Scrollbar::prepaint(const Bounds& bounds) {
  layoutThumb(bounds);
  return Hitbox{bounds};
}

void Scrollbar::layoutThumb(const Bounds& bounds) {
  bounds_ = bounds;

  float pad = style_.padding;
  Bounds padded = isVertical()
    ? Bounds::fromCorners(bounds.origin + Point{0.0f, pad},
                          bounds.lowerRight() - Point{0.0f, pad * 3.0f})
    : Bounds::fromCorners(bounds.origin + Point{pad, 0.0f},
                          bounds.lowerRight() - Point{pad * 3.0f, 0.0f});

  if (isVertical()) {
    float thumbOffset = thumb_.start * padded.size.height;
    float thumbEnd = thumb_.end * padded.size.height;
    thumbHitBounds_ = Bounds::fromCorners(
      Point{padded.origin.x, padded.origin.y + thumbOffset},
      Point{padded.origin.x + padded.size.width, padded.origin.y + thumbEnd});
  } else {
    float thumbOffset = thumb_.start * padded.size.width;
    float thumbEnd = thumb_.end * padded.size.width;
    thumbHitBounds_ = Bounds::fromCorners(
      Point{padded.origin.x + thumbOffset, padded.origin.y},
      Point{padded.origin.x + thumbEnd, padded.origin.y + padded.size.height});
  }

  // Drawn thinner than its hit area.
  thumbPaintBounds_ = thumbHitBounds_;
  if (isVertical()) thumbPaintBounds_.size.width /= 1.5f;
  else thumbPaintBounds_.size.height /= 1.5f;
}

void Scrollbar::paint(const Bounds& bounds, PaintList& out) {
  layoutThumb(bounds);

  float radius = isVertical() ? thumbPaintBounds_.size.width / 2.0f
                              : thumbPaintBounds_.size.height / 2.0f;
  out.pushContentMask(bounds);
  out.paintQuad(thumbPaintBounds_, style_.thumbColor, radius);
  out.popContentMask();
}

float Scrollbar::targetFraction(Point pointer, float anchor) const {
  float trackLen = isVertical() ? bounds_.size.height : bounds_.size.width;
  if (trackLen <= 0.0f) return 0.0f;
  float pos = isVertical() ? pointer.y - bounds_.origin.y : pointer.x - bounds_.origin.x;
  float fraction = pos / trackLen - anchor;
  float maxFraction = std::max(0.0f, 1.0f - thumb_.length());
  return std::clamp(fraction, 0.0f, maxFraction);
}

bool Scrollbar::scrollToFraction(float fraction) {
  const auto& itemSize = scroll_->lastItemSize();
  if (!itemSize) return false;

  Point offset = scroll_->offset();
  if (isVertical()) {
    offset.y = -itemSize->contents.height * fraction;
  } else {
    offset.x = -itemSize->contents.width * fraction;
  }
  scroll_->setOffset(offset);
  return true;
}

void Scrollbar::onMouseDown(const MouseDownEvent& event, DispatchPhase phase, EventContext& cx) {
  if (phase != DispatchPhase::Bubble || !bounds_.contains(event.position)) return;

  if (thumbHitBounds_.contains(event.position)) {
    float trackLen = isVertical() ? bounds_.size.height : bounds_.size.width;
    float grab = isVertical() ? event.position.y - thumbHitBounds_.origin.y
                              : event.position.x - thumbHitBounds_.origin.x;
    dragState_->begin(grab / trackLen);
  } else {
    // Click on the track: jump there without starting a drag.
    scrollToFraction(targetFraction(event.position, 0.0f));
  }
  cx.notify(parent_);
  cx.stopPropagation();
}

void Scrollbar::onMouseMove(const MouseMoveEvent& event, DispatchPhase phase, EventContext& cx) {
  if (phase != DispatchPhase::Bubble) return;

  auto anchor = dragState_->anchor();
  if (anchor && event.dragging()) {
    if (scrollToFraction(targetFraction(event.position, *anchor))) {
      cx.notify(parent_);
    }
  } else if (anchor) {
    // Button was released somewhere we did not see.
    dragState_->end();
    cx.notify(parent_);
  }

  if (bounds_.contains(event.position)) {
    cx.notify(parent_);
    cx.stopPropagation();
  }
}

void Scrollbar::onMouseUp(const MouseUpEvent& event, DispatchPhase phase, EventContext& cx) {
  if (phase != DispatchPhase::Bubble) return;
  dragState_->end();
  cx.notify(parent_);
  if (bounds_.contains(event.position)) cx.stopPropagation();
}

void Scrollbar::onScrollWheel(const ScrollWheelEvent& event, DispatchPhase phase, EventContext& cx,
                              float lineHeight) {
  if (phase != DispatchPhase::Bubble || !bounds_.contains(event.position)) return;
  scroll_->setOffset(scroll_->offset() + event.delta.pixelDelta(lineHeight));
  cx.notify(parent_);
  cx.stopPropagation();
}

} // namespace lc
