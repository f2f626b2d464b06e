#pragma once
#include "lc/geom/Types.hpp"
#include "lc/input/PointerEvent.hpp"
#include "lc/list/ScrollHandle.hpp"
#include "lc/paint/PaintList.hpp"
#include "lc/scrollbar/ScrollbarDragState.hpp"
#include "lc/scrollbar/ScrollbarGeometry.hpp"

#include <cstdint>

namespace lc {

struct Length {
  enum class Unit : std::uint8_t { Pixels = 0, Relative };
  Unit unit{Unit::Pixels};
  float value{0};

  static Length px(float v) { return Length{Unit::Pixels, v}; }
  static Length relative(float v) { return Length{Unit::Relative, v}; }
};

// What the element asks of the host's layout pass.
struct LayoutRequest {
  Length width;
  Length height;
  float flexGrow{0};
  float flexShrink{1};
};

struct Hitbox {
  Bounds bounds;
};

struct ScrollbarStyle {
  float thickness{12.0f};
  float padding{5.0f};  // track inset at the start; three times this at the end
  Color thumbColor{0.45f, 0.45f, 0.5f, 0.6f};
};

// A list scrollbar, rebuilt by the host every frame.
//
// The element borrows the list's scroll handle and drag state; both must
// outlive it. Event handlers use the bounds recorded by the last prepaint() or paint().
class Scrollbar {
public:
  static Scrollbar vertical(ThumbRange thumb, ScrollHandle& scroll,
                            ScrollbarDragState& dragState, ViewId parent);
  static Scrollbar horizontal(ThumbRange thumb, ScrollHandle& scroll,
                              ScrollbarDragState& dragState, ViewId parent);

  Scrollbar& withStyle(const ScrollbarStyle& style);

  LayoutRequest requestLayout() const;
  Hitbox prepaint(const Bounds& bounds);
  void paint(const Bounds& bounds, PaintList& out);

  // Pointer handlers. Capture-phase events are ignored.
  void onMouseDown(const MouseDownEvent& event, DispatchPhase phase, EventContext& cx);
  void onMouseMove(const MouseMoveEvent& event, DispatchPhase phase, EventContext& cx);
  void onMouseUp(const MouseUpEvent& event, DispatchPhase phase, EventContext& cx);
  void onScrollWheel(const ScrollWheelEvent& event, DispatchPhase phase, EventContext& cx,
                     float lineHeight);

  // Scroll fraction that puts the thumb start at `pointer` minus `anchor`
  // track fractions, clamped so the whole thumb stays on the track.
  float targetFraction(Point pointer, float anchor) const;

  ScrollbarKind kind() const { return kind_; }
  const ThumbRange& thumb() const { return thumb_; }
  const Bounds& bounds() const { return bounds_; }
  const Bounds& thumbBounds() const { return thumbHitBounds_; }
  const Bounds& paintedThumbBounds() const { return thumbPaintBounds_; }

private:
  Scrollbar(ScrollbarKind kind, ThumbRange thumb, ScrollHandle& scroll,
            ScrollbarDragState& dragState, ViewId parent);

  bool isVertical() const { return kind_ == ScrollbarKind::Vertical; }
  void layoutThumb(const Bounds& bounds);
  // Scroll the bar's axis to `fraction` of the content. No-op before measurement.
  bool scrollToFraction(float fraction);

  ScrollbarKind kind_;
  ThumbRange thumb_;
  ScrollHandle* scroll_;
  ScrollbarDragState* dragState_;
  ViewId parent_;
  ScrollbarStyle style_;

  Bounds bounds_;
  Bounds thumbHitBounds_;
  Bounds thumbPaintBounds_;
};

} // namespace lc
