#pragma once
#include "lc/geom/Types.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace lc {

using ViewId = std::uint64_t;

enum class MouseButton : std::uint8_t {
  Left = 0, Right, Middle
};

// Listeners run twice per event: Capture (root to leaf), then Bubble.
enum class DispatchPhase : std::uint8_t {
  Capture = 0, Bubble
};

struct MouseDownEvent {
  Point position;
  MouseButton button{MouseButton::Left};
};

struct MouseMoveEvent {
  Point position;
  std::optional<MouseButton> pressedButton;  // button held during the move, if any

  bool dragging() const { return pressedButton == MouseButton::Left; }
};

struct MouseUpEvent {
  Point position;
  MouseButton button{MouseButton::Left};
};

// Wheel delta either in pixels (trackpads) or in lines (wheels).
struct ScrollDelta {
  enum class Unit : std::uint8_t { Pixels = 0, Lines };
  Unit unit{Unit::Pixels};
  float x{0}, y{0};

  static ScrollDelta pixels(float dx, float dy) { return ScrollDelta{Unit::Pixels, dx, dy}; }
  static ScrollDelta lines(float dx, float dy) { return ScrollDelta{Unit::Lines, dx, dy}; }

  Point pixelDelta(float lineHeight) const {
    if (unit == Unit::Lines) return Point{x * lineHeight, y * lineHeight};
    return Point{x, y};
  }
};

struct ScrollWheelEvent {
  Point position;
  ScrollDelta delta;
};

// Per-event dispatch context handed to every listener.
class EventContext {
public:
  void stopPropagation() { propagate_ = false; }
  bool propagating() const { return propagate_; }

  // Request a repaint of a view before the next frame.
  void notify(ViewId view) { notified_.push_back(view); }
  bool notified(ViewId view) const {
    for (ViewId v : notified_) if (v == view) return true;
    return false;
  }

private:
  bool propagate_{true};
  std::vector<ViewId> notified_;
};

} // namespace lc
