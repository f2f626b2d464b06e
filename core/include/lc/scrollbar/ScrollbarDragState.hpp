#pragma once
#include <optional>

namespace lc {

// Idle, or Dragging with the grab point's offset from the thumb start
// (fraction of the track length).
class ScrollbarDragState {
public:
  bool isDragging() const { return anchor_.has_value(); }
  std::optional<float> anchor() const { return anchor_; }

  void begin(float anchorFraction) { anchor_ = anchorFraction; }
  void end() { anchor_.reset(); }

private:
  std::optional<float> anchor_;
};

} // namespace lc
