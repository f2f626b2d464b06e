#pragma once
#include "lc/config/ListViewConfig.hpp"
#include "lc/geom/Types.hpp"
#include "lc/input/PointerEvent.hpp"
#include "lc/list/ScrollHandle.hpp"
#include "lc/list/UniformListDecoration.hpp"
#include "lc/paint/PaintList.hpp"
#include "lc/scrollbar/Scrollbar.hpp"
#include "lc/scrollbar/ScrollbarDragState.hpp"
#include "lc/style/Theme.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace lc {

// Host for a list of equally tall rows: owns scroll and drag state, lays out
// and paints decorations and scrollbars, and routes pointer events.
//
// Per frame the host calls prepaint() then paint(). Events may arrive
// between frames; they mutate state and request a repaint, and the next
// prepaint() picks the new state up.
class UniformList {
public:
  UniformList(ViewId id, std::size_t itemCount, float itemHeight,
              const ListViewConfig& config = ListViewConfig{},
              const Theme& theme = darkTheme());

  // Scrollbars point into the owning list; a move rebuilds them against the
  // new owner and drops them from the old one.
  UniformList(UniformList&& other);
  UniformList& operator=(UniformList&& other);
  UniformList(const UniformList&) = delete;
  UniformList& operator=(const UniformList&) = delete;

  ViewId id() const { return id_; }

  void setItemCount(std::size_t count) { itemCount_ = count; }
  void setItemHeight(float height) { itemHeight_ = height; }
  void setBounds(const Bounds& bounds);
  // Width of the widest item; unset disables horizontal scrolling.
  void setContentWidth(std::optional<float> width) { contentWidth_ = width; }
  void setConfig(const ListViewConfig& config);

  std::size_t itemCount() const { return itemCount_; }
  float itemHeight() const { return itemHeight_; }
  const ListViewConfig& config() const { return config_; }

  void addDecoration(std::unique_ptr<UniformListDecoration> decoration);

  ScrollHandle& scrollHandle() { return scroll_; }
  const ScrollHandle& scrollHandle() const { return scroll_; }
  const ScrollbarDragState& dragState(ScrollbarKind kind) const;

  // Rows intersecting the viewport at the current offset.
  RowRange visibleRange() const;

  // ---- Frame ----
  void prepaint();
  void paint(PaintList& out);

  std::optional<ThumbRange> verticalThumb() const { return verticalThumb_; }
  std::optional<ThumbRange> horizontalThumb() const { return horizontalThumb_; }
  // nullptr when the bar is hidden this frame.
  const Scrollbar* verticalScrollbar() const;
  const Scrollbar* horizontalScrollbar() const;

  // ---- Events ----
  EventContext dispatchMouseDown(const MouseDownEvent& event);
  EventContext dispatchMouseMove(const MouseMoveEvent& event);
  EventContext dispatchMouseUp(const MouseUpEvent& event);
  EventContext dispatchScrollWheel(const ScrollWheelEvent& event);

  // True once since the last call if anything asked for a repaint.
  bool takeRepaintRequest();

  // ---- Scrollbar visibility ----
  void setFocused(bool focused);
  bool focused() const { return focused_; }
  bool scrollbarsVisible() const;
  void showScrollbars();
  // Hide after config().hideDelayMs unless focused or dragging by then.
  void scheduleHideScrollbars();
  bool hidePending() const { return hideDeadlineMs_.has_value(); }
  // Host clock, milliseconds. Applies a pending hide once its delay passed.
  void advanceTime(std::uint64_t nowMs);

private:
  void measure();
  void layoutScrollbars();
  void collect(const EventContext& cx);
  bool anyDragging() const;

  ViewId id_;
  std::size_t itemCount_;
  float itemHeight_;
  ListViewConfig config_;
  Theme theme_;
  std::optional<float> contentWidth_;

  ScrollHandle scroll_;
  ScrollbarDragState verticalDrag_;
  ScrollbarDragState horizontalDrag_;
  std::vector<std::unique_ptr<UniformListDecoration>> decorations_;

  std::optional<ThumbRange> verticalThumb_;
  std::optional<ThumbRange> horizontalThumb_;
  std::optional<Scrollbar> verticalBar_;
  std::optional<Scrollbar> horizontalBar_;
  Bounds verticalBarBounds_;
  Bounds horizontalBarBounds_;

  bool focused_{false};
  bool scrollbarShown_{false};
  std::uint64_t nowMs_{0};
  std::optional<std::uint64_t> hideDeadlineMs_;
  bool repaintRequested_{false};
};

} // namespace lc
