#include "lc/list/UniformList.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace lc {

UniformList::UniformList(ViewId id, std::size_t itemCount, float itemHeight,
                         const ListViewConfig& config, const Theme& theme)
  : id_(id), itemCount_(itemCount), itemHeight_(itemHeight), config_(config), theme_(theme) {
  scrollbarShown_ = config_.showScrollbar == ShowScrollbar::Always;
}

UniformList::UniformList(UniformList&& other)
  : id_(other.id_), itemCount_(other.itemCount_), itemHeight_(other.itemHeight_) {
  *this = std::move(other);
}

UniformList& UniformList::operator=(UniformList&& other) {
  if (this == &other) return *this;

  id_ = other.id_;
  itemCount_ = other.itemCount_;
  itemHeight_ = other.itemHeight_;
  config_ = other.config_;
  theme_ = std::move(other.theme_);
  contentWidth_ = other.contentWidth_;

  scroll_ = other.scroll_;
  verticalDrag_ = other.verticalDrag_;
  horizontalDrag_ = other.horizontalDrag_;
  decorations_ = std::move(other.decorations_);

  focused_ = other.focused_;
  scrollbarShown_ = other.scrollbarShown_;
  nowMs_ = other.nowMs_;
  hideDeadlineMs_ = other.hideDeadlineMs_;
  repaintRequested_ = other.repaintRequested_;

  other.verticalBar_.reset();
  other.horizontalBar_.reset();
  layoutScrollbars();
  return *this;
}

void UniformList::setBounds(const Bounds& bounds) {
  scroll_.setBounds(bounds);
}

void UniformList::setConfig(const ListViewConfig& config) {
  config_ = config;
  if (config_.showScrollbar == ShowScrollbar::Always) scrollbarShown_ = true;
  if (config_.showScrollbar != ShowScrollbar::Auto) hideDeadlineMs_.reset();
}

void UniformList::addDecoration(std::unique_ptr<UniformListDecoration> decoration) {
  if (decoration) decorations_.push_back(std::move(decoration));
}

const ScrollbarDragState& UniformList::dragState(ScrollbarKind kind) const {
  return kind == ScrollbarKind::Vertical ? verticalDrag_ : horizontalDrag_;
}

RowRange UniformList::visibleRange() const {
  if (itemHeight_ <= 0.0f || itemCount_ == 0) return RowRange{};

  float scrolled = -std::min(scroll_.offset().y, 0.0f);
  float viewportH = scroll_.bounds().size.height;
  auto start = static_cast<std::size_t>(std::floor(scrolled / itemHeight_));
  auto end = static_cast<std::size_t>(std::ceil((scrolled + viewportH) / itemHeight_));
  start = std::min(start, itemCount_);
  end = std::min(std::max(end, start), itemCount_);
  return RowRange{start, end};
}

// -------------------- Frame --------------------

void UniformList::measure() {
  const Bounds& b = scroll_.bounds();
  ItemSize size;
  size.item = Size{b.size.width, itemHeight_};
  size.contents = Size{std::max(contentWidth_.value_or(b.size.width), b.size.width),
                       static_cast<float>(itemCount_) * itemHeight_};
  scroll_.setLastItemSize(size);
}

void UniformList::prepaint() {
  measure();
  scroll_.clampToContent();

  RowRange range = visibleRange();
  const Bounds& b = scroll_.bounds();
  // Origin of the first visible row, sub-row scroll included.
  Bounds rows{Point{b.origin.x + scroll_.offset().x,
                    b.origin.y + scroll_.offset().y + static_cast<float>(range.start) * itemHeight_},
              b.size};
  for (auto& d : decorations_) {
    d->prepaint(range, rows, itemHeight_);
  }

  layoutScrollbars();
}

void UniformList::layoutScrollbars() {
  verticalThumb_.reset();
  horizontalThumb_.reset();
  verticalBar_.reset();
  horizontalBar_.reset();

  // Unknown content size: nothing to show yet.
  const auto& itemSize = scroll_.lastItemSize();
  if (!itemSize) return;

  const Bounds& b = scroll_.bounds();
  verticalThumb_ = computeThumb(scroll_.offset().y, b.size.height, itemSize->contents.height);
  if (contentWidth_ && itemSize->contents.width > itemSize->item.width) {
    horizontalThumb_ = computeThumb(scroll_.offset().x, b.size.width, itemSize->contents.width);
  }

  if (!scrollbarsVisible()) return;

  ScrollbarStyle style;
  style.thickness = config_.scrollbarThickness;
  style.padding = config_.thumbPadding;
  style.thumbColor = theme_.scrollbarThumb();
  float inset = config_.scrollbarInset;

  if (verticalThumb_) {
    verticalBarBounds_ = Bounds{
      Point{b.lowerRight().x - inset - style.thickness, b.origin.y + inset},
      Size{style.thickness, std::max(0.0f, b.size.height - 2.0f * inset)}};
    verticalBar_ = Scrollbar::vertical(*verticalThumb_, scroll_, verticalDrag_, id_);
    verticalBar_->withStyle(style).prepaint(verticalBarBounds_);
  }
  if (horizontalThumb_) {
    horizontalBarBounds_ = Bounds{
      Point{b.origin.x + inset, b.lowerRight().y - inset - style.thickness},
      Size{std::max(0.0f, b.size.width - 2.0f * inset), style.thickness}};
    horizontalBar_ = Scrollbar::horizontal(*horizontalThumb_, scroll_, horizontalDrag_, id_);
    horizontalBar_->withStyle(style).prepaint(horizontalBarBounds_);
  }
}

void UniformList::paint(PaintList& out) {
  out.pushContentMask(scroll_.bounds());
  for (const auto& d : decorations_) {
    d->paint(out);
  }
  out.popContentMask();

  if (verticalBar_) verticalBar_->paint(verticalBarBounds_, out);
  if (horizontalBar_) horizontalBar_->paint(horizontalBarBounds_, out);
}

const Scrollbar* UniformList::verticalScrollbar() const {
  return verticalBar_ ? &*verticalBar_ : nullptr;
}

const Scrollbar* UniformList::horizontalScrollbar() const {
  return horizontalBar_ ? &*horizontalBar_ : nullptr;
}

// -------------------- Events --------------------

void UniformList::collect(const EventContext& cx) {
  if (cx.notified(id_)) repaintRequested_ = true;
}

EventContext UniformList::dispatchMouseDown(const MouseDownEvent& event) {
  EventContext cx;
  if (verticalBar_) verticalBar_->onMouseDown(event, DispatchPhase::Bubble, cx);
  if (horizontalBar_ && cx.propagating()) horizontalBar_->onMouseDown(event, DispatchPhase::Bubble, cx);
  collect(cx);
  return cx;
}

EventContext UniformList::dispatchMouseMove(const MouseMoveEvent& event) {
  EventContext cx;

  if (scroll_.bounds().contains(event.position) && !scrollbarsVisible() &&
      config_.showScrollbar == ShowScrollbar::Auto) {
    showScrollbars();
    cx.notify(id_);
  }

  // Drag moves are observed everywhere, so every bar sees every move.
  if (verticalBar_) verticalBar_->onMouseMove(event, DispatchPhase::Bubble, cx);
  if (horizontalBar_) horizontalBar_->onMouseMove(event, DispatchPhase::Bubble, cx);

  // A drag whose bar vanished (content shrank mid-drag) ends with the button.
  if (!event.dragging()) {
    if (!verticalBar_ && verticalDrag_.isDragging()) { verticalDrag_.end(); cx.notify(id_); }
    if (!horizontalBar_ && horizontalDrag_.isDragging()) { horizontalDrag_.end(); cx.notify(id_); }
  }

  collect(cx);
  return cx;
}

EventContext UniformList::dispatchMouseUp(const MouseUpEvent& event) {
  EventContext cx;

  // A click released on a bar, with no drag and no focus, starts the auto-hide.
  if (event.button == MouseButton::Left && !focused_) {
    bool overVertical = verticalBar_ && verticalBar_->bounds().contains(event.position) &&
                        !verticalDrag_.isDragging();
    bool overHorizontal = horizontalBar_ && horizontalBar_->bounds().contains(event.position) &&
                          !horizontalDrag_.isDragging();
    if (overVertical || overHorizontal) {
      scheduleHideScrollbars();
      cx.notify(id_);
    }
  }

  if (verticalBar_) verticalBar_->onMouseUp(event, DispatchPhase::Bubble, cx);
  if (horizontalBar_) horizontalBar_->onMouseUp(event, DispatchPhase::Bubble, cx);

  if (anyDragging()) {
    verticalDrag_.end();
    horizontalDrag_.end();
    cx.notify(id_);
  }

  collect(cx);
  return cx;
}

EventContext UniformList::dispatchScrollWheel(const ScrollWheelEvent& event) {
  EventContext cx;
  if (verticalBar_) verticalBar_->onScrollWheel(event, DispatchPhase::Bubble, cx, config_.lineHeight);
  if (horizontalBar_ && cx.propagating())
    horizontalBar_->onScrollWheel(event, DispatchPhase::Bubble, cx, config_.lineHeight);

  if (cx.propagating() && scroll_.bounds().contains(event.position)) {
    Point delta = event.delta.pixelDelta(config_.lineHeight);
    if (!contentWidth_) delta.x = 0.0f;
    scroll_.setOffset(scroll_.offset() + delta);
    scroll_.clampToContent();
    if (config_.showScrollbar == ShowScrollbar::Auto) showScrollbars();
    cx.notify(id_);
  }

  collect(cx);
  return cx;
}

bool UniformList::takeRepaintRequest() {
  bool requested = repaintRequested_;
  repaintRequested_ = false;
  return requested;
}

// -------------------- Visibility --------------------

bool UniformList::anyDragging() const {
  return verticalDrag_.isDragging() || horizontalDrag_.isDragging();
}

void UniformList::setFocused(bool focused) {
  if (focused_ == focused) return;
  focused_ = focused;
  if (focused_) showScrollbars();
  else scheduleHideScrollbars();
  repaintRequested_ = true;
}

bool UniformList::scrollbarsVisible() const {
  switch (config_.showScrollbar) {
    case ShowScrollbar::Always: return true;
    case ShowScrollbar::Never: return false;
    case ShowScrollbar::Auto: return scrollbarShown_;
  }
  return false;
}

void UniformList::showScrollbars() {
  scrollbarShown_ = true;
  hideDeadlineMs_.reset();
}

void UniformList::scheduleHideScrollbars() {
  if (config_.showScrollbar != ShowScrollbar::Auto) return;
  hideDeadlineMs_ = nowMs_ + config_.hideDelayMs;
}

void UniformList::advanceTime(std::uint64_t nowMs) {
  nowMs_ = nowMs;
  if (!hideDeadlineMs_ || nowMs_ < *hideDeadlineMs_) return;

  hideDeadlineMs_.reset();
  bool keep = focused_ || anyDragging();
  if (scrollbarShown_ != keep) {
    scrollbarShown_ = keep;
    repaintRequested_ = true;
  }
}

} // namespace lc
