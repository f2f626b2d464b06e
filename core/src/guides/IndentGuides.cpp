#include "lc/guides/IndentGuides.hpp"

#include <utility>

namespace lc {

ComputeDepthsFn depthSourceFn(IndentDepthSource& source) {
  IndentDepthSource* src = &source;
  return [src](const RowRange& range) { return src->depthsForRange(range); };
}

IndentGuides::IndentGuides(float indentSize, ComputeDepthsFn computeDepths, const Theme& theme)
  : lineColor_(theme.indentGuide()),
    indentSize_(indentSize),
    computeDepths_(std::move(computeDepths)) {}

IndentGuides& IndentGuides::withColor(const Color& color) {
  lineColor_ = color;
  return *this;
}

IndentGuidesLayoutState IndentGuides::layout(const RowRange& visibleRange, const Bounds& bounds,
                                             float itemHeight) const {
  IndentGuidesLayoutState state;
  if (!computeDepths_ || visibleRange.count() == 0) return state;

  std::vector<std::size_t> depths = computeDepths_(visibleRange);
  // Depths past the range are ignored; a short answer just covers fewer rows.
  if (depths.size() > visibleRange.count()) depths.resize(visibleRange.count());

  auto segments = computeIndentGuides(depths, visibleRange.start);
  state.guides.reserve(segments.size());
  for (const auto& seg : segments) {
    float x = static_cast<float>(seg.column) * indentSize_;
    float y = static_cast<float>(seg.startRow - visibleRange.start) * itemHeight;
    Bounds b{bounds.origin + Point{x, y},
             Size{kLineWidth, static_cast<float>(seg.length) * itemHeight}};
    state.guides.push_back(IndentGuideRect{b, lineColor_});
  }
  return state;
}

void IndentGuides::paintLayout(const IndentGuidesLayoutState& state, PaintList& out) {
  for (const auto& g : state.guides) {
    out.paintQuad(g.bounds, g.color);
  }
}

void IndentGuides::prepaint(const RowRange& visibleRange, const Bounds& bounds, float itemHeight) {
  state_ = layout(visibleRange, bounds, itemHeight);
}

void IndentGuides::paint(PaintList& out) const {
  paintLayout(state_, out);
}

} // namespace lc
