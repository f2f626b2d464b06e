#pragma once
#include "lc/guides/IndentGuideLayout.hpp"
#include "lc/list/UniformListDecoration.hpp"
#include "lc/style/Theme.hpp"

#include <functional>
#include <vector>

namespace lc {

// Returns the nesting depth of each row in the range, top to bottom.
using ComputeDepthsFn = std::function<std::vector<std::size_t>(const RowRange&)>;

// Interface form of ComputeDepthsFn for hosts that prefer a virtual method.
class IndentDepthSource {
public:
  virtual ~IndentDepthSource() = default;
  virtual std::vector<std::size_t> depthsForRange(const RowRange& range) = 0;
};

// Wraps a source; the source must outlive the returned function.
ComputeDepthsFn depthSourceFn(IndentDepthSource& source);

struct IndentGuideRect {
  Bounds bounds;
  Color color;
};

struct IndentGuidesLayoutState {
  std::vector<IndentGuideRect> guides;
};

// Draws indent guides for the visible rows of a uniform list.
class IndentGuides : public UniformListDecoration {
public:
  static constexpr float kLineWidth = 1.0f;

  IndentGuides(float indentSize, ComputeDepthsFn computeDepths, const Theme& theme);

  IndentGuides& withColor(const Color& color);

  // Pure two-phase API.
  IndentGuidesLayoutState layout(const RowRange& visibleRange, const Bounds& bounds,
                                 float itemHeight) const;
  static void paintLayout(const IndentGuidesLayoutState& state, PaintList& out);

  // UniformListDecoration
  void prepaint(const RowRange& visibleRange, const Bounds& bounds, float itemHeight) override;
  void paint(PaintList& out) const override;

  const Color& lineColor() const { return lineColor_; }
  float indentSize() const { return indentSize_; }

private:
  Color lineColor_;
  float indentSize_;
  ComputeDepthsFn computeDepths_;
  IndentGuidesLayoutState state_;
};

} // namespace lc
