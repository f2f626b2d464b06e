// D1.2 — IndentGuides decoration: segments -> pixel rectangles
// Tests:
//   1. rectangles relative to the first visible row
//   2. withColor overrides the theme color
//   3. prepaint/paint through the decoration interface
//   4. degenerate inputs

#include "lc/guides/IndentGuides.hpp"
#include "lc/paint/PaintList.hpp"
#include "lc/style/Theme.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static bool approx(float a, float b, float eps = 1e-4f) {
  return std::fabs(a - b) < eps;
}

static bool rectIs(const lc::Bounds& b, float x, float y, float w, float h) {
  return approx(b.origin.x, x) && approx(b.origin.y, y) &&
         approx(b.size.width, w) && approx(b.size.height, h);
}

static bool sameColor(const lc::Color& a, const lc::Color& b) {
  return a.r == b.r && a.g == b.g && a.b == b.b && a.a == b.a;
}

// Depths of a small fixed tree, indexed by absolute row.
static const std::vector<std::size_t> kTree = {0, 0, 0, 0, 0, 0, 1, 2, 2, 1, 0, 0};

struct TreeSource : lc::IndentDepthSource {
  int calls{0};
  std::vector<std::size_t> depthsForRange(const lc::RowRange& range) override {
    calls++;
    return std::vector<std::size_t>(kTree.begin() + static_cast<long>(range.start),
                                     kTree.begin() + static_cast<long>(range.end));
  }
};

int main() {
  lc::Theme theme = lc::darkTheme();
  lc::Bounds bounds{lc::Point{10.0f, 30.0f}, lc::Size{300.0f, 200.0f}};

  // ---- Test 1: rectangles relative to the first visible row ----
  {
    lc::RowRange lastRange;
    lc::IndentGuides guides(16.0f, [&](const lc::RowRange& r) {
      lastRange = r;
      return std::vector<std::size_t>(kTree.begin() + static_cast<long>(r.start),
                                      kTree.begin() + static_cast<long>(r.end));
    }, theme);

    auto state = guides.layout(lc::RowRange{5, 11}, bounds, 20.0f);
    requireTrue(lastRange.start == 5 && lastRange.end == 11, "callback sees the visible range");
    requireTrue(state.guides.size() == 2, "two guides");

    // Emission order: inner (column 1, rows 7-8) closes before outer (column 0, rows 6-9).
    requireTrue(rectIs(state.guides[0].bounds, 26.0f, 70.0f, 1.0f, 40.0f), "inner guide rect");
    requireTrue(rectIs(state.guides[1].bounds, 10.0f, 50.0f, 1.0f, 80.0f), "outer guide rect");
    requireTrue(sameColor(state.guides[0].color, theme.indentGuide()), "default color from theme");
    std::printf("  Test 1 (layout): PASS\n");
  }

  // ---- Test 2: withColor overrides the theme color ----
  {
    lc::Color red{1.0f, 0.0f, 0.0f, 1.0f};
    lc::IndentGuides guides(16.0f, [](const lc::RowRange& r) {
      return std::vector<std::size_t>(r.count(), 1);
    }, theme);
    guides.withColor(red);

    requireTrue(sameColor(guides.lineColor(), red), "line color overridden");
    requireTrue(guides.indentSize() == 16.0f, "indent size kept");
    auto state = guides.layout(lc::RowRange{0, 4}, bounds, 20.0f);
    requireTrue(state.guides.size() == 1, "one guide for uniform depth 1");
    requireTrue(sameColor(state.guides[0].color, red), "guide uses override");
    requireTrue(rectIs(state.guides[0].bounds, 10.0f, 30.0f, 1.0f, 80.0f), "full-height guide");
    std::printf("  Test 2 (withColor): PASS\n");
  }

  // ---- Test 3: prepaint/paint through the decoration interface ----
  {
    TreeSource source;
    lc::IndentGuides guides(16.0f, lc::depthSourceFn(source), theme);
    lc::UniformListDecoration& deco = guides;

    deco.prepaint(lc::RowRange{5, 11}, bounds, 20.0f);
    requireTrue(source.calls == 1, "one depth query per prepaint");

    lc::PaintList out;
    deco.paint(out);
    requireTrue(out.size() == 2, "two quads painted");
    requireTrue(rectIs(out.quads()[1].bounds, 10.0f, 50.0f, 1.0f, 80.0f), "painted outer guide");

    // Scrolling by one row recomputes from scratch.
    deco.prepaint(lc::RowRange{7, 12}, bounds, 20.0f);
    requireTrue(source.calls == 2, "recomputed on range change");
    out.clear();
    deco.paint(out);
    requireTrue(out.size() == 2, "still two guides");
    // Outer guide now starts at the window top (row 7) and runs rows 7-9.
    requireTrue(rectIs(out.quads()[1].bounds, 10.0f, 30.0f, 1.0f, 60.0f), "outer guide clipped to window");
    std::printf("  Test 3 (decoration interface): PASS\n");
  }

  // ---- Test 4: degenerate inputs ----
  {
    int calls = 0;
    lc::IndentGuides guides(16.0f, [&](const lc::RowRange& r) {
      calls++;
      // Answers with more rows than asked; extras are ignored.
      return std::vector<std::size_t>(r.count() + 5, 2);
    }, theme);

    auto empty = guides.layout(lc::RowRange{3, 3}, bounds, 20.0f);
    requireTrue(empty.guides.empty(), "empty range -> nothing");
    requireTrue(calls == 0, "callback not called for an empty range");

    auto state = guides.layout(lc::RowRange{0, 2}, bounds, 20.0f);
    requireTrue(state.guides.size() == 2, "two columns");
    for (const auto& g : state.guides) {
      requireTrue(approx(g.bounds.size.height, 40.0f), "extra depths ignored");
    }

    lc::IndentGuides noCallback(16.0f, lc::ComputeDepthsFn{}, theme);
    requireTrue(noCallback.layout(lc::RowRange{0, 5}, bounds, 20.0f).guides.empty(),
                "missing callback -> nothing");
    std::printf("  Test 4 (degenerate inputs): PASS\n");
  }

  std::printf("D1.2 indent_guides: ALL PASS\n");
  return 0;
}
