// D2.1 — Scrollbar thumb geometry
// Tests:
//   1. top of the list
//   2. scrolled to the middle
//   3. content fits -> hidden
//   4. overshoot keeps the thumb length
//   5. minimum thumb size
//   6. invariants across a sweep

#include "lc/scrollbar/ScrollbarGeometry.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static bool approx(double a, double b, double eps = 1e-5) {
  return std::fabs(a - b) < eps;
}

int main() {
  // ---- Test 1: top of the list ----
  {
    auto t = lc::computeThumb(0.0, 100.0, 1000.0);
    requireTrue(t.has_value(), "thumb shown");
    requireTrue(approx(t->start, 0.0), "start 0");
    requireTrue(approx(t->end, 0.1), "end 0.1");
    std::printf("  Test 1 (top): PASS\n");
  }

  // ---- Test 2: scrolled to the middle ----
  {
    auto t = lc::computeThumb(-500.0, 100.0, 1000.0);
    requireTrue(t.has_value(), "thumb shown");
    requireTrue(approx(t->start, 0.5), "start 0.5");
    requireTrue(approx(t->end, 0.6), "end 0.6");

    // Positive offsets (overscroll past the top) count as zero.
    auto top = lc::computeThumb(35.0, 100.0, 1000.0);
    requireTrue(top.has_value() && approx(top->start, 0.0) && approx(top->end, 0.1),
                "positive offset clamps to the top");
    std::printf("  Test 2 (middle): PASS\n");
  }

  // ---- Test 3: content fits -> hidden ----
  {
    requireTrue(!lc::computeThumb(0.0, 100.0, 100.0).has_value(), "equal sizes hidden");
    requireTrue(!lc::computeThumb(0.0, 100.0, 50.0).has_value(), "smaller content hidden");
    requireTrue(!lc::computeThumb(0.0, 100.0, 0.0).has_value(), "zero content hidden");
    requireTrue(!lc::computeThumb(0.0, 0.0, 0.0).has_value(), "zero everything hidden");
    std::printf("  Test 3 (content fits): PASS\n");
  }

  // ---- Test 4: overshoot keeps the thumb length ----
  {
    // end = (950 + 100) / 1000 = 1.05 -> 0.05 overshoot taken off the start
    auto t = lc::computeThumb(-950.0, 100.0, 1000.0);
    requireTrue(t.has_value(), "thumb shown");
    requireTrue(approx(t->end, 1.0), "end clamped to 1");
    requireTrue(approx(t->start, 0.90), "start reduced by the overshoot");
    requireTrue(approx(t->length(), 0.1), "length preserved");
    requireTrue(t->start <= t->end, "ordered");
    std::printf("  Test 4 (overshoot): PASS\n");
  }

  // ---- Test 5: minimum thumb size ----
  {
    // 1 px viewport over 1000 px: raw length 0.001, widened to 0.005.
    auto t = lc::computeThumb(0.0, 1.0, 1000.0);
    requireTrue(t.has_value(), "thumb shown");
    requireTrue(approx(t->length(), lc::kMinimumThumbFraction), "minimum length");

    // Start too close to the end for a minimum thumb -> hidden.
    requireTrue(!lc::computeThumb(-998.0, 1.0, 1000.0).has_value(), "no room for a thumb");

    // Just enough room.
    auto edge = lc::computeThumb(-994.0, 1.0, 1000.0);
    requireTrue(edge.has_value(), "room for a minimum thumb");
    requireTrue(edge->end <= 1.0f, "end within the track");
    std::printf("  Test 5 (minimum size): PASS\n");
  }

  // ---- Test 6: invariants across a sweep ----
  {
    for (int i = 0; i <= 200; i++) {
      double offset = -10.0 * i;
      auto t = lc::computeThumb(offset, 150.0, 1500.0);
      if (!t) continue;
      requireTrue(t->start >= 0.0f && t->end <= 1.0f, "within [0,1]");
      requireTrue(t->start <= t->end, "start <= end");
      requireTrue(approx(t->length(), 0.1, 1e-4), "constant length while scrolling");
    }
    std::printf("  Test 6 (sweep): PASS\n");
  }

  std::printf("D2.1 scrollbar_geometry: ALL PASS\n");
  return 0;
}
