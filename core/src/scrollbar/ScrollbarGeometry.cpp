#include "lc/scrollbar/ScrollbarGeometry.hpp"

#include <algorithm>
#include <cmath>

namespace lc {

std::optional<ThumbRange> computeThumb(double currentOffsetPx, double viewportLenPx,
                                       double contentLenPx) {
  if (contentLenPx <= 0.0) return std::nullopt;
  if (contentLenPx <= viewportLenPx) return std::nullopt;

  double scrolled = std::fabs(std::min(currentOffsetPx, 0.0));
  double start = scrolled / contentLenPx;
  double end = (scrolled + viewportLenPx) / contentLenPx;

  double overshoot = std::clamp(end - 1.0, 0.0, 1.0);
  if (overshoot > 0.0) {
    start -= overshoot;
  }

  if (start + kMinimumThumbFraction > 1.0 || end > contentLenPx) return std::nullopt;

  end = std::clamp(end, start + kMinimumThumbFraction, 1.0);
  start = std::max(start, 0.0);
  return ThumbRange{static_cast<float>(start), static_cast<float>(end)};
}

} // namespace lc
