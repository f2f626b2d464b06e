#pragma once
#include <cstdint>
#include <optional>

namespace lc {

enum class ScrollbarKind : std::uint8_t {
  Horizontal = 0,
  Vertical
};

// Visible part of the content as fractions of the track, start <= end, both in [0,1].
struct ThumbRange {
  float start{0};
  float end{0};

  float length() const { return end - start; }
};

// Smallest thumb, as a fraction of the track.
inline constexpr double kMinimumThumbFraction = 0.005;

// Thumb for a list scrolled to `currentOffsetPx` (<= 0 once scrolled) showing
// `viewportLenPx` of `contentLenPx`. Returns nullopt when there is nothing
// to scroll or the range is too small to show.
//
// The virtualized list may briefly report a viewport reaching past the end of
// the content; the excess is taken off the start so the thumb keeps its length.
std::optional<ThumbRange> computeThumb(double currentOffsetPx, double viewportLenPx,
                                       double contentLenPx);

} // namespace lc
