#pragma once
#include <cstddef>
#include <vector>

namespace lc {

// One vertical guide: `column` is the depth level it marks (0-based),
// `startRow` an absolute row index, `length` the number of rows spanned.
struct IndentGuideSegment {
  std::size_t column{0};
  std::size_t startRow{0};
  std::size_t length{0};

  std::size_t endRow() const { return startRow + length - 1; }  // inclusive
};

inline bool operator==(const IndentGuideSegment& a, const IndentGuideSegment& b) {
  return a.column == b.column && a.startRow == b.startRow && a.length == b.length;
}

inline bool operator!=(const IndentGuideSegment& a, const IndentGuideSegment& b) {
  return !(a == b);
}

// Natural ordering: column, then start row, then length.
inline bool operator<(const IndentGuideSegment& a, const IndentGuideSegment& b) {
  if (a.column != b.column) return a.column < b.column;
  if (a.startRow != b.startRow) return a.startRow < b.startRow;
  return a.length < b.length;
}

// Convert per-row nesting depths into guide segments.
//
// `depths[i]` is the depth of absolute row `i + rowOffset`. A row of depth d
// lies inside d guides (columns 0..d-1); each maximal run of rows with depth
// > k yields one segment at column k. Guides still open after the last row
// run to the end of the window. Segments come back in emission order (inner
// guides close first); use sortIndentGuides() for a stable ordering.
std::vector<IndentGuideSegment> computeIndentGuides(const std::vector<std::size_t>& depths,
                                                    std::size_t rowOffset);

void sortIndentGuides(std::vector<IndentGuideSegment>& segments);

} // namespace lc
