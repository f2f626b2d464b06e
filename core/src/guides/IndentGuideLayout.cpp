#include "lc/guides/IndentGuideLayout.hpp"

#include <algorithm>

namespace lc {

std::vector<IndentGuideSegment> computeIndentGuides(const std::vector<std::size_t>& depths,
                                                    std::size_t rowOffset) {
  std::vector<IndentGuideSegment> guides;
  std::vector<IndentGuideSegment> open;  // stack, open[i].column == i

  for (std::size_t row = 0; row < depths.size(); row++) {
    std::size_t depth = depths[row];
    std::size_t currentRow = row + rowOffset;
    std::size_t currentDepth = open.size();

    if (depth < currentDepth) {
      for (std::size_t i = 0; i < currentDepth - depth; i++) {
        if (open.empty()) break;
        guides.push_back(open.back());
        open.pop_back();
      }
    } else if (depth > currentDepth) {
      // Every level opened by a jump is anchored at this row.
      for (std::size_t level = currentDepth; level < depth; level++) {
        open.push_back(IndentGuideSegment{level, currentRow, currentRow});
      }
    }

    for (auto& g : open) {
      g.length = currentRow - g.startRow + 1;
    }
  }

  // Blocks not closed inside the window extend to its last row.
  while (!open.empty()) {
    guides.push_back(open.back());
    open.pop_back();
  }
  return guides;
}

void sortIndentGuides(std::vector<IndentGuideSegment>& segments) {
  std::sort(segments.begin(), segments.end());
}

} // namespace lc
