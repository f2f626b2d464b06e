#pragma once
#include <cstdint>
#include <string>

namespace lc {

enum class ShowScrollbar : std::uint8_t {
  Auto = 0,  // shown on interaction, hidden again after a delay
  Always,
  Never
};

inline const char* toString(ShowScrollbar s) {
  switch (s) {
    case ShowScrollbar::Auto: return "auto";
    case ShowScrollbar::Always: return "always";
    case ShowScrollbar::Never: return "never";
    default: return "unknown";
  }
}

// Returns false for unknown names.
bool parseShowScrollbar(const std::string& s, ShowScrollbar& out);

struct ListViewConfig {
  float indentSize{16.0f};          // px per depth level
  float lineHeight{20.0f};          // px per wheel line
  float scrollbarThickness{12.0f};
  float scrollbarInset{4.0f};       // gap between scrollbar and list edges
  float thumbPadding{5.0f};
  ShowScrollbar showScrollbar{ShowScrollbar::Auto};
  std::uint32_t hideDelayMs{1000};
};

std::string serializeListViewConfig(const ListViewConfig& cfg);

// Parse a JSON config object. Absent fields keep the values in `out`.
// Returns false (and leaves `out` untouched) on malformed input.
bool parseListViewConfig(const std::string& json, ListViewConfig& out);

} // namespace lc
