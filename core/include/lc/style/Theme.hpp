#pragma once
#include "lc/geom/Types.hpp"

#include <string>

namespace lc {

struct Theme {
  std::string name;

  // Indent guides
  float indentGuideColor[4] = {0.25f, 0.25f, 0.3f, 1.0f};

  // Scrollbars
  float scrollbarThumbColor[4] = {0.45f, 0.45f, 0.5f, 0.6f};

  Color indentGuide() const { return colorFromArray(indentGuideColor); }
  Color scrollbarThumb() const { return colorFromArray(scrollbarThumbColor); }
};

// Built-in presets
Theme darkTheme();
Theme lightTheme();

// Serialize a theme to a JSON object string.
std::string serializeTheme(const Theme& theme);

// Parse a JSON theme. Missing fields keep the values already in `out`,
// so callers usually start from a preset. Returns false on error.
bool parseTheme(const std::string& json, Theme& out);

} // namespace lc
