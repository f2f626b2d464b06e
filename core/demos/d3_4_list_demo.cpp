// D3.4 — Headless list demo
// Builds a file-tree list with indent guides, replays a short pointer script
// (hover, wheel, thumb drag, release) and prints each frame's paint list as
// JSON on stdout.
//
// Usage: d3_4_list_demo [config.json] [theme.json]

#include "lc/list/UniformList.hpp"
#include "lc/guides/IndentGuides.hpp"
#include "lc/paint/PaintList.hpp"
#include "lc/config/ListViewConfig.hpp"
#include "lc/style/Theme.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

static bool readFile(const char* path, std::string& out) {
  std::ifstream in(path);
  if (!in) {
    std::fprintf(stderr, "[Demo] cannot open %s\n", path);
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  out = ss.str();
  return true;
}

// Depth of every row in a synthetic project tree.
static std::vector<std::size_t> buildTree(std::size_t rows) {
  std::vector<std::size_t> depths;
  depths.reserve(rows);
  std::uint32_t state = 12345u;
  std::size_t depth = 0;
  for (std::size_t i = 0; i < rows; i++) {
    depths.push_back(depth);
    state = state * 1664525u + 1013904223u;
    switch ((state >> 16) % 4) {
      case 0: if (depth < 6) depth++; break;
      case 1: depth = depth > 0 ? depth - 1 : 0; break;
      case 2: depth = 0; break;
      default: break;
    }
  }
  return depths;
}

static void frame(lc::UniformList& list, const char* label) {
  list.prepaint();
  lc::PaintList out;
  list.paint(out);
  std::printf("{\"frame\":\"%s\",\"offsetY\":%.2f,\"paint\":%s}\n",
              label, static_cast<double>(list.scrollHandle().offset().y), out.toJson().c_str());
}

int main(int argc, char** argv) {
  lc::ListViewConfig config;
  lc::Theme theme = lc::darkTheme();

  std::string text;
  if (argc > 1) {
    if (!readFile(argv[1], text) || !lc::parseListViewConfig(text, config)) return 1;
  }
  if (argc > 2) {
    if (!readFile(argv[2], text) || !lc::parseTheme(text, theme)) return 1;
  }

  const std::vector<std::size_t> tree = buildTree(400);
  lc::UniformList list(1, tree.size(), config.lineHeight, config, theme);
  list.setBounds(lc::Bounds{lc::Point{0.0f, 0.0f}, lc::Size{320.0f, 240.0f}});
  list.addDecoration(std::make_unique<lc::IndentGuides>(
      config.indentSize,
      [&tree](const lc::RowRange& r) {
        return std::vector<std::size_t>(tree.begin() + static_cast<std::ptrdiff_t>(r.start),
                                        tree.begin() + static_cast<std::ptrdiff_t>(r.end));
      },
      theme));

  std::uint64_t now = 0;
  list.advanceTime(now);
  frame(list, "initial");

  lc::MouseMoveEvent hover;
  hover.position = lc::Point{100.0f, 100.0f};
  list.dispatchMouseMove(hover);
  if (list.takeRepaintRequest()) frame(list, "hover");

  lc::ScrollWheelEvent wheel;
  wheel.position = lc::Point{100.0f, 100.0f};
  wheel.delta = lc::ScrollDelta::lines(0.0f, -5.0f);
  list.dispatchScrollWheel(wheel);
  if (list.takeRepaintRequest()) frame(list, "wheel");

  const lc::Scrollbar* bar = list.verticalScrollbar();
  if (!bar) {
    std::fprintf(stderr, "[Demo] no vertical scrollbar; content fits or bars disabled\n");
    return 0;
  }

  lc::Bounds thumb = bar->thumbBounds();
  lc::Point grab{thumb.origin.x + thumb.size.width * 0.5f,
                 thumb.origin.y + thumb.size.height * 0.5f};
  lc::MouseDownEvent down;
  down.position = grab;
  list.dispatchMouseDown(down);

  for (int step = 1; step <= 3; step++) {
    lc::MouseMoveEvent drag;
    drag.position = grab + lc::Point{0.0f, 30.0f * static_cast<float>(step)};
    drag.pressedButton = lc::MouseButton::Left;
    list.dispatchMouseMove(drag);
    if (list.takeRepaintRequest()) frame(list, "drag");
  }

  lc::MouseUpEvent release;
  release.position = grab + lc::Point{0.0f, 90.0f};
  list.dispatchMouseUp(release);

  list.scheduleHideScrollbars();
  list.advanceTime(now + config.hideDelayMs);
  if (list.takeRepaintRequest()) frame(list, "hidden");

  std::fprintf(stderr, "[Demo] %zu rows, final offset %.1f\n", tree.size(),
               static_cast<double>(list.scrollHandle().offset().y));
  return 0;
}
