#pragma once
#include <algorithm>
#include <cstddef>

namespace lc {

// Pixel-space point. Y grows downward (0 = top of window).
struct Point {
  float x{0}, y{0};
};

inline Point operator+(Point a, Point b) { return Point{a.x + b.x, a.y + b.y}; }
inline Point operator-(Point a, Point b) { return Point{a.x - b.x, a.y - b.y}; }

struct Size {
  float width{0}, height{0};
};

struct Bounds {
  Point origin;
  Size size;

  static Bounds fromCorners(Point upperLeft, Point lowerRight) {
    return Bounds{upperLeft, Size{lowerRight.x - upperLeft.x, lowerRight.y - upperLeft.y}};
  }

  Point lowerRight() const {
    return Point{origin.x + size.width, origin.y + size.height};
  }

  // Half-open on the far edges, like a pixel grid.
  bool contains(Point p) const {
    return p.x >= origin.x && p.x < origin.x + size.width &&
           p.y >= origin.y && p.y < origin.y + size.height;
  }

  bool isEmpty() const { return size.width <= 0.0f || size.height <= 0.0f; }

  Bounds intersect(const Bounds& other) const {
    Point ul{std::max(origin.x, other.origin.x), std::max(origin.y, other.origin.y)};
    Point lr{std::min(lowerRight().x, other.lowerRight().x),
             std::min(lowerRight().y, other.lowerRight().y)};
    if (lr.x < ul.x) lr.x = ul.x;
    if (lr.y < ul.y) lr.y = ul.y;
    return fromCorners(ul, lr);
  }
};

inline bool operator==(const Bounds& a, const Bounds& b) {
  return a.origin.x == b.origin.x && a.origin.y == b.origin.y &&
         a.size.width == b.size.width && a.size.height == b.size.height;
}

// Linear RGBA, components in [0,1].
struct Color {
  float r{0}, g{0}, b{0}, a{1};
};

inline Color colorFromArray(const float c[4]) { return Color{c[0], c[1], c[2], c[3]}; }

// Half-open row interval [start, end).
struct RowRange {
  std::size_t start{0};
  std::size_t end{0};

  std::size_t count() const { return end > start ? end - start : 0; }
};

} // namespace lc
