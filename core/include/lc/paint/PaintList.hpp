#pragma once
#include "lc/geom/Types.hpp"

#include <string>
#include <vector>

namespace lc {

// A filled, optionally rounded rectangle.
struct Quad {
  Bounds bounds;
  float cornerRadius{0};
  Color background;
};

// Records the quads of one frame in paint order. The host replays them into
// its renderer; tests inspect them directly.
class PaintList {
public:
  // Quads painted while a mask is active are clipped to it. Masks nest by
  // intersection. Fully clipped quads are dropped.
  void pushContentMask(const Bounds& mask);
  void popContentMask();

  void paintQuad(const Bounds& bounds, const Color& color, float cornerRadius = 0.0f);

  const std::vector<Quad>& quads() const { return quads_; }
  std::size_t size() const { return quads_.size(); }
  bool empty() const { return quads_.empty(); }
  void clear();

  // For logging / tests.
  std::string toJson() const;

private:
  std::vector<Quad> quads_;
  std::vector<Bounds> masks_;
};

} // namespace lc
