#include "lc/paint/PaintList.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace lc {

void PaintList::pushContentMask(const Bounds& mask) {
  if (masks_.empty()) masks_.push_back(mask);
  else masks_.push_back(masks_.back().intersect(mask));
}

void PaintList::popContentMask() {
  if (!masks_.empty()) masks_.pop_back();
}

void PaintList::paintQuad(const Bounds& bounds, const Color& color, float cornerRadius) {
  Bounds b = masks_.empty() ? bounds : bounds.intersect(masks_.back());
  if (b.isEmpty()) return;
  quads_.push_back(Quad{b, cornerRadius, color});
}

void PaintList::clear() {
  quads_.clear();
  masks_.clear();
}

std::string PaintList::toJson() const {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  rapidjson::Value arr(rapidjson::kArrayType);
  for (const auto& q : quads_) {
    rapidjson::Value o(rapidjson::kObjectType);
    o.AddMember("x", static_cast<double>(q.bounds.origin.x), alloc);
    o.AddMember("y", static_cast<double>(q.bounds.origin.y), alloc);
    o.AddMember("w", static_cast<double>(q.bounds.size.width), alloc);
    o.AddMember("h", static_cast<double>(q.bounds.size.height), alloc);
    o.AddMember("radius", static_cast<double>(q.cornerRadius), alloc);

    rapidjson::Value c(rapidjson::kArrayType);
    c.PushBack(static_cast<double>(q.background.r), alloc);
    c.PushBack(static_cast<double>(q.background.g), alloc);
    c.PushBack(static_cast<double>(q.background.b), alloc);
    c.PushBack(static_cast<double>(q.background.a), alloc);
    o.AddMember("color", c, alloc);

    arr.PushBack(o, alloc);
  }
  doc.AddMember("quads", arr, alloc);

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

} // namespace lc
