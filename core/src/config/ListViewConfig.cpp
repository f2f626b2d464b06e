#include "lc/config/ListViewConfig.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cstdio>

namespace lc {

bool parseShowScrollbar(const std::string& s, ShowScrollbar& out) {
  if (s == "auto")   { out = ShowScrollbar::Auto; return true; }
  if (s == "always") { out = ShowScrollbar::Always; return true; }
  if (s == "never")  { out = ShowScrollbar::Never; return true; }
  return false;
}

std::string serializeListViewConfig(const ListViewConfig& cfg) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  doc.AddMember("indentSize", static_cast<double>(cfg.indentSize), alloc);
  doc.AddMember("lineHeight", static_cast<double>(cfg.lineHeight), alloc);

  rapidjson::Value sb(rapidjson::kObjectType);
  sb.AddMember("show", rapidjson::StringRef(toString(cfg.showScrollbar)), alloc);
  sb.AddMember("thickness", static_cast<double>(cfg.scrollbarThickness), alloc);
  sb.AddMember("inset", static_cast<double>(cfg.scrollbarInset), alloc);
  sb.AddMember("thumbPadding", static_cast<double>(cfg.thumbPadding), alloc);
  sb.AddMember("hideDelayMs", cfg.hideDelayMs, alloc);
  doc.AddMember("scrollbar", sb, alloc);

  rapidjson::StringBuffer buf;
  rapidjson::Writer<rapidjson::StringBuffer> writer(buf);
  doc.Accept(writer);
  return buf.GetString();
}

// Reads a positive number into `out`. Absent is fine; anything else fails.
static bool readPositive(const rapidjson::Value& obj, const char* key, float& out) {
  if (!obj.HasMember(key)) return true;
  const auto& v = obj[key];
  if (!v.IsNumber() || v.GetDouble() <= 0.0) {
    std::fprintf(stderr, "[ListViewConfig] '%s' must be a positive number\n", key);
    return false;
  }
  out = static_cast<float>(v.GetDouble());
  return true;
}

bool parseListViewConfig(const std::string& json, ListViewConfig& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError()) {
    std::fprintf(stderr, "[ListViewConfig] parse error at offset %zu: %s\n",
                 doc.GetErrorOffset(), rapidjson::GetParseError_En(doc.GetParseError()));
    return false;
  }
  if (!doc.IsObject()) {
    std::fprintf(stderr, "[ListViewConfig] document is not an object\n");
    return false;
  }

  ListViewConfig cfg = out;
  if (!readPositive(doc, "indentSize", cfg.indentSize)) return false;
  if (!readPositive(doc, "lineHeight", cfg.lineHeight)) return false;

  if (doc.HasMember("scrollbar")) {
    const auto& sb = doc["scrollbar"];
    if (!sb.IsObject()) {
      std::fprintf(stderr, "[ListViewConfig] 'scrollbar' must be an object\n");
      return false;
    }
    if (sb.HasMember("show")) {
      if (!sb["show"].IsString() || !parseShowScrollbar(sb["show"].GetString(), cfg.showScrollbar)) {
        std::fprintf(stderr, "[ListViewConfig] 'scrollbar.show' must be auto, always or never\n");
        return false;
      }
    }
    if (!readPositive(sb, "thickness", cfg.scrollbarThickness)) return false;
    if (!readPositive(sb, "thumbPadding", cfg.thumbPadding)) return false;
    if (sb.HasMember("inset")) {
      if (!sb["inset"].IsNumber() || sb["inset"].GetDouble() < 0.0) {
        std::fprintf(stderr, "[ListViewConfig] 'scrollbar.inset' must be >= 0\n");
        return false;
      }
      cfg.scrollbarInset = static_cast<float>(sb["inset"].GetDouble());
    }
    if (sb.HasMember("hideDelayMs")) {
      if (!sb["hideDelayMs"].IsUint()) {
        std::fprintf(stderr, "[ListViewConfig] 'scrollbar.hideDelayMs' must be an unsigned integer\n");
        return false;
      }
      cfg.hideDelayMs = sb["hideDelayMs"].GetUint();
    }
  }

  out = cfg;
  return true;
}

} // namespace lc
