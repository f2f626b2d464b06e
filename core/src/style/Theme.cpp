#include "lc/style/Theme.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cstdio>

namespace lc {

// -------------------- Built-in presets --------------------

Theme darkTheme() {
  Theme t;
  t.name = "Dark";
  // All fields already carry the dark-theme defaults from the struct initializers.
  return t;
}

Theme lightTheme() {
  Theme t;
  t.name = "Light";

  t.indentGuideColor[0] = 0.85f; t.indentGuideColor[1] = 0.85f;
  t.indentGuideColor[2] = 0.87f; t.indentGuideColor[3] = 1.0f;

  t.scrollbarThumbColor[0] = 0.55f; t.scrollbarThumbColor[1] = 0.55f;
  t.scrollbarThumbColor[2] = 0.6f;  t.scrollbarThumbColor[3] = 0.5f;

  return t;
}

// -------------------- JSON --------------------

static rapidjson::Value colorToJson(const float c[4], rapidjson::Document::AllocatorType& alloc) {
  rapidjson::Value arr(rapidjson::kArrayType);
  for (int i = 0; i < 4; i++) arr.PushBack(static_cast<double>(c[i]), alloc);
  return arr;
}

// Reads [r,g,b,a] into c. Leaves c unchanged when the member is absent.
static bool readColor(const rapidjson::Value& obj, const char* key, float c[4]) {
  if (!obj.HasMember(key)) return true;
  const auto& v = obj[key];
  if (!v.IsArray() || v.Size() != 4) {
    std::fprintf(stderr, "[Theme] '%s' must be an array of 4 numbers\n", key);
    return false;
  }
  float tmp[4];
  for (rapidjson::SizeType i = 0; i < 4; i++) {
    if (!v[i].IsNumber()) {
      std::fprintf(stderr, "[Theme] '%s'[%u] is not a number\n", key, i);
      return false;
    }
    tmp[i] = static_cast<float>(v[i].GetDouble());
  }
  for (int i = 0; i < 4; i++) c[i] = tmp[i];
  return true;
}

std::string serializeTheme(const Theme& theme) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  doc.AddMember("name", rapidjson::Value(theme.name.c_str(), alloc), alloc);
  doc.AddMember("indentGuideColor", colorToJson(theme.indentGuideColor, alloc), alloc);
  doc.AddMember("scrollbarThumbColor", colorToJson(theme.scrollbarThumbColor, alloc), alloc);

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

bool parseTheme(const std::string& json, Theme& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError()) {
    std::fprintf(stderr, "[Theme] parse error at offset %zu: %s\n",
                 doc.GetErrorOffset(), rapidjson::GetParseError_En(doc.GetParseError()));
    return false;
  }
  if (!doc.IsObject()) {
    std::fprintf(stderr, "[Theme] document is not an object\n");
    return false;
  }

  Theme t = out;
  if (doc.HasMember("name") && doc["name"].IsString())
    t.name = doc["name"].GetString();

  if (!readColor(doc, "indentGuideColor", t.indentGuideColor)) return false;
  if (!readColor(doc, "scrollbarThumbColor", t.scrollbarThumbColor)) return false;

  out = t;
  return true;
}

} // namespace lc
