#include "cm/drawing/DrawingCodec.hpp"
#include "cm/drawing/DrawingGeometry.hpp"
#include <cstdio>
#include <stdexcept>
#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

namespace cm {

namespace {

void writeConfig(rapidjson::Writer<rapidjson::StringBuffer>& w, const Drawing& d) {
  w.StartObject();
  if (const FibonacciConfig* fib = fibonacciConfig(d)) {
    w.Key("levels");
    w.StartArray();
    for (double level : fib->levels) w.Double(level);
    w.EndArray();
  } else if (const PriceChannelConfig* ch = priceChannelConfig(d)) {
    w.Key("channelWidth"); w.Double(ch->channelWidth);
  }
  w.EndObject();
}

DrawingConfig readConfig(const rapidjson::Value& v, DrawingType type) {
  if (!v.HasMember("config") || !v["config"].IsObject()) return geometry::defaultConfig(type);
  const auto& cfg = v["config"];

  switch (type) {
    case DrawingType::Fibonacci: {
      if (!cfg.HasMember("levels") || !cfg["levels"].IsArray()) break;
      FibonacciConfig fib;
      fib.levels.clear();
      for (const auto& level : cfg["levels"].GetArray()) {
        if (!level.IsNumber()) return geometry::defaultConfig(type);
        fib.levels.push_back(level.GetDouble());
      }
      return fib;
    }
    case DrawingType::PriceChannel: {
      if (!cfg.HasMember("channelWidth") || !cfg["channelWidth"].IsNumber()) break;
      PriceChannelConfig ch;
      ch.channelWidth = cfg["channelWidth"].GetDouble();
      return ch;
    }
    default:
      break;
  }
  return geometry::defaultConfig(type);
}

// Returns kInvalidId when the stored id is absent or unusable.
DrawingId readId(const rapidjson::Value& v) {
  if (!v.HasMember("id")) return kInvalidId;
  const auto& id = v["id"];
  if (id.IsUint64()) return id.GetUint64();
  if (id.IsString()) {
    try {
      return parseIdString(id.GetString());
    } catch (const std::runtime_error& e) {
      std::fprintf(stderr, "[DrawingCodec] id \"%s\": %s, assigning a new one\n",
                   id.GetString(), e.what());
    }
  }
  return kInvalidId;
}

} // namespace

std::string encodeDrawings(const std::vector<Drawing>& drawings) {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);

  w.StartArray();
  for (const auto& d : drawings) {
    w.StartObject();
    w.Key("id");   w.Uint64(d.id);
    w.Key("type"); w.String(drawingTypeName(d.type));
    w.Key("points");
    w.StartArray();
    for (const auto& p : d.points) {
      w.StartObject();
      w.Key("index"); w.Double(p.index);
      w.Key("price"); w.Double(p.price);
      w.EndObject();
    }
    w.EndArray();
    w.Key("config"); writeConfig(w, d);
    w.Key("color");  w.String(d.color.c_str());
    w.Key("lineWidth"); w.Double(static_cast<double>(d.lineWidth));
    w.Key("visible"); w.Bool(d.visible);
    w.Key("locked");  w.Bool(d.locked);
    w.EndObject();
  }
  w.EndArray();

  return sb.GetString();
}

bool decodeDrawings(const std::string& json, std::vector<Drawing>& out) {
  rapidjson::Document doc;
  doc.Parse<rapidjson::kParseFullPrecisionFlag>(json.c_str());
  if (doc.HasParseError()) return false;
  if (!doc.IsArray()) return false;

  std::vector<Drawing> loaded;
  loaded.reserve(doc.Size());

  std::size_t recordIndex = 0;
  for (const auto& v : doc.GetArray()) {
    ++recordIndex;
    if (!v.IsObject()) {
      std::fprintf(stderr, "[DrawingCodec] record %zu: not an object, skipped\n", recordIndex);
      continue;
    }

    Drawing d;
    if (!v.HasMember("type") || !v["type"].IsString() ||
        !parseDrawingType(v["type"].GetString(), d.type)) {
      std::fprintf(stderr, "[DrawingCodec] record %zu: unknown type, skipped\n", recordIndex);
      continue;
    }

    bool pointsOk = v.HasMember("points") && v["points"].IsArray();
    if (pointsOk) {
      for (const auto& p : v["points"].GetArray()) {
        if (!p.IsObject() ||
            !p.HasMember("index") || !p["index"].IsNumber() ||
            !p.HasMember("price") || !p["price"].IsNumber()) {
          pointsOk = false;
          break;
        }
        d.points.push_back(DataPoint{p["index"].GetDouble(), p["price"].GetDouble()});
      }
    }
    if (!pointsOk || !geometry::hasValidPointCount(d)) {
      std::fprintf(stderr, "[DrawingCodec] record %zu: invalid points for %s, skipped\n",
                   recordIndex, drawingTypeName(d.type));
      continue;
    }

    d.config = readConfig(v, d.type);

    if (v.HasMember("color") && v["color"].IsString())
      d.color = v["color"].GetString();
    if (v.HasMember("lineWidth") && v["lineWidth"].IsNumber())
      d.lineWidth = static_cast<float>(v["lineWidth"].GetDouble());
    if (v.HasMember("visible") && v["visible"].IsBool())
      d.visible = v["visible"].GetBool();
    if (v.HasMember("locked") && v["locked"].IsBool())
      d.locked = v["locked"].GetBool();

    d.id = readId(v);
    loaded.push_back(std::move(d));
  }

  repairDrawingIds(loaded);

  out = std::move(loaded);
  return true;
}

} // namespace cm
