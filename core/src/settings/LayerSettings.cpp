#include "cm/settings/LayerSettings.hpp"
#include <cstdint>

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

namespace cm {

namespace {

void readDouble(const rapidjson::Value& obj, const char* key, double& out) {
  if (obj.HasMember(key) && obj[key].IsNumber()) out = obj[key].GetDouble();
}

void readFloat(const rapidjson::Value& obj, const char* key, float& out) {
  if (obj.HasMember(key) && obj[key].IsNumber())
    out = static_cast<float>(obj[key].GetDouble());
}

void readBool(const rapidjson::Value& obj, const char* key, bool& out) {
  if (obj.HasMember(key) && obj[key].IsBool()) out = obj[key].GetBool();
}

} // namespace

std::string serializeLayerSettings(const LayerSettings& settings) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  doc.AddMember("version",
                rapidjson::Value(settings.version.c_str(), alloc), alloc);
  doc.AddMember("theme",
                rapidjson::Value(settings.themeName.c_str(), alloc), alloc);

  // Drawing layer
  const DrawingLayerConfig& d = settings.drawing;
  rapidjson::Value dv(rapidjson::kObjectType);
  dv.AddMember("hitTolerancePx", d.hitTolerancePx, alloc);
  dv.AddMember("controlPointTolerancePx", d.controlPointTolerancePx, alloc);
  dv.AddMember("snapThresholdPx", d.snapThresholdPx, alloc);
  dv.AddMember("snapToCandles", d.snapToCandles, alloc);
  dv.AddMember("roundToBar", d.roundToBar, alloc);
  dv.AddMember("maxHistory", static_cast<std::uint64_t>(d.maxHistory), alloc);
  dv.AddMember("lineWidth", static_cast<double>(d.lineWidth), alloc);
  dv.AddMember("selectedWidthBoost", static_cast<double>(d.selectedWidthBoost), alloc);
  dv.AddMember("hoverHandleRadius", static_cast<double>(d.hoverHandleRadius), alloc);
  dv.AddMember("editHandleRadius", static_cast<double>(d.editHandleRadius), alloc);
  dv.AddMember("markerRadius", static_cast<double>(d.markerRadius), alloc);
  doc.AddMember("drawing", dv, alloc);

  // Crosshair
  const CrosshairLayerConfig& c = settings.crosshair;
  rapidjson::Value cv(rapidjson::kObjectType);
  cv.AddMember("lineWidth", static_cast<double>(c.lineWidth), alloc);
  cv.AddMember("dashed", c.dashed, alloc);
  cv.AddMember("showLabels", c.showLabels, alloc);
  cv.AddMember("snapToBar", c.snapToBar, alloc);
  cv.AddMember("priceDecimals", c.priceDecimals, alloc);
  doc.AddMember("crosshair", cv, alloc);

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

bool deserializeLayerSettings(const std::string& json, LayerSettings& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) return false;

  if (doc.HasMember("version") && doc["version"].IsString())
    out.version = doc["version"].GetString();

  if (doc.HasMember("theme") && doc["theme"].IsString())
    out.themeName = doc["theme"].GetString();

  if (doc.HasMember("drawing") && doc["drawing"].IsObject()) {
    const auto& dv = doc["drawing"];
    DrawingLayerConfig& d = out.drawing;
    readDouble(dv, "hitTolerancePx", d.hitTolerancePx);
    readDouble(dv, "controlPointTolerancePx", d.controlPointTolerancePx);
    readDouble(dv, "snapThresholdPx", d.snapThresholdPx);
    readBool(dv, "snapToCandles", d.snapToCandles);
    readBool(dv, "roundToBar", d.roundToBar);
    if (dv.HasMember("maxHistory") && dv["maxHistory"].IsUint64())
      d.maxHistory = static_cast<std::size_t>(dv["maxHistory"].GetUint64());
    readFloat(dv, "lineWidth", d.lineWidth);
    readFloat(dv, "selectedWidthBoost", d.selectedWidthBoost);
    readFloat(dv, "hoverHandleRadius", d.hoverHandleRadius);
    readFloat(dv, "editHandleRadius", d.editHandleRadius);
    readFloat(dv, "markerRadius", d.markerRadius);
  }

  if (doc.HasMember("crosshair") && doc["crosshair"].IsObject()) {
    const auto& cv = doc["crosshair"];
    CrosshairLayerConfig& c = out.crosshair;
    readFloat(cv, "lineWidth", c.lineWidth);
    readBool(cv, "dashed", c.dashed);
    readBool(cv, "showLabels", c.showLabels);
    readBool(cv, "snapToBar", c.snapToBar);
    if (cv.HasMember("priceDecimals") && cv["priceDecimals"].IsInt())
      c.priceDecimals = cv["priceDecimals"].GetInt();
  }

  return true;
}

} // namespace cm
