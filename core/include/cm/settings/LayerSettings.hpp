#pragma once
#include "cm/layers/CrosshairLayer.hpp"
#include "cm/layers/DrawingLayer.hpp"
#include <string>

namespace cm {

// Serializable overlay configuration.
struct LayerSettings {
  std::string version{"1.0"};
  std::string themeName{"dark"};  // "dark" or "light"
  DrawingLayerConfig drawing;
  CrosshairLayerConfig crosshair;
};

// Serialize LayerSettings to a JSON string.
std::string serializeLayerSettings(const LayerSettings& settings);

// Deserialize a JSON string into LayerSettings. Returns false on error.
// Missing or wrongly-typed keys keep the values already in `out`.
bool deserializeLayerSettings(const std::string& json, LayerSettings& out);

} // namespace cm
