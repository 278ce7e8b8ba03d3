#pragma once
#include "cm/layers/BaseLayer.hpp"
#include "cm/style/Theme.hpp"
#include <string>

namespace cm {

struct CrosshairLayerConfig {
  float lineWidth{1.0f};
  bool dashed{true};
  bool showLabels{true};
  bool snapToBar{true};   // vertical line on whole bar indexes
  int priceDecimals{2};
};

// Crosshair overlay: H-line, V-line, price label, bar-index label.
// Observes pointer moves but never consumes them. Suppressed while the
// host is in drawing mode.
class CrosshairLayer : public BaseLayer {
public:
  explicit CrosshairLayer(int zIndex = 200);

  void setConfig(const CrosshairLayerConfig& cfg) { config_ = cfg; }
  const CrosshairLayerConfig& config() const { return config_; }

  const char* name() const override { return "crosshair"; }
  void render(LayerFrame& out) override;
  bool handleEvent(const PointerEvent& e) override;
  void dispose() override;

  void setTheme(const Theme& theme);
  void setSuppressed(bool suppressed) { suppressed_ = suppressed; }
  bool suppressed() const { return suppressed_; }

  // Cursor leaves the chart
  void hide() { visible_ = false; }
  bool visible() const { return visible_ && !suppressed_; }

  // Data position under the crosshair (valid when visible()).
  const DataPoint& cursorData() const { return cursorData_; }

private:
  CrosshairLayerConfig config_;
  std::string lineColor_;
  std::string textColor_;
  std::string labelBackground_;

  bool visible_{false};
  bool suppressed_{false};
  PixelPoint cursor_;
  DataPoint cursorData_;
};

} // namespace cm
