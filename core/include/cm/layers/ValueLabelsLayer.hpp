#pragma once
#include "cm/layers/BaseLayer.hpp"
#include "cm/style/Theme.hpp"
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cm {

// One named series value (e.g. "MA5") shown in the top-left label stack.
struct ValueLabel {
  std::string name;
  std::string color;
  std::optional<double> value;
};

struct ValueLabelsLayerConfig {
  double leftMargin{8.0};   // from the plot's left edge
  double topMargin{6.0};
  double rowHeight{16.0};
  double charWidth{7.0};    // approximate advance for hit boxes
  int decimals{2};
};

// Interactive series labels. Reports clicks on a label to the host.
class ValueLabelsLayer : public BaseLayer {
public:
  using ClickListener = std::function<void(const ValueLabel&)>;

  explicit ValueLabelsLayer(int zIndex = 100);

  void setConfig(const ValueLabelsLayerConfig& cfg) { config_ = cfg; }
  const ValueLabelsLayerConfig& config() const { return config_; }

  const char* name() const override { return "value-labels"; }
  void render(LayerFrame& out) override;
  bool handleEvent(const PointerEvent& e) override;

  void setLabels(std::vector<ValueLabel> labels) { labels_ = std::move(labels); }
  const std::vector<ValueLabel>& labels() const { return labels_; }
  // Updates values by label name; unknown names are ignored.
  void updateValues(const std::map<std::string, double>& values);

  void setTheme(const Theme& theme) { background_ = theme.labelBackgroundColor; }
  void setClickListener(ClickListener listener) { clickListener_ = std::move(listener); }

  // Index of the label under `p`, or -1.
  int hitTest(const PixelPoint& p) const;

  // Rendered text for a label ("MA5 12.34", or the name alone).
  std::string labelText(const ValueLabel& label) const;

private:
  PixelRect labelRect(std::size_t i, const PixelRect& plot) const;

  ValueLabelsLayerConfig config_;
  std::vector<ValueLabel> labels_;
  std::string background_;
  ClickListener clickListener_;
};

} // namespace cm
