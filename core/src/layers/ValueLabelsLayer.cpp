#include "cm/layers/ValueLabelsLayer.hpp"
#include <cstdio>

namespace cm {

ValueLabelsLayer::ValueLabelsLayer(int zIndex)
  : BaseLayer(zIndex), background_(darkTheme().labelBackgroundColor) {}

void ValueLabelsLayer::updateValues(const std::map<std::string, double>& values) {
  for (auto& label : labels_) {
    auto it = values.find(label.name);
    if (it != values.end()) label.value = it->second;
  }
}

std::string ValueLabelsLayer::labelText(const ValueLabel& label) const {
  if (!label.value) return label.name;
  char buf[64];
  std::snprintf(buf, sizeof(buf), " %.*f", config_.decimals, *label.value);
  return label.name + buf;
}

PixelRect ValueLabelsLayer::labelRect(std::size_t i, const PixelRect& plot) const {
  PixelRect r;
  r.left = plot.left + config_.leftMargin;
  r.top = plot.top + config_.topMargin + static_cast<double>(i) * config_.rowHeight;
  r.right = r.left + static_cast<double>(labelText(labels_[i]).size()) * config_.charWidth;
  r.bottom = r.top + config_.rowHeight;
  return r;
}

void ValueLabelsLayer::render(LayerFrame& out) {
  const CoordinateSystem* cs = validCoordinates();
  if (!cs) return;
  const PixelRect& plot = cs->plotBounds();

  for (std::size_t i = 0; i < labels_.size(); ++i) {
    PixelRect r = labelRect(i, plot);
    if (r.bottom > plot.bottom) break; // no room for more rows

    TextPrimitive tp;
    tp.position = PixelPoint{r.left, (r.top + r.bottom) * 0.5};
    tp.text = labelText(labels_[i]);
    tp.color = labels_[i].color;
    tp.background = background_;
    out.texts.push_back(tp);
  }
}

int ValueLabelsLayer::hitTest(const PixelPoint& p) const {
  const CoordinateSystem* cs = validCoordinates();
  if (!cs) return -1;
  const PixelRect& plot = cs->plotBounds();

  for (std::size_t i = 0; i < labels_.size(); ++i) {
    PixelRect r = labelRect(i, plot);
    if (r.bottom > plot.bottom) break;
    if (r.contains(p)) return static_cast<int>(i);
  }
  return -1;
}

bool ValueLabelsLayer::handleEvent(const PointerEvent& e) {
  if (e.phase != PointerPhase::Down) return false;
  int idx = hitTest(e.position);
  if (idx < 0) return false;
  if (clickListener_) clickListener_(labels_[static_cast<std::size_t>(idx)]);
  return true;
}

} // namespace cm
