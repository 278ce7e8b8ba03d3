#include "cm/layers/CrosshairLayer.hpp"
#include <cmath>
#include <cstdio>

namespace cm {

CrosshairLayer::CrosshairLayer(int zIndex)
  : BaseLayer(zIndex) {
  setTheme(darkTheme());
}

void CrosshairLayer::setTheme(const Theme& theme) {
  lineColor_ = theme.crosshairColor;
  textColor_ = theme.labelTextColor;
  labelBackground_ = theme.labelBackgroundColor;
}

bool CrosshairLayer::handleEvent(const PointerEvent& e) {
  const CoordinateSystem* cs = validCoordinates();
  if (!cs) return false;

  if (!cs->containsPixel(e.position)) {
    if (e.phase != PointerPhase::Up) visible_ = false;
    return false;
  }

  cursorData_ = cs->pixelToData(e.position);
  cursor_ = e.position;
  if (config_.snapToBar) {
    cursorData_.index = std::round(cursorData_.index);
    cursor_.x = cs->dataToPixel(cursorData_.index, cursorData_.price).x;
  }
  visible_ = true;
  return false;
}

void CrosshairLayer::render(LayerFrame& out) {
  const CoordinateSystem* cs = validCoordinates();
  if (!cs || !visible()) return;
  const PixelRect& plot = cs->plotBounds();
  if (!plot.contains(cursor_)) return;

  // Horizontal line spanning the plot at cursor Y
  LinePrimitive h;
  h.a = PixelPoint{plot.left, cursor_.y};
  h.b = PixelPoint{plot.right, cursor_.y};
  h.color = lineColor_;
  h.width = config_.lineWidth;
  h.dashed = config_.dashed;
  out.lines.push_back(h);

  // Vertical line spanning the plot at cursor X
  LinePrimitive v = h;
  v.a = PixelPoint{cursor_.x, plot.top};
  v.b = PixelPoint{cursor_.x, plot.bottom};
  out.lines.push_back(v);

  if (!config_.showLabels) return;

  // Price label at the right edge
  char priceBuf[32];
  std::snprintf(priceBuf, sizeof(priceBuf), "%.*f", config_.priceDecimals, cursorData_.price);
  TextPrimitive price;
  price.position = PixelPoint{plot.right, cursor_.y};
  price.text = priceBuf;
  price.color = textColor_;
  price.background = labelBackground_;
  out.texts.push_back(price);

  // Bar index label at the bottom edge
  char indexBuf[32];
  std::snprintf(indexBuf, sizeof(indexBuf), "%.0f", cursorData_.index);
  TextPrimitive index;
  index.position = PixelPoint{cursor_.x, plot.bottom};
  index.text = indexBuf;
  index.color = textColor_;
  index.background = labelBackground_;
  out.texts.push_back(index);
}

void CrosshairLayer::dispose() {
  visible_ = false;
  BaseLayer::dispose();
}

} // namespace cm
