#include "cm/viewport/CoordinateSystem.hpp"

namespace cm {

void CoordinateSystem::updateViewport(const IndexRange& visibleIndexRange,
                                      const PriceRange& priceRange,
                                      const CanvasSize& canvasSize) {
  index_ = visibleIndexRange;
  price_ = priceRange;
  canvas_ = canvasSize;
  if (!customBounds_) {
    plot_ = PixelRect{0.0, 0.0,
                      static_cast<double>(canvas_.width),
                      static_cast<double>(canvas_.height)};
  }
}

void CoordinateSystem::setPlotBounds(const PixelRect& bounds) {
  plot_ = bounds;
  customBounds_ = true;
}

PixelPoint CoordinateSystem::dataToPixel(double index, double price) const {
  double tx = (index - index_.min) / (index_.max - index_.min);
  double ty = (price - price_.min) / (price_.max - price_.min);

  PixelPoint p;
  p.x = plot_.left + tx * plot_.width();
  p.y = plot_.bottom - ty * plot_.height(); // Y flipped
  return p;
}

DataPoint CoordinateSystem::pixelToData(double x, double y) const {
  double tx = (x - plot_.left) / plot_.width();
  double ty = (plot_.bottom - y) / plot_.height();

  DataPoint d;
  d.index = index_.min + tx * (index_.max - index_.min);
  d.price = price_.min + ty * (price_.max - price_.min);
  return d;
}

void CoordinateSystem::pan(double dxPixels, double dyPixels) {
  if (!isValid()) return;

  double dIndex = dxPixels / pixelsPerIndex();
  double dPrice = -dyPixels / pixelsPerPrice(); // Y flipped

  // Dragging right shows earlier bars
  index_.min -= dIndex;
  index_.max -= dIndex;
  price_.min -= dPrice;
  price_.max -= dPrice;
}

void CoordinateSystem::zoom(double factor, double pivotPx, double pivotPy) {
  if (!isValid()) return;

  DataPoint pivot = pixelToData(pivotPx, pivotPy);

  // factor > 0 = zoom in = smaller range
  double scale = 1.0 / (1.0 + factor);

  index_.min = pivot.index + (index_.min - pivot.index) * scale;
  index_.max = pivot.index + (index_.max - pivot.index) * scale;
  price_.min = pivot.price + (price_.min - pivot.price) * scale;
  price_.max = pivot.price + (price_.max - pivot.price) * scale;
}

double CoordinateSystem::pixelsPerIndex() const {
  double dataW = index_.max - index_.min;
  if (dataW <= 0.0) return 0.0;
  return plot_.width() / dataW;
}

double CoordinateSystem::pixelsPerPrice() const {
  double dataH = price_.max - price_.min;
  if (dataH <= 0.0) return 0.0;
  return plot_.height() / dataH;
}

double CoordinateSystem::priceUnitsPerIndexUnit() const {
  double ppp = pixelsPerPrice();
  if (ppp <= 0.0) return 0.0;
  return pixelsPerIndex() / ppp;
}

bool CoordinateSystem::isValid() const {
  return canvas_.width > 0 && canvas_.height > 0 &&
         plot_.width() > 0.0 && plot_.height() > 0.0 &&
         index_.max > index_.min && price_.max > price_.min;
}

} // namespace cm
