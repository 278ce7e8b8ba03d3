#include "cm/drawing/DrawingSnap.hpp"
#include <cmath>

namespace cm {

PixelPoint DrawingSnap::snapToKeyPoint(const PixelPoint& p, const CoordinateSystem& cs) const {
  if (!config_.enabled || candles_.empty() || !cs.isValid()) return p;

  DataPoint d = cs.pixelToData(p);
  double barIndex = std::round(d.index);
  if (barIndex < 0.0 || barIndex >= static_cast<double>(candles_.size())) return p;

  const CandleBar& bar = candles_[static_cast<std::size_t>(barIndex)];
  const double keyPrices[4] = {bar.high, bar.low, bar.open, bar.close};

  PixelPoint nearest = p;
  double minDist = config_.thresholdPx;
  bool found = false;
  for (double price : keyPrices) {
    PixelPoint k = cs.dataToPixel(barIndex, price);
    double dist = std::hypot(p.x - k.x, p.y - k.y);
    if (dist <= minDist) {
      minDist = dist;
      nearest = k;
      found = true;
    }
  }
  return found ? nearest : p;
}

} // namespace cm
