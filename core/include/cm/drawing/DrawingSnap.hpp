#pragma once
#include "cm/geometry/Primitives.hpp"
#include "cm/viewport/CoordinateSystem.hpp"
#include <vector>

namespace cm {

// One bar of the host's candle series; vector position = bar index.
struct CandleBar {
  double open{0}, high{0}, low{0}, close{0};
};

struct SnapConfig {
  bool enabled{true};
  double thresholdPx{20.0};
};

// Pulls pointer positions onto the open/high/low/close of the bar
// under the cursor when one is close enough.
class DrawingSnap {
public:
  void setConfig(const SnapConfig& cfg) { config_ = cfg; }
  const SnapConfig& config() const { return config_; }

  void setCandles(std::vector<CandleBar> candles) { candles_ = std::move(candles); }
  const std::vector<CandleBar>& candles() const { return candles_; }

  // Returns the nearest key point within the threshold, else `p` unchanged.
  PixelPoint snapToKeyPoint(const PixelPoint& p, const CoordinateSystem& cs) const;

private:
  SnapConfig config_;
  std::vector<CandleBar> candles_;
};

} // namespace cm
