#pragma once
#include "cm/geometry/Primitives.hpp"

namespace cm {

// Linear mapping between data space (bar index, price) and canvas pixels.
// The plot rectangle defaults to the whole canvas; hosts with axes or
// margins narrow it with setPlotBounds().
class CoordinateSystem {
public:
  // Recompute on every pan/zoom/resize of the host chart.
  void updateViewport(const IndexRange& visibleIndexRange,
                      const PriceRange& priceRange,
                      const CanvasSize& canvasSize);
  void setPlotBounds(const PixelRect& bounds);

  PixelPoint dataToPixel(double index, double price) const;
  PixelPoint dataToPixel(const DataPoint& p) const { return dataToPixel(p.index, p.price); }
  DataPoint pixelToData(double x, double y) const;
  DataPoint pixelToData(const PixelPoint& p) const { return pixelToData(p.x, p.y); }

  // Pan/zoom in pixel terms (host gestures)
  void pan(double dxPixels, double dyPixels);
  void zoom(double factor, double pivotPx, double pivotPy);

  double pixelsPerIndex() const;
  double pixelsPerPrice() const;

  // Price delta that spans the same pixel length as one bar. Changes with
  // every pan/zoom/resize; Gann geometry re-reads it per frame.
  double priceUnitsPerIndexUnit() const;

  // False for an empty canvas or a degenerate index/price range.
  bool isValid() const;
  bool containsPixel(const PixelPoint& p) const { return plot_.contains(p); }

  const IndexRange& indexRange() const { return index_; }
  const PriceRange& priceRange() const { return price_; }
  const CanvasSize& canvasSize() const { return canvas_; }
  const PixelRect& plotBounds() const { return plot_; }

private:
  IndexRange index_{0, 1};
  PriceRange price_{0, 1};
  CanvasSize canvas_{800, 600};
  PixelRect plot_{0, 0, 800, 600};
  bool customBounds_{false};
};

} // namespace cm
