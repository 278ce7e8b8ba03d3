#pragma once
#include "cm/drawing/Drawing.hpp"
#include "cm/viewport/CoordinateSystem.hpp"
#include <string>
#include <vector>

namespace cm {
namespace geometry {

// ---------- Per-type tables ----------

// Points collected during creation (price channel: 2, width handle added on commit).
int requiredPoints(DrawingType type);
// Upper bound for a stored drawing (price channel: 3).
int maxPoints(DrawingType type);
bool hasValidPointCount(const Drawing& d);

DrawingConfig defaultConfig(DrawingType type);
bool configMatchesType(DrawingType type, const DrawingConfig& config);

// Types sharing a required point count, in switch order.
const std::vector<DrawingType>& typeCycle(DrawingType type);
// Next entry in the same group; returns `type` itself for a group of one.
DrawingType nextTypeInCycle(DrawingType type);

// ---------- Rendered path ----------

struct PathLine {
  PixelPoint a, b;
  std::string color;     // empty = drawing color
  float widthBoost{0.0f};
};

struct PathLabel {
  PixelPoint position;   // left/middle anchor
  std::string text;
};

struct DrawingPath {
  std::vector<PathLine> lines;   // clipped to the plot bounds
  std::vector<PathLabel> labels;
};

// Path for a committed drawing or an in-progress one (points may include
// the preview point). Returns an empty path when there are too few points
// or the coordinate system is invalid.
DrawingPath computePath(const Drawing& d, const CoordinateSystem& cs);

// Handle positions for the drawing's control points, in pixels. The Gann
// second handle is shown on the current 1:1 line.
std::vector<PixelPoint> controlPointPixels(const Drawing& d, const CoordinateSystem& cs);

// Smallest pixel distance from `p` to the drawing's path or handles.
// Returns a negative value when nothing of the drawing is on screen.
double distanceToDrawing(const Drawing& d, const CoordinateSystem& cs, const PixelPoint& p);

// ---------- Helpers ----------

double pointToSegmentDistance(const PixelPoint& p, const PixelPoint& a, const PixelPoint& b);

// Liang-Barsky: clips segment a-b in place. Returns false if fully outside.
bool clipSegment(PixelPoint& a, PixelPoint& b, const PixelRect& rect);

// Unit normal of the baseline p1->p2, pointing to screen-up for a
// left-to-right baseline. Returns false for a zero-length baseline.
bool channelNormal(const PixelPoint& p1, const PixelPoint& p2, PixelPoint& normal);

// Baseline midpoint pushed `width` pixels along the normal.
PixelPoint channelWidthHandle(const PixelPoint& p1, const PixelPoint& p2, double width);

// Signed pixel offset of the parallel line (third point if present,
// otherwise the configured width).
double channelOffset(const Drawing& d, const CoordinateSystem& cs);

// Projects `cursor` onto the normal through the baseline midpoint.
PixelPoint constrainToChannelNormal(const PixelPoint& p1, const PixelPoint& p2,
                                    const PixelPoint& cursor);

// The Gann fan opens upward when the second price is not below the anchor.
bool gannOpensUpward(const DataPoint& anchor, const DataPoint& second);

// Point on the current 1:1 line at `second`'s bar index.
DataPoint gannOneToOnePoint(const DataPoint& anchor, const DataPoint& second,
                            const CoordinateSystem& cs);

// Time:price ratios from the horizontal edge to the vertical edge.
struct GannRatio {
  double time;
  double price;
  const char* color;
};
const std::vector<GannRatio>& gannRatios();

} // namespace geometry
} // namespace cm
