#include "cm/drawing/DrawingGeometry.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>

namespace cm {
namespace geometry {

namespace {

const std::vector<DrawingType> kSinglePointCycle = {
  DrawingType::HorizontalRay
};

const std::vector<DrawingType> kTwoPointCycle = {
  DrawingType::Ray, DrawingType::Segment, DrawingType::PriceChannel,
  DrawingType::Fibonacci, DrawingType::GannAngle
};

constexpr double kFibLabelOffsetPx = 5.0;

void addClipped(DrawingPath& path, PixelPoint a, PixelPoint b, const PixelRect& plot,
                const std::string& color = std::string(), float widthBoost = 0.0f) {
  if (!clipSegment(a, b, plot)) return;
  PathLine line;
  line.a = a;
  line.b = b;
  line.color = color;
  line.widthBoost = widthBoost;
  path.lines.push_back(line);
}

void buildSegment(DrawingPath& path, const Drawing& d, const CoordinateSystem& cs) {
  addClipped(path, cs.dataToPixel(d.points[0]), cs.dataToPixel(d.points[1]), cs.plotBounds());
}

void buildRay(DrawingPath& path, const Drawing& d, const CoordinateSystem& cs) {
  const PixelRect& plot = cs.plotBounds();
  PixelPoint a = cs.dataToPixel(d.points[0]);
  PixelPoint b = cs.dataToPixel(d.points[1]);
  double dx = b.x - a.x;
  double dy = b.y - a.y;
  double len = std::sqrt(dx * dx + dy * dy);
  if (len <= 0.0) return; // no direction

  // Far enough past point 2 to leave the plot in any case
  double cx = (plot.left + plot.right) * 0.5;
  double cy = (plot.top + plot.bottom) * 0.5;
  double ext = std::hypot(b.x - cx, b.y - cy) + plot.width() + plot.height();

  PixelPoint far{b.x + dx / len * ext, b.y + dy / len * ext};
  addClipped(path, a, far, plot);
}

void buildHorizontalRay(DrawingPath& path, const Drawing& d, const CoordinateSystem& cs) {
  const PixelRect& plot = cs.plotBounds();
  PixelPoint a = cs.dataToPixel(d.points[0]);
  PixelPoint b{std::max(a.x, plot.right), a.y};
  addClipped(path, a, b, plot);
}

void buildPriceChannel(DrawingPath& path, const Drawing& d, const CoordinateSystem& cs) {
  const PixelRect& plot = cs.plotBounds();
  PixelPoint a = cs.dataToPixel(d.points[0]);
  PixelPoint b = cs.dataToPixel(d.points[1]);
  addClipped(path, a, b, plot);

  PixelPoint n;
  if (!channelNormal(a, b, n)) return;
  double off = channelOffset(d, cs);
  addClipped(path,
             PixelPoint{a.x + n.x * off, a.y + n.y * off},
             PixelPoint{b.x + n.x * off, b.y + n.y * off}, plot);
}

void buildFibonacci(DrawingPath& path, const Drawing& d, const CoordinateSystem& cs) {
  const DataPoint& p1 = d.points[0];
  const DataPoint& p2 = d.points[1];
  const FibonacciConfig* cfg = fibonacciConfig(d);
  static const FibonacciConfig defaults;
  const std::vector<double>& levels = cfg ? cfg->levels : defaults.levels;

  for (double level : levels) {
    double price = p1.price + level * (p2.price - p1.price);
    PixelPoint a = cs.dataToPixel(p1.index, price);
    PixelPoint b = cs.dataToPixel(p2.index, price);

    std::size_t before = path.lines.size();
    addClipped(path, a, b, cs.plotBounds());
    if (path.lines.size() == before) continue;

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f%%", level * 100.0);
    PathLabel label;
    label.position = PixelPoint{std::max(a.x, b.x) + kFibLabelOffsetPx, a.y};
    label.text = buf;
    path.labels.push_back(label);
  }
}

void buildGannAngle(DrawingPath& path, const Drawing& d, const CoordinateSystem& cs) {
  const PixelRect& plot = cs.plotBounds();
  const DataPoint& anchor = d.points[0];
  bool up = gannOpensUpward(anchor, d.points[1]);
  double sign = up ? 1.0 : -1.0;

  // Index delta expressed in price units so 1:1 is 45 degrees on screen
  double ratio = cs.priceUnitsPerIndexUnit();
  PixelPoint a = cs.dataToPixel(anchor);
  double boxRight = plot.right;
  double boxEdgeY = up ? plot.top : plot.bottom;

  const double inf = std::numeric_limits<double>::infinity();
  for (const GannRatio& gr : gannRatios()) {
    PixelPoint unit = cs.dataToPixel(anchor.index + gr.time,
                                     anchor.price + sign * gr.price * ratio);
    double dx = unit.x - a.x;
    double dy = unit.y - a.y;

    double tx = dx > 0.0 ? (boxRight - a.x) / dx : inf;
    double ty = dy != 0.0 ? (boxEdgeY - a.y) / dy : inf;
    double t = std::min(tx, ty);
    if (!(t > 0.0) || t == inf) continue;

    bool oneToOne = gr.time == 1.0 && gr.price == 1.0;
    addClipped(path, a, PixelPoint{a.x + dx * t, a.y + dy * t}, plot,
               oneToOne ? std::string() : std::string(gr.color),
               oneToOne ? 0.5f : 0.0f);
  }
}

} // namespace

// ---------- Per-type tables ----------

int requiredPoints(DrawingType type) {
  return type == DrawingType::HorizontalRay ? 1 : 2;
}

int maxPoints(DrawingType type) {
  return type == DrawingType::PriceChannel ? 3 : requiredPoints(type);
}

bool hasValidPointCount(const Drawing& d) {
  int n = static_cast<int>(d.points.size());
  return n >= requiredPoints(d.type) && n <= maxPoints(d.type);
}

DrawingConfig defaultConfig(DrawingType type) {
  switch (type) {
    case DrawingType::Fibonacci:    return FibonacciConfig{};
    case DrawingType::PriceChannel: return PriceChannelConfig{};
    default:                        return std::monostate{};
  }
}

bool configMatchesType(DrawingType type, const DrawingConfig& config) {
  switch (type) {
    case DrawingType::Fibonacci:    return std::holds_alternative<FibonacciConfig>(config);
    case DrawingType::PriceChannel: return std::holds_alternative<PriceChannelConfig>(config);
    default:                        return std::holds_alternative<std::monostate>(config);
  }
}

const std::vector<DrawingType>& typeCycle(DrawingType type) {
  return requiredPoints(type) == 1 ? kSinglePointCycle : kTwoPointCycle;
}

DrawingType nextTypeInCycle(DrawingType type) {
  const auto& cycle = typeCycle(type);
  auto it = std::find(cycle.begin(), cycle.end(), type);
  if (it == cycle.end()) return type;
  ++it;
  return it == cycle.end() ? cycle.front() : *it;
}

// ---------- Rendered path ----------

DrawingPath computePath(const Drawing& d, const CoordinateSystem& cs) {
  DrawingPath path;
  if (!cs.isValid()) return path;
  if (static_cast<int>(d.points.size()) < requiredPoints(d.type)) return path;

  switch (d.type) {
    case DrawingType::Segment:       buildSegment(path, d, cs); break;
    case DrawingType::Ray:           buildRay(path, d, cs); break;
    case DrawingType::HorizontalRay: buildHorizontalRay(path, d, cs); break;
    case DrawingType::PriceChannel:  buildPriceChannel(path, d, cs); break;
    case DrawingType::Fibonacci:     buildFibonacci(path, d, cs); break;
    case DrawingType::GannAngle:     buildGannAngle(path, d, cs); break;
  }
  return path;
}

std::vector<PixelPoint> controlPointPixels(const Drawing& d, const CoordinateSystem& cs) {
  std::vector<PixelPoint> out;
  out.reserve(d.points.size());
  for (std::size_t i = 0; i < d.points.size(); ++i) {
    if (d.type == DrawingType::GannAngle && i == 1) {
      out.push_back(cs.dataToPixel(gannOneToOnePoint(d.points[0], d.points[1], cs)));
    } else {
      out.push_back(cs.dataToPixel(d.points[i]));
    }
  }
  return out;
}

double distanceToDrawing(const Drawing& d, const CoordinateSystem& cs, const PixelPoint& p) {
  double best = -1.0;
  auto consider = [&best](double dist) {
    if (best < 0.0 || dist < best) best = dist;
  };

  DrawingPath path = computePath(d, cs);
  for (const auto& line : path.lines) {
    consider(pointToSegmentDistance(p, line.a, line.b));
  }
  if (!cs.isValid()) return best;
  for (const auto& h : controlPointPixels(d, cs)) {
    if (!cs.containsPixel(h)) continue;
    consider(std::hypot(p.x - h.x, p.y - h.y));
  }
  return best;
}

// ---------- Helpers ----------

double pointToSegmentDistance(const PixelPoint& p, const PixelPoint& a, const PixelPoint& b) {
  double dx = b.x - a.x;
  double dy = b.y - a.y;
  double len2 = dx * dx + dy * dy;
  if (len2 <= 0.0) return std::hypot(p.x - a.x, p.y - a.y);

  double t = ((p.x - a.x) * dx + (p.y - a.y) * dy) / len2;
  t = std::max(0.0, std::min(1.0, t));
  double qx = a.x + t * dx;
  double qy = a.y + t * dy;
  return std::hypot(p.x - qx, p.y - qy);
}

bool clipSegment(PixelPoint& a, PixelPoint& b, const PixelRect& rect) {
  double dx = b.x - a.x;
  double dy = b.y - a.y;
  double t0 = 0.0, t1 = 1.0;

  const double p[4] = {-dx, dx, -dy, dy};
  const double q[4] = {a.x - rect.left, rect.right - a.x,
                       a.y - rect.top, rect.bottom - a.y};

  for (int i = 0; i < 4; ++i) {
    if (p[i] == 0.0) {
      if (q[i] < 0.0) return false; // parallel and outside
      continue;
    }
    double r = q[i] / p[i];
    if (p[i] < 0.0) {
      if (r > t1) return false;
      if (r > t0) t0 = r;
    } else {
      if (r < t0) return false;
      if (r < t1) t1 = r;
    }
  }

  PixelPoint na{a.x + t0 * dx, a.y + t0 * dy};
  PixelPoint nb{a.x + t1 * dx, a.y + t1 * dy};
  a = na;
  b = nb;
  return true;
}

bool channelNormal(const PixelPoint& p1, const PixelPoint& p2, PixelPoint& normal) {
  double dx = p2.x - p1.x;
  double dy = p2.y - p1.y;
  double len = std::sqrt(dx * dx + dy * dy);
  if (len <= 0.0) return false;
  normal.x = dy / len;
  normal.y = -dx / len;
  return true;
}

PixelPoint channelWidthHandle(const PixelPoint& p1, const PixelPoint& p2, double width) {
  PixelPoint mid{(p1.x + p2.x) * 0.5, (p1.y + p2.y) * 0.5};
  PixelPoint n;
  if (!channelNormal(p1, p2, n)) return mid;
  return PixelPoint{mid.x + n.x * width, mid.y + n.y * width};
}

double channelOffset(const Drawing& d, const CoordinateSystem& cs) {
  if (d.points.size() >= 3 && cs.isValid()) {
    PixelPoint a = cs.dataToPixel(d.points[0]);
    PixelPoint b = cs.dataToPixel(d.points[1]);
    PixelPoint c = cs.dataToPixel(d.points[2]);
    PixelPoint n;
    if (channelNormal(a, b, n)) {
      double mx = (a.x + b.x) * 0.5;
      double my = (a.y + b.y) * 0.5;
      return (c.x - mx) * n.x + (c.y - my) * n.y;
    }
  }
  const PriceChannelConfig* cfg = priceChannelConfig(d);
  return cfg ? cfg->channelWidth : PriceChannelConfig{}.channelWidth;
}

PixelPoint constrainToChannelNormal(const PixelPoint& p1, const PixelPoint& p2,
                                    const PixelPoint& cursor) {
  PixelPoint mid{(p1.x + p2.x) * 0.5, (p1.y + p2.y) * 0.5};
  PixelPoint n;
  if (!channelNormal(p1, p2, n)) return mid;
  double off = (cursor.x - mid.x) * n.x + (cursor.y - mid.y) * n.y;
  return PixelPoint{mid.x + n.x * off, mid.y + n.y * off};
}

bool gannOpensUpward(const DataPoint& anchor, const DataPoint& second) {
  return second.price >= anchor.price;
}

DataPoint gannOneToOnePoint(const DataPoint& anchor, const DataPoint& second,
                            const CoordinateSystem& cs) {
  double sign = gannOpensUpward(anchor, second) ? 1.0 : -1.0;
  double di = second.index - anchor.index;
  return DataPoint{second.index, anchor.price + sign * di * cs.priceUnitsPerIndexUnit()};
}

const std::vector<GannRatio>& gannRatios() {
  static const std::vector<GannRatio> ratios = {
    {1.0, 0.0, "#999999"}, // horizontal edge
    {8.0, 1.0, "#9370DB"},
    {4.0, 1.0, "#4169E1"},
    {3.0, 1.0, "#00CED1"},
    {2.0, 1.0, "#32CD32"},
    {1.0, 1.0, "#FFD700"},
    {1.0, 2.0, "#FFA500"},
    {1.0, 3.0, "#FF6347"},
    {1.0, 4.0, "#FF4500"},
    {1.0, 8.0, "#FF0000"},
    {0.0, 1.0, "#999999"}  // vertical edge
  };
  return ratios;
}

} // namespace geometry
} // namespace cm
