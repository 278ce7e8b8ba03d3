#pragma once

namespace cm {

// Data space: bar index (x) and price (y).
struct DataPoint {
  double index{0};
  double price{0};
};

// Pixel space: origin at the canvas top-left, y grows downward.
struct PixelPoint {
  double x{0};
  double y{0};
};

struct PixelRect {
  double left{0}, top{0}, right{0}, bottom{0};

  double width() const { return right - left; }
  double height() const { return bottom - top; }
  bool contains(const PixelPoint& p) const {
    return p.x >= left && p.x <= right && p.y >= top && p.y <= bottom;
  }
};

struct CanvasSize {
  int width{0};
  int height{0};
};

struct IndexRange {
  double min{0}, max{1};
};

struct PriceRange {
  double min{0}, max{1};
};

inline bool operator==(const DataPoint& a, const DataPoint& b) {
  return a.index == b.index && a.price == b.price;
}
inline bool operator!=(const DataPoint& a, const DataPoint& b) { return !(a == b); }

} // namespace cm
