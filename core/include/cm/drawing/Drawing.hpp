#pragma once
#include "cm/geometry/Primitives.hpp"
#include "cm/ids/Id.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace cm {

// Annotation types. Names on disk: see drawingTypeName().
enum class DrawingType : std::uint8_t {
  Ray = 1,           // point 1 through point 2, extended past point 2
  HorizontalRay = 2, // single price, extended toward later bars
  Segment = 3,       // bounded line
  PriceChannel = 4,  // baseline + parallel line; optional width handle
  Fibonacci = 5,     // retracement levels between two prices
  GannAngle = 6      // angle fan anchored at point 1
};

struct FibonacciConfig {
  std::vector<double> levels{0.0, 0.236, 0.382, 0.5, 0.618, 0.786, 1.0};
};

struct PriceChannelConfig {
  double channelWidth{50.0}; // pixels at creation time
};

inline bool operator==(const FibonacciConfig& a, const FibonacciConfig& b) {
  return a.levels == b.levels;
}
inline bool operator!=(const FibonacciConfig& a, const FibonacciConfig& b) { return !(a == b); }
inline bool operator==(const PriceChannelConfig& a, const PriceChannelConfig& b) {
  return a.channelWidth == b.channelWidth;
}
inline bool operator!=(const PriceChannelConfig& a, const PriceChannelConfig& b) { return !(a == b); }

// Per-type settings. The alternative always matches Drawing::type;
// types without settings carry std::monostate.
using DrawingConfig = std::variant<std::monostate, FibonacciConfig, PriceChannelConfig>;

struct Drawing {
  DrawingId id{kInvalidId};
  DrawingType type{DrawingType::Segment};
  std::vector<DataPoint> points;
  DrawingConfig config;

  std::string color{"#FFFFFF"}; // re-resolved from the theme on load
  float lineWidth{1.0f};
  bool visible{true};
  bool locked{false}; // selectable, points not draggable
};

bool operator==(const Drawing& a, const Drawing& b);
inline bool operator!=(const Drawing& a, const Drawing& b) { return !(a == b); }

const char* drawingTypeName(DrawingType type);
// Returns false for unknown names.
bool parseDrawingType(const std::string& name, DrawingType& out);

// Smallest id above every id in use; once the top of the range is taken,
// the smallest unused id instead. Never kInvalidId.
DrawingId nextFreeId(const std::vector<Drawing>& drawings);
// Gives a fresh id to every drawing whose id is kInvalidId or repeats an
// earlier one. Stored ids are all reserved before any is handed out.
// Returns the number of drawings renumbered.
std::size_t repairDrawingIds(std::vector<Drawing>& drawings);

const FibonacciConfig* fibonacciConfig(const Drawing& d);
const PriceChannelConfig* priceChannelConfig(const Drawing& d);

} // namespace cm
