#include "cm/drawing/Drawing.hpp"
#include <limits>
#include <set>

namespace cm {

bool operator==(const Drawing& a, const Drawing& b) {
  return a.id == b.id && a.type == b.type && a.points == b.points &&
         a.config == b.config && a.color == b.color &&
         a.lineWidth == b.lineWidth && a.visible == b.visible &&
         a.locked == b.locked;
}

namespace {

DrawingId freeIdIn(const std::set<DrawingId>& used) {
  if (used.empty()) return 1;
  DrawingId top = *used.rbegin();
  if (top < std::numeric_limits<DrawingId>::max()) return top + 1;

  // Range exhausted at the top; walk the sorted ids for the first gap
  DrawingId candidate = 1;
  for (DrawingId id : used) {
    if (id < candidate) continue;
    if (id != candidate) break;
    ++candidate;
  }
  return candidate;
}

} // namespace

DrawingId nextFreeId(const std::vector<Drawing>& drawings) {
  std::set<DrawingId> used;
  for (const auto& d : drawings) {
    if (d.id != kInvalidId) used.insert(d.id);
  }
  return freeIdIn(used);
}

std::size_t repairDrawingIds(std::vector<Drawing>& drawings) {
  std::set<DrawingId> used;
  std::vector<std::size_t> pending;
  for (std::size_t i = 0; i < drawings.size(); ++i) {
    DrawingId id = drawings[i].id;
    if (id == kInvalidId || !used.insert(id).second) pending.push_back(i);
  }
  for (std::size_t i : pending) {
    DrawingId fresh = freeIdIn(used);
    drawings[i].id = fresh;
    used.insert(fresh);
  }
  return pending.size();
}

const char* drawingTypeName(DrawingType type) {
  switch (type) {
    case DrawingType::Ray:           return "ray";
    case DrawingType::HorizontalRay: return "horizontal-ray";
    case DrawingType::Segment:       return "segment";
    case DrawingType::PriceChannel:  return "price-channel";
    case DrawingType::Fibonacci:     return "fibonacci";
    case DrawingType::GannAngle:     return "gann-angle";
  }
  return "unknown";
}

bool parseDrawingType(const std::string& name, DrawingType& out) {
  static const DrawingType all[] = {
    DrawingType::Ray, DrawingType::HorizontalRay, DrawingType::Segment,
    DrawingType::PriceChannel, DrawingType::Fibonacci, DrawingType::GannAngle
  };
  for (DrawingType t : all) {
    if (name == drawingTypeName(t)) {
      out = t;
      return true;
    }
  }
  return false;
}

const FibonacciConfig* fibonacciConfig(const Drawing& d) {
  return std::get_if<FibonacciConfig>(&d.config);
}

const PriceChannelConfig* priceChannelConfig(const Drawing& d) {
  return std::get_if<PriceChannelConfig>(&d.config);
}

} // namespace cm
