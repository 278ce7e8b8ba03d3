#include "cm/drawing/DrawingState.hpp"
#include <algorithm>

namespace cm {

void DrawingState::setDrawings(std::vector<Drawing> drawings) {
  drawings_ = std::move(drawings);
  notify();
}

void DrawingState::addDrawing(const Drawing& d) {
  drawings_.push_back(d);
  notify();
}

bool DrawingState::removeDrawing(DrawingId id) {
  auto it = std::remove_if(drawings_.begin(), drawings_.end(),
    [id](const Drawing& d) { return d.id == id; });
  if (it == drawings_.end()) return false;
  drawings_.erase(it, drawings_.end());
  notify();
  return true;
}

void DrawingState::clearDrawings() {
  drawings_.clear();
  notify();
}

bool DrawingState::updatePoint(DrawingId id, std::size_t pointIndex, const DataPoint& p) {
  Drawing* d = findMutable(id);
  if (!d || pointIndex >= d->points.size()) return false;
  d->points[pointIndex] = p;
  notify();
  return true;
}

bool DrawingState::replaceDrawing(const Drawing& d) {
  Drawing* existing = findMutable(d.id);
  if (!existing) return false;
  *existing = d;
  notify();
  return true;
}

const Drawing* DrawingState::find(DrawingId id) const {
  if (id == kInvalidId) return nullptr;
  for (const auto& d : drawings_) {
    if (d.id == id) return &d;
  }
  return nullptr;
}

Drawing* DrawingState::findMutable(DrawingId id) {
  if (id == kInvalidId) return nullptr;
  for (auto& d : drawings_) {
    if (d.id == id) return &d;
  }
  return nullptr;
}

DrawingId DrawingState::nextId() const {
  return nextFreeId(drawings_);
}

void DrawingState::setActiveTool(std::optional<DrawingType> tool) {
  activeTool_ = tool;
  if (!tool) {
    selectedId_ = kInvalidId;
    hoveredId_ = kInvalidId;
  }
  notify();
}

void DrawingState::appendCurrentPoint(const DataPoint& p) {
  currentPoints_.push_back(p);
  previewPoint_.reset();
  notify();
}

void DrawingState::setPreviewPoint(std::optional<DataPoint> p) {
  previewPoint_ = p;
  notify();
}

void DrawingState::clearCurrentDrawing() {
  if (currentPoints_.empty() && !previewPoint_) return;
  currentPoints_.clear();
  previewPoint_.reset();
  notify();
}

void DrawingState::setHoveredDrawingId(DrawingId id) {
  if (hoveredId_ == id) return;
  hoveredId_ = id;
  notify();
}

void DrawingState::setSelectedDrawingId(DrawingId id) {
  if (selectedId_ == id) return;
  selectedId_ = id;
  notify();
}

void DrawingState::enterEditMode(DrawingId id, int pointIndex) {
  editing_ = true;
  editingId_ = id;
  editingPointIndex_ = pointIndex;
  notify();
}

void DrawingState::exitEditMode() {
  if (!editing_) return;
  editing_ = false;
  editingId_ = kInvalidId;
  editingPointIndex_ = -1;
  notify();
}

std::uint32_t DrawingState::subscribe(Listener listener) {
  std::uint32_t token = nextToken_++;
  listeners_.push_back(Subscription{token, std::move(listener)});
  return token;
}

void DrawingState::unsubscribe(std::uint32_t token) {
  listeners_.erase(
    std::remove_if(listeners_.begin(), listeners_.end(),
      [token](const Subscription& s) { return s.token == token; }),
    listeners_.end());
}

void DrawingState::notify() {
  // Copy: a listener may unsubscribe while being notified
  auto snapshot = listeners_;
  for (auto& s : snapshot) {
    if (s.fn) s.fn();
  }
}

} // namespace cm
