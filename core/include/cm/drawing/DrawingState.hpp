#pragma once
#include "cm/drawing/Drawing.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace cm {

// In-memory annotation model: committed drawings plus transient
// creation/selection/edit state. No I/O; listeners are notified
// synchronously after every change.
class DrawingState {
public:
  using Listener = std::function<void()>;

  // ---- Committed drawings ----
  const std::vector<Drawing>& drawings() const { return drawings_; }
  // Replaces the whole set in one assignment.
  void setDrawings(std::vector<Drawing> drawings);
  void addDrawing(const Drawing& d);
  bool removeDrawing(DrawingId id);
  void clearDrawings();
  bool updatePoint(DrawingId id, std::size_t pointIndex, const DataPoint& p);
  // Replaces a drawing with the same id. Returns false if absent.
  bool replaceDrawing(const Drawing& d);

  // kInvalidId never matches.
  const Drawing* find(DrawingId id) const;
  // max(existing) + 1, see nextFreeId()
  DrawingId nextId() const;

  // ---- Tool ----
  const std::optional<DrawingType>& activeTool() const { return activeTool_; }
  // nullopt also clears selection and hover.
  void setActiveTool(std::optional<DrawingType> tool);

  // ---- Creation ----
  bool isDrawing() const { return !currentPoints_.empty(); }
  const std::vector<DataPoint>& currentPoints() const { return currentPoints_; }
  void appendCurrentPoint(const DataPoint& p);
  const std::optional<DataPoint>& previewPoint() const { return previewPoint_; }
  void setPreviewPoint(std::optional<DataPoint> p);
  void clearCurrentDrawing();

  // ---- Hover / selection ----
  DrawingId hoveredDrawingId() const { return hoveredId_; }
  void setHoveredDrawingId(DrawingId id);
  DrawingId selectedDrawingId() const { return selectedId_; }
  void setSelectedDrawingId(DrawingId id);
  bool hasSelection() const { return selectedId_ != kInvalidId; }

  // ---- Editing ----
  bool isEditing() const { return editing_; }
  DrawingId editingDrawingId() const { return editingId_; }
  int editingPointIndex() const { return editingPointIndex_; }
  void enterEditMode(DrawingId id, int pointIndex);
  void exitEditMode();

  // ---- Observers ----
  std::uint32_t subscribe(Listener listener);
  void unsubscribe(std::uint32_t token);

private:
  Drawing* findMutable(DrawingId id);
  void notify();

  std::vector<Drawing> drawings_;
  std::optional<DrawingType> activeTool_;
  std::vector<DataPoint> currentPoints_;
  std::optional<DataPoint> previewPoint_;
  DrawingId hoveredId_{kInvalidId};
  DrawingId selectedId_{kInvalidId};
  bool editing_{false};
  DrawingId editingId_{kInvalidId};
  int editingPointIndex_{-1};

  struct Subscription {
    std::uint32_t token;
    Listener fn;
  };
  std::vector<Subscription> listeners_;
  std::uint32_t nextToken_{1};
};

} // namespace cm
