#pragma once
#include "cm/layers/CrosshairLayer.hpp"
#include "cm/layers/DrawingLayer.hpp"
#include "cm/layers/ValueLabelsLayer.hpp"
#include "cm/settings/LayerSettings.hpp"
#include "cm/viewport/CoordinateSystem.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cm {

// Composes the overlay layers over one chart surface. Owns the shared
// CoordinateSystem, renders layers bottom-up, dispatches input top-down
// (first layer that consumes an event stops dispatch), and exposes the
// drawing controls to the hosting chart.
class ChartLayerManager {
public:
  explicit ChartLayerManager(KeyValueStore& store);
  ~ChartLayerManager();

  ChartLayerManager(const ChartLayerManager&) = delete;
  ChartLayerManager& operator=(const ChartLayerManager&) = delete;

  // ---- Viewport ----
  void updateViewport(const IndexRange& visibleIndexRange,
                      const PriceRange& priceRange,
                      const CanvasSize& canvasSize);
  void setPlotBounds(const PixelRect& bounds);
  const CoordinateSystem& coordinateSystem() const { return cs_; }

  // ---- Composition ----
  // Host-provided layers join the z-order. Returns the mounted layer.
  BaseLayer* addLayer(std::unique_ptr<BaseLayer> layer);
  bool removeLayer(const BaseLayer* layer);
  std::size_t layerCount() const { return layers_.size(); }

  // One frame per layer, ascending z.
  std::vector<LayerFrame> render();

  // Returns true if some layer consumed the event.
  bool handleEvent(const PointerEvent& e);
  bool handleKey(const KeyEvent& e);

  void applySettings(const LayerSettings& settings);
  LayerSettings currentSettings() const;

  // ---- Drawing facade ----
  void setDrawingMode(bool enabled);
  bool drawingMode() const { return drawing_->drawingMode(); }
  void setActiveTool(std::optional<DrawingType> tool) { drawing_->setActiveTool(tool); }
  DrawingId getSelectedDrawingId() const { return drawing_->getSelectedDrawingId(); }
  bool canUndo() const { return drawing_->canUndo(); }
  bool canRedo() const { return drawing_->canRedo(); }
  void removeSelectedDrawing() { drawing_->removeSelectedDrawing(); }
  void switchSelectedDrawingType() { drawing_->switchSelectedDrawingType(); }
  void undo() { drawing_->undo(); }
  void redo() { drawing_->redo(); }
  void clearAll() { drawing_->clearAll(); }
  void loadDrawings(std::vector<Drawing> drawings) { drawing_->loadDrawings(std::move(drawings)); }
  void setInstrument(const std::string& instrumentCode);
  void refreshDrawings(const std::string& instrumentCode) { drawing_->refreshDrawings(instrumentCode); }
  void setTheme(const std::string& themeName);

  DrawingLayer& drawingLayer() { return *drawing_; }
  CrosshairLayer& crosshairLayer() { return *crosshair_; }
  ValueLabelsLayer& valueLabelsLayer() { return *labels_; }

  void dispose();

private:
  void sortLayers();

  CoordinateSystem cs_;
  std::vector<std::unique_ptr<BaseLayer>> layers_; // ascending z
  DrawingLayer* drawing_{nullptr};
  CrosshairLayer* crosshair_{nullptr};
  ValueLabelsLayer* labels_{nullptr};
  bool disposed_{false};
};

} // namespace cm
