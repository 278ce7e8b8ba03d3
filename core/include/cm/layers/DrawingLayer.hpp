#pragma once
#include "cm/drawing/DrawingHistory.hpp"
#include "cm/drawing/DrawingSnap.hpp"
#include "cm/drawing/DrawingState.hpp"
#include "cm/layers/BaseLayer.hpp"
#include "cm/persistence/DrawingRepository.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace cm {

struct DrawingLayerConfig {
  double hitTolerancePx{6.0};           // selection/hover distance to a path
  double controlPointTolerancePx{10.0}; // handle radius 3 + border 2 + 5
  double snapThresholdPx{20.0};
  bool snapToCandles{true};
  bool roundToBar{true};                // whole bar indexes from pointer input
  std::size_t maxHistory{50};
  float lineWidth{1.0f};
  float selectedWidthBoost{1.0f};
  float hoverHandleRadius{2.5f};
  float editHandleRadius{3.0f};
  float markerRadius{1.5f};             // in-progress points
};

// What the host toolbar mirrors. Emitted only when a field changes.
struct ToolbarState {
  bool hasSelection{false};
  bool canUndo{false};
  bool canRedo{false};
  std::optional<DrawingType> activeTool;
  bool drawingMode{false};

  bool operator==(const ToolbarState& o) const {
    return hasSelection == o.hasSelection && canUndo == o.canUndo &&
           canRedo == o.canRedo && activeTool == o.activeTool &&
           drawingMode == o.drawingMode;
  }
  bool operator!=(const ToolbarState& o) const { return !(*this == o); }
};

// Annotation controller: pointer/key handling, hit-testing, undo and
// persistence for the drawings of one instrument at a time.
//
// States: idle -> creating (tool armed, collecting points) -> commit -> idle
//         idle/hover <-> selected (hit-test, no tool) -> editing (handle drag)
class DrawingLayer : public BaseLayer {
public:
  using ToolbarListener = std::function<void(const ToolbarState&)>;

  explicit DrawingLayer(KeyValueStore& store, int zIndex = 150);
  ~DrawingLayer() override;

  void setConfig(const DrawingLayerConfig& cfg);
  const DrawingLayerConfig& config() const { return config_; }

  // ---- BaseLayer ----
  const char* name() const override { return "drawings"; }
  void render(LayerFrame& out) override;
  bool handleEvent(const PointerEvent& e) override;
  bool handleKey(const KeyEvent& e) override;
  void dispose() override;

  // ---- Host control surface ----
  void setDrawingMode(bool enabled);
  bool drawingMode() const { return drawingMode_; }

  void setActiveTool(std::optional<DrawingType> tool);
  const std::optional<DrawingType>& activeTool() const { return state_.activeTool(); }

  DrawingId getSelectedDrawingId() const { return state_.selectedDrawingId(); }
  bool hasSelectedDrawing() const { return state_.hasSelection(); }
  bool canUndo() const { return history_.canUndo(); }
  bool canRedo() const { return history_.canRedo(); }

  void removeSelectedDrawing();
  void switchSelectedDrawingType();
  void undo();
  void redo();
  void clearAll();

  // Replace the committed set (e.g. after an external refresh). Colors are
  // re-resolved from the current theme; undo history is cleared.
  void loadDrawings(std::vector<Drawing> drawings);

  // Swap to another instrument's drawings.
  void setInstrument(const std::string& instrumentCode);
  const std::string& instrument() const { return instrument_; }
  // Reload from storage if `instrumentCode` is the current instrument.
  void refreshDrawings(const std::string& instrumentCode);

  void setTheme(const std::string& themeName);
  const std::string& themeName() const { return themeName_; }

  void setCandles(std::vector<CandleBar> candles);

  // Config edits on the selected drawing (one undo step). Ignored if the
  // alternative does not match the drawing's type.
  void setSelectedDrawingConfig(const DrawingConfig& config);
  void setDrawingVisible(DrawingId id, bool visible);
  void setDrawingLocked(DrawingId id, bool locked);

  void setToolbarListener(ToolbarListener listener);
  ToolbarState toolbarState() const;

  const DrawingState& state() const { return state_; }
  const DrawingHistory& history() const { return history_; }
  // Storage writes that failed since construction.
  std::size_t saveFailureCount() const { return saveFailures_; }

private:
  // Holds toolbar emission until a multi-step mutation has finished.
  class ToolbarBatch {
  public:
    explicit ToolbarBatch(DrawingLayer& layer) : layer_(layer) { ++layer_.toolbarHold_; }
    ~ToolbarBatch() {
      if (--layer_.toolbarHold_ == 0) layer_.emitToolbarIfChanged();
    }
    ToolbarBatch(const ToolbarBatch&) = delete;
    ToolbarBatch& operator=(const ToolbarBatch&) = delete;

  private:
    DrawingLayer& layer_;
  };

  bool onPointerDown(const PixelPoint& p, const CoordinateSystem& cs);
  bool onPointerMove(const PixelPoint& p, const CoordinateSystem& cs);
  bool onPointerUp();

  void commitCurrentDrawing();
  void dragControlPoint(const PixelPoint& p, const CoordinateSystem& cs);

  // Pointer position -> data point (candle snap, bar rounding).
  DataPoint toDataPoint(const PixelPoint& p, const CoordinateSystem& cs) const;
  DrawingId hitTest(const PixelPoint& p, const CoordinateSystem& cs) const;
  int hitControlPoint(const Drawing& d, const PixelPoint& p, const CoordinateSystem& cs) const;
  // Width handle for a channel baseline; false when there is no mapping.
  bool addChannelHandle(Drawing& d) const;

  // Snapshot + mutate + persist helpers
  void pushHistory(const std::string& description);
  void applyRestored(std::vector<Drawing> restored);
  void persist();
  void discardTransient();
  void recolor(std::vector<Drawing>& drawings) const;
  void emitToolbarIfChanged();

  DrawingLayerConfig config_;
  DrawingState state_;
  DrawingHistory history_;
  DrawingRepository repository_;
  DrawingSnap snap_;

  bool drawingMode_{false};
  bool dragSnapshotPushed_{false};
  std::string instrument_;
  std::string themeName_{"dark"};
  std::string handleFill_;

  ToolbarListener toolbarListener_;
  ToolbarState lastToolbar_;
  std::uint32_t stateToken_{0};
  int toolbarHold_{0};
  std::size_t saveFailures_{0};
};

} // namespace cm
