// Drawing session demo
// Scripts a user session against ChartLayerManager: draws a segment, a
// Fibonacci retracement and a Gann fan, edits and undoes, then reloads the
// instrument from disk and prints each layer's frame.
//
// Usage: cm_drawing_demo [storage-dir]   (default: current directory)

#include "cm/layers/ChartLayerManager.hpp"
#include "cm/persistence/KeyValueStore.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <vector>

// ---- Fake OHLC data ----

static std::vector<cm::CandleBar> makeCandles(int count) {
  std::vector<cm::CandleBar> bars;
  bars.reserve(static_cast<std::size_t>(count));
  double price = 100.0;
  for (int i = 0; i < count; ++i) {
    cm::CandleBar b;
    b.open = price;
    b.close = price + std::sin(i * 0.3) * 2.0;
    b.high = std::max(b.open, b.close) + 1.0;
    b.low = std::min(b.open, b.close) - 1.0;
    price = b.close;
    bars.push_back(b);
  }
  return bars;
}

static void click(cm::ChartLayerManager& mgr, double index, double price) {
  cm::PixelPoint p = mgr.coordinateSystem().dataToPixel(index, price);
  cm::PointerEvent down;
  down.position = p;
  down.phase = cm::PointerPhase::Down;
  mgr.handleEvent(down);
  cm::PointerEvent up = down;
  up.phase = cm::PointerPhase::Up;
  mgr.handleEvent(up);
}

static void printFrames(cm::ChartLayerManager& mgr) {
  for (const auto& frame : mgr.render()) {
    std::printf("  layer %-12s z=%3d lines=%zu texts=%zu handles=%zu\n",
                frame.layerName.c_str(), frame.zIndex,
                frame.lines.size(), frame.texts.size(), frame.handles.size());
  }
}

int main(int argc, char** argv) {
  const char* dir = argc > 1 ? argv[1] : ".";
  cm::FileKeyValueStore store(dir);

  cm::ChartLayerManager mgr(store);
  mgr.updateViewport(cm::IndexRange{0, 100}, cm::PriceRange{80, 120}, cm::CanvasSize{800, 600});
  mgr.drawingLayer().setCandles(makeCandles(100));
  mgr.drawingLayer().setToolbarListener([](const cm::ToolbarState& s) {
    std::printf("  toolbar: selection=%d undo=%d redo=%d mode=%d tool=%s\n",
                s.hasSelection, s.canUndo, s.canRedo, s.drawingMode,
                s.activeTool ? cm::drawingTypeName(*s.activeTool) : "none");
  });

  mgr.setInstrument("DEMO.SH");
  mgr.setTheme("dark");
  mgr.setDrawingMode(true);

  std::printf("Drawing a segment, a fibonacci and a gann fan\n");
  mgr.setActiveTool(cm::DrawingType::Segment);
  click(mgr, 10, 95);
  click(mgr, 30, 110);

  mgr.setActiveTool(cm::DrawingType::Fibonacci);
  click(mgr, 40, 90);
  click(mgr, 60, 115);

  mgr.setActiveTool(cm::DrawingType::GannAngle);
  click(mgr, 65, 100);
  click(mgr, 75, 105);
  mgr.setActiveTool(std::nullopt);

  printFrames(mgr);

  std::printf("Selecting the segment and cycling its type\n");
  click(mgr, 20, 102.5);
  mgr.switchSelectedDrawingType();
  if (const cm::Drawing* d = mgr.drawingLayer().state().find(mgr.getSelectedDrawingId())) {
    std::printf("  selected=%llu type=%s\n",
                static_cast<unsigned long long>(d->id), cm::drawingTypeName(d->type));
  }

  std::printf("Undo (%s)\n", mgr.drawingLayer().history().undoDescription().c_str());
  mgr.undo();

  std::printf("Reloading DEMO.SH from %s\n", dir);
  mgr.setInstrument("OTHER.SZ");
  mgr.setInstrument("DEMO.SH");
  std::printf("  %zu drawings restored\n", mgr.drawingLayer().state().drawings().size());

  mgr.setTheme("light");
  printFrames(mgr);

  mgr.setDrawingMode(false);
  return 0;
}
