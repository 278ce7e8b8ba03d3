// D5.4 — DrawingLayer per-instrument lifecycle: switch, refresh, theme,
//        drawing mode, bulk load, storage failures

#include "cm/layers/DrawingLayer.hpp"
#include <cstdio>
#include <cstdlib>
#include <limits>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static void click(cm::DrawingLayer& layer, double x, double y) {
  cm::PointerEvent e;
  e.position = {x, y};
  e.phase = cm::PointerPhase::Down;
  layer.handleEvent(e);
  e.phase = cm::PointerPhase::Up;
  layer.handleEvent(e);
}

namespace {

class ReadOnlyStore : public cm::KeyValueStore {
public:
  bool get(const std::string&, std::string&) const override { return false; }
  bool set(const std::string&, const std::string&) override { return false; }
  bool remove(const std::string&) override { return false; }
};

cm::Drawing segment(cm::DrawingId id, std::size_t pointCount) {
  cm::Drawing d;
  d.id = id;
  d.type = cm::DrawingType::Segment;
  for (std::size_t i = 0; i < pointCount; ++i)
    d.points.push_back({10.0 + 10.0 * static_cast<double>(i), 100.0});
  return d;
}

} // namespace

int main() {
  cm::CoordinateSystem cs;
  cs.updateViewport({0, 100}, {0, 200}, {800, 600});

  // ---- Test 1: Drawings follow the instrument ----
  {
    cm::MemoryKeyValueStore store;
    cm::DrawingLayer layer(store);
    layer.mount(cs);
    layer.setDrawingMode(true);

    layer.setInstrument("A");
    layer.setActiveTool(cm::DrawingType::Segment);
    click(layer, 80, 300);
    click(layer, 160, 270);
    std::vector<cm::Drawing> onA = layer.state().drawings();
    requireTrue(onA.size() == 1, "drawn on A");

    layer.setInstrument("B");
    requireTrue(layer.instrument() == "B", "instrument B");
    requireTrue(layer.state().drawings().empty(), "B starts empty");
    requireTrue(!layer.hasSelectedDrawing(), "selection dropped");
    requireTrue(!layer.canUndo(), "history is per instrument");

    layer.setActiveTool(cm::DrawingType::HorizontalRay);
    click(layer, 400, 150);
    requireTrue(layer.state().drawings().size() == 1, "drawn on B");

    layer.setInstrument("A");
    requireTrue(layer.state().drawings() == onA, "A restored as saved");
    layer.setInstrument("B");
    requireTrue(layer.state().drawings()[0].type == cm::DrawingType::HorizontalRay, "B restored");

    std::printf("  Test 1 (instrument switch): PASS\n");
  }

  // ---- Test 2: Switching mid-creation discards the partial drawing ----
  {
    cm::MemoryKeyValueStore store;
    cm::DrawingLayer layer(store);
    layer.mount(cs);
    layer.setDrawingMode(true);
    layer.setInstrument("A");
    layer.setActiveTool(cm::DrawingType::Segment);
    click(layer, 80, 300);
    requireTrue(layer.state().isDrawing(), "mid-creation");

    layer.setInstrument("B");
    requireTrue(!layer.state().isDrawing(), "partial drawing discarded");
    click(layer, 160, 270);
    requireTrue(layer.state().drawings().empty(), "no drawing from stale point");
    requireTrue(layer.state().isDrawing(), "fresh first point");

    std::printf("  Test 2 (mid-creation switch): PASS\n");
  }

  // ---- Test 3: External refresh ----
  {
    cm::MemoryKeyValueStore store;
    cm::DrawingLayer layer(store);
    layer.mount(cs);
    layer.setDrawingMode(true);
    layer.setInstrument("A");
    layer.setActiveTool(cm::DrawingType::HorizontalRay);
    click(layer, 80, 300);
    requireTrue(layer.canUndo(), "undo before refresh");

    cm::DrawingRepository repo(store);
    repo.save("A", {segment(5, 2), segment(6, 2)});
    repo.save("B", {segment(9, 2)});

    layer.refreshDrawings("B");
    requireTrue(layer.state().drawings().size() == 1, "other instrument ignored");

    layer.refreshDrawings("A");
    requireTrue(layer.state().drawings().size() == 2, "reloaded from storage");
    requireTrue(layer.state().find(5) != nullptr, "stored ids kept");
    requireTrue(!layer.canUndo(), "refresh clears history");

    std::printf("  Test 3 (refresh): PASS\n");
  }

  // ---- Test 4: Theme recolors drawings ----
  {
    cm::MemoryKeyValueStore store;
    cm::DrawingRepository repo(store);
    repo.save("T", {segment(1, 2)});
    cm::DrawingLayer layer(store);
    layer.mount(cs);
    layer.setDrawingMode(true);

    layer.setTheme("light");
    layer.setInstrument("T");
    requireTrue(layer.state().drawings()[0].color == "#000000", "loaded in light");

    layer.setActiveTool(cm::DrawingType::HorizontalRay);
    click(layer, 80, 300);
    requireTrue(layer.state().drawings()[1].color == "#000000", "created in light");

    layer.setTheme("dark");
    for (const auto& d : layer.state().drawings())
      requireTrue(d.color == "#FFFFFF", "recolored for dark");

    layer.setTheme("LIGHT");
    requireTrue(layer.themeName() == "light", "case-insensitive name");
    layer.setTheme("neon");
    requireTrue(layer.themeName() == "dark", "unknown falls back to dark");
    requireTrue(layer.state().drawings()[0].color == "#FFFFFF", "fallback color");

    std::printf("  Test 4 (theme): PASS\n");
  }

  // ---- Test 5: Turning drawing mode off ----
  {
    cm::MemoryKeyValueStore store;
    cm::DrawingLayer layer(store);
    layer.mount(cs);
    layer.setDrawingMode(true);
    layer.setActiveTool(cm::DrawingType::Segment);
    click(layer, 80, 300);
    click(layer, 160, 270);
    click(layer, 240, 300);
    requireTrue(layer.state().isDrawing(), "second drawing in progress");
    requireTrue(layer.hasSelectedDrawing(), "first drawing selected");

    layer.setDrawingMode(false);
    requireTrue(!layer.state().isDrawing(), "in-progress drawing discarded");
    requireTrue(!layer.activeTool().has_value(), "tool disarmed");
    requireTrue(!layer.hasSelectedDrawing(), "selection cleared");
    requireTrue(layer.state().drawings().size() == 1, "committed drawing kept");

    cm::LayerFrame frame;
    layer.render(frame);
    requireTrue(frame.lines.size() == 1, "still rendered");

    std::printf("  Test 5 (drawing mode off): PASS\n");
  }

  // ---- Test 6: Bulk load validates and resets history ----
  {
    cm::MemoryKeyValueStore store;
    cm::DrawingLayer layer(store);
    layer.mount(cs);
    layer.setDrawingMode(true);
    layer.setActiveTool(cm::DrawingType::HorizontalRay);
    click(layer, 80, 300);
    requireTrue(layer.canUndo(), "undo before load");

    cm::Drawing colored = segment(3, 2);
    colored.color = "#FF0000";
    layer.loadDrawings({colored, segment(4, 1), segment(7, 3)});
    requireTrue(layer.state().drawings().size() == 1, "invalid point counts dropped");
    requireTrue(layer.state().drawings()[0].id == 3, "valid one kept");
    requireTrue(layer.state().drawings()[0].color == "#FFFFFF", "color from theme");
    requireTrue(!layer.canUndo(), "history cleared");

    std::printf("  Test 6 (bulk load): PASS\n");
  }

  // ---- Test 7: Bulk load repairs unusable ids ----
  {
    cm::MemoryKeyValueStore store;
    cm::DrawingLayer layer(store);
    layer.mount(cs);
    layer.setDrawingMode(true);
    layer.loadDrawings({segment(0, 2), segment(5, 2), segment(5, 2)});

    const auto& ds = layer.state().drawings();
    requireTrue(ds.size() == 3, "all three kept");
    requireTrue(ds[1].id == 5, "first holder of an id keeps it");
    requireTrue(ds[0].id == 6, "id 0 renumbered");
    requireTrue(ds[2].id == 7, "duplicate renumbered");

    requireTrue(!layer.hasSelectedDrawing(), "nothing selected");
    layer.removeSelectedDrawing();
    requireTrue(layer.state().drawings().size() == 3, "delete without selection is a no-op");
    requireTrue(!layer.canUndo(), "no-op records nothing");

    layer.loadDrawings({segment(std::numeric_limits<cm::DrawingId>::max(), 2)});
    layer.setActiveTool(cm::DrawingType::HorizontalRay);
    click(layer, 400, 150);
    requireTrue(layer.state().drawings().size() == 2, "created");
    requireTrue(layer.state().drawings()[1].id == 1, "fresh id after the top id");
    requireTrue(layer.getSelectedDrawingId() == 1, "new drawing stays selected");

    std::printf("  Test 7 (id repair on load): PASS\n");
  }

  // ---- Test 8: Storage problems ----
  {
    cm::MemoryKeyValueStore store;
    store.set("drawings_BAD", "{{{");
    cm::DrawingLayer layer(store);
    layer.mount(cs);
    layer.setInstrument("BAD");
    requireTrue(layer.state().drawings().empty(), "corrupt storage -> empty set");

    ReadOnlyStore readOnly;
    cm::DrawingLayer offline(readOnly);
    offline.mount(cs);
    offline.setDrawingMode(true);
    offline.setInstrument("X");
    offline.setActiveTool(cm::DrawingType::HorizontalRay);
    click(offline, 80, 300);
    requireTrue(offline.state().drawings().size() == 1, "memory keeps the drawing");
    requireTrue(offline.saveFailureCount() == 1, "failed save counted");

    std::printf("  Test 8 (storage problems): PASS\n");
  }

  std::printf("D5.4 instrument_switch: ALL PASS\n");
  return 0;
}
