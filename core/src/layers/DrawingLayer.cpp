#include "cm/layers/DrawingLayer.hpp"
#include "cm/drawing/DrawingGeometry.hpp"
#include "cm/style/Theme.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace cm {

DrawingLayer::DrawingLayer(KeyValueStore& store, int zIndex)
  : BaseLayer(zIndex),
    history_(config_.maxHistory),
    repository_(store),
    handleFill_(darkTheme().handleFillColor) {
  snap_.setConfig(SnapConfig{config_.snapToCandles, config_.snapThresholdPx});
  stateToken_ = state_.subscribe([this]() { emitToolbarIfChanged(); });
  lastToolbar_ = toolbarState();
}

DrawingLayer::~DrawingLayer() {
  state_.unsubscribe(stateToken_);
}

void DrawingLayer::setConfig(const DrawingLayerConfig& cfg) {
  config_ = cfg;
  history_.setMaxDepth(cfg.maxHistory);
  snap_.setConfig(SnapConfig{cfg.snapToCandles, cfg.snapThresholdPx});
  emitToolbarIfChanged();
}

// -------------------- Rendering --------------------

void DrawingLayer::render(LayerFrame& out) {
  const CoordinateSystem* cs = validCoordinates();
  if (!cs) return;

  DrawingId sel = state_.selectedDrawingId();
  DrawingId hov = state_.hoveredDrawingId();

  for (const auto& d : state_.drawings()) {
    if (!d.visible) continue;
    bool selected = d.id == sel;
    bool hovered = d.id == hov;
    float width = d.lineWidth + (selected ? config_.selectedWidthBoost : 0.0f);

    geometry::DrawingPath path = geometry::computePath(d, *cs);
    for (const auto& line : path.lines) {
      LinePrimitive lp;
      lp.a = line.a;
      lp.b = line.b;
      lp.color = line.color.empty() ? d.color : line.color;
      lp.width = width + line.widthBoost;
      out.lines.push_back(lp);
    }
    for (const auto& label : path.labels) {
      TextPrimitive tp;
      tp.position = label.position;
      tp.text = label.text;
      tp.color = d.color;
      out.texts.push_back(tp);
    }

    if (!selected && !hovered) continue;
    float radius = selected ? config_.editHandleRadius : config_.hoverHandleRadius;
    for (const auto& h : geometry::controlPointPixels(d, *cs)) {
      if (!cs->containsPixel(h)) continue;
      HandlePrimitive hp;
      hp.center = h;
      hp.radius = radius;
      hp.strokeColor = d.color;
      hp.fillColor = handleFill_;
      out.handles.push_back(hp);
    }
  }

  // In-progress drawing: dashed preview plus point markers
  const auto& tool = state_.activeTool();
  if (tool && state_.isDrawing()) {
    Drawing preview;
    preview.type = *tool;
    preview.points = state_.currentPoints();
    if (state_.previewPoint()) preview.points.push_back(*state_.previewPoint());
    preview.config = geometry::defaultConfig(*tool);
    preview.color = drawingColorForTheme(themeName_);
    preview.lineWidth = config_.lineWidth;

    geometry::DrawingPath path = geometry::computePath(preview, *cs);
    for (const auto& line : path.lines) {
      LinePrimitive lp;
      lp.a = line.a;
      lp.b = line.b;
      lp.color = line.color.empty() ? preview.color : line.color;
      lp.width = preview.lineWidth + line.widthBoost;
      lp.dashed = true;
      out.lines.push_back(lp);
    }
    for (const auto& label : path.labels) {
      TextPrimitive tp;
      tp.position = label.position;
      tp.text = label.text;
      tp.color = preview.color;
      out.texts.push_back(tp);
    }
    for (const auto& p : state_.currentPoints()) {
      PixelPoint px = cs->dataToPixel(p);
      if (!cs->containsPixel(px)) continue;
      HandlePrimitive hp;
      hp.center = px;
      hp.radius = config_.markerRadius;
      hp.strokeColor = preview.color;
      hp.fillColor = preview.color;
      out.handles.push_back(hp);
    }
  }
}

// -------------------- Input --------------------

bool DrawingLayer::handleEvent(const PointerEvent& e) {
  if (!drawingMode_) return false;
  // Pinch/pan belongs to the host
  if (e.source == PointerSource::Touch && e.touchCount > 1) return false;

  const CoordinateSystem* cs = validCoordinates();
  if (!cs) return false;

  switch (e.phase) {
    case PointerPhase::Down: return onPointerDown(e.position, *cs);
    case PointerPhase::Move: return onPointerMove(e.position, *cs);
    case PointerPhase::Up:   return onPointerUp();
  }
  return false;
}

bool DrawingLayer::handleKey(const KeyEvent& e) {
  if (!drawingMode_) return false;
  bool command = e.ctrl || e.meta;

  switch (e.key) {
    case KeyCode::Tab:
      if (!state_.hasSelection()) return false;
      switchSelectedDrawingType();
      return true;

    case KeyCode::Delete:
    case KeyCode::Backspace:
      if (!state_.hasSelection()) return false;
      removeSelectedDrawing();
      return true;

    case KeyCode::Z:
      if (!command) return false;
      if (e.shift) redo(); else undo();
      return true;

    case KeyCode::Escape:
      if (state_.isDrawing()) {
        state_.clearCurrentDrawing();
        return true;
      }
      if (state_.hasSelection()) {
        state_.exitEditMode();
        state_.setSelectedDrawingId(kInvalidId);
        return true;
      }
      return false;

    default:
      return false;
  }
}

bool DrawingLayer::onPointerDown(const PixelPoint& p, const CoordinateSystem& cs) {
  const auto& tool = state_.activeTool();
  if (tool) {
    if (!cs.containsPixel(p)) return false;
    DataPoint dp = toDataPoint(p, cs);

    // Gann second point must be strictly right of the anchor
    const auto& pts = state_.currentPoints();
    if (*tool == DrawingType::GannAngle && pts.size() == 1 && dp.index <= pts[0].index) {
      return true;
    }

    state_.appendCurrentPoint(dp);
    if (static_cast<int>(state_.currentPoints().size()) >= geometry::requiredPoints(*tool)) {
      commitCurrentDrawing();
    }
    return true;
  }

  // Handle of the already-selected drawing -> edit
  DrawingId sel = state_.selectedDrawingId();
  if (const Drawing* d = state_.find(sel)) {
    if (d->visible && !d->locked) {
      int idx = hitControlPoint(*d, p, cs);
      if (idx >= 0) {
        dragSnapshotPushed_ = false;
        state_.enterEditMode(sel, idx);
        return true;
      }
    }
  }

  DrawingId hit = hitTest(p, cs);
  state_.setSelectedDrawingId(hit);
  return hit != kInvalidId;
}

bool DrawingLayer::onPointerMove(const PixelPoint& p, const CoordinateSystem& cs) {
  if (state_.isEditing()) {
    dragControlPoint(p, cs);
    return true;
  }
  if (state_.activeTool()) {
    if (!state_.isDrawing()) return false;
    state_.setPreviewPoint(toDataPoint(p, cs));
    return true;
  }
  state_.setHoveredDrawingId(hitTest(p, cs));
  return false;
}

bool DrawingLayer::onPointerUp() {
  ToolbarBatch batch(*this);
  if (!state_.isEditing()) return false;
  state_.exitEditMode();
  if (dragSnapshotPushed_) {
    dragSnapshotPushed_ = false;
    persist();
  }
  return true;
}

void DrawingLayer::commitCurrentDrawing() {
  ToolbarBatch batch(*this);
  DrawingType type = *state_.activeTool();

  Drawing d;
  d.id = state_.nextId();
  d.type = type;
  d.points = state_.currentPoints();
  d.config = geometry::defaultConfig(type);
  d.color = drawingColorForTheme(themeName_);
  d.lineWidth = config_.lineWidth;
  if (type == DrawingType::PriceChannel) addChannelHandle(d);

  pushHistory(std::string("create ") + drawingTypeName(type));
  state_.clearCurrentDrawing();
  state_.addDrawing(d);
  state_.setSelectedDrawingId(d.id);
  persist();
}

void DrawingLayer::dragControlPoint(const PixelPoint& p, const CoordinateSystem& cs) {
  ToolbarBatch batch(*this);
  const Drawing* current = state_.find(state_.editingDrawingId());
  if (!current || current->locked) return;
  int idx = state_.editingPointIndex();
  if (idx < 0 || idx >= static_cast<int>(current->points.size())) return;

  Drawing next = *current;
  auto& pts = next.points;

  if (next.type == DrawingType::PriceChannel && idx == 2) {
    // Width handle slides along the baseline normal only
    PixelPoint a = cs.dataToPixel(pts[0]);
    PixelPoint b = cs.dataToPixel(pts[1]);
    PixelPoint n;
    if (!geometry::channelNormal(a, b, n)) return;
    pts[2] = cs.pixelToData(geometry::constrainToChannelNormal(a, b, p));
  } else {
    DataPoint dp = toDataPoint(p, cs);
    if (next.type == DrawingType::GannAngle) {
      if (idx == 1 && dp.index <= pts[0].index) return;
      if (idx == 0 && dp.index >= pts[1].index) return;
    }

    bool keepWidth = next.type == DrawingType::PriceChannel && pts.size() >= 3;
    double offset = keepWidth ? geometry::channelOffset(next, cs) : 0.0;
    pts[static_cast<std::size_t>(idx)] = dp;
    if (keepWidth) {
      PixelPoint a = cs.dataToPixel(pts[0]);
      PixelPoint b = cs.dataToPixel(pts[1]);
      // A zero-length baseline has no normal to carry the width along
      PixelPoint n;
      if (!geometry::channelNormal(a, b, n)) return;
      pts[2] = cs.pixelToData(geometry::channelWidthHandle(a, b, offset));
    }
  }

  if (pts == current->points) return;
  if (!dragSnapshotPushed_) {
    pushHistory("move point");
    dragSnapshotPushed_ = true;
  }
  state_.replaceDrawing(next);
}

DataPoint DrawingLayer::toDataPoint(const PixelPoint& p, const CoordinateSystem& cs) const {
  PixelPoint q = snap_.snapToKeyPoint(p, cs);
  DataPoint d = cs.pixelToData(q);
  if (config_.roundToBar) d.index = std::round(d.index);
  return d;
}

DrawingId DrawingLayer::hitTest(const PixelPoint& p, const CoordinateSystem& cs) const {
  const auto& all = state_.drawings();
  // Most recent first
  for (auto it = all.rbegin(); it != all.rend(); ++it) {
    if (!it->visible) continue;
    double dist = geometry::distanceToDrawing(*it, cs, p);
    if (dist >= 0.0 && dist <= config_.hitTolerancePx) return it->id;
  }
  return kInvalidId;
}

int DrawingLayer::hitControlPoint(const Drawing& d, const PixelPoint& p,
                                  const CoordinateSystem& cs) const {
  int best = -1;
  double bestDist = config_.controlPointTolerancePx;
  auto handles = geometry::controlPointPixels(d, cs);
  for (std::size_t i = 0; i < handles.size(); ++i) {
    double dist = std::hypot(p.x - handles[i].x, p.y - handles[i].y);
    if (dist <= bestDist) {
      bestDist = dist;
      best = static_cast<int>(i);
    }
  }
  return best;
}

bool DrawingLayer::addChannelHandle(Drawing& d) const {
  const CoordinateSystem* cs = validCoordinates();
  if (!cs || d.points.size() != 2) return false;

  PixelPoint a = cs->dataToPixel(d.points[0]);
  PixelPoint b = cs->dataToPixel(d.points[1]);
  PixelPoint n;
  if (!geometry::channelNormal(a, b, n)) return false;

  const PriceChannelConfig* cfg = priceChannelConfig(d);
  double width = cfg ? cfg->channelWidth : PriceChannelConfig{}.channelWidth;
  d.points.push_back(cs->pixelToData(geometry::channelWidthHandle(a, b, width)));
  return true;
}

// -------------------- Host control surface --------------------

void DrawingLayer::setDrawingMode(bool enabled) {
  ToolbarBatch batch(*this);
  if (drawingMode_ == enabled) return;
  drawingMode_ = enabled;
  if (!enabled) {
    discardTransient();
    state_.setActiveTool(std::nullopt);
  }
  emitToolbarIfChanged();
}

void DrawingLayer::setActiveTool(std::optional<DrawingType> tool) {
  ToolbarBatch batch(*this);
  state_.clearCurrentDrawing();
  state_.exitEditMode();
  // An armed tool stops hover tracking
  if (tool) state_.setHoveredDrawingId(kInvalidId);
  state_.setActiveTool(tool);
}

void DrawingLayer::removeSelectedDrawing() {
  ToolbarBatch batch(*this);
  if (!state_.hasSelection()) return;
  DrawingId sel = state_.selectedDrawingId();
  if (!state_.find(sel)) return;

  pushHistory("delete drawing");
  state_.exitEditMode();
  state_.removeDrawing(sel);
  state_.setSelectedDrawingId(kInvalidId);
  if (state_.hoveredDrawingId() == sel) state_.setHoveredDrawingId(kInvalidId);
  persist();
}

void DrawingLayer::switchSelectedDrawingType() {
  ToolbarBatch batch(*this);
  const Drawing* d = state_.find(state_.selectedDrawingId());
  if (!d) return;
  DrawingType nextType = geometry::nextTypeInCycle(d->type);
  if (nextType == d->type) return; // single-member group

  Drawing next = *d;
  next.type = nextType;
  next.config = geometry::defaultConfig(nextType);
  std::size_t limit = static_cast<std::size_t>(geometry::maxPoints(nextType));
  if (next.points.size() > limit) next.points.resize(limit);
  if (nextType == DrawingType::PriceChannel) addChannelHandle(next);

  pushHistory("switch type");
  state_.exitEditMode();
  state_.replaceDrawing(next);
  persist();
}

void DrawingLayer::undo() {
  ToolbarBatch batch(*this);
  std::vector<Drawing> restored;
  if (!history_.undo(state_.drawings(), restored)) return;
  applyRestored(std::move(restored));
  persist();
}

void DrawingLayer::redo() {
  ToolbarBatch batch(*this);
  std::vector<Drawing> restored;
  if (!history_.redo(state_.drawings(), restored)) return;
  applyRestored(std::move(restored));
  persist();
}

void DrawingLayer::clearAll() {
  ToolbarBatch batch(*this);
  if (!state_.drawings().empty()) {
    pushHistory("clear all");
    state_.exitEditMode();
    state_.clearDrawings();
    persist();
  }
  state_.setSelectedDrawingId(kInvalidId);
  state_.setHoveredDrawingId(kInvalidId);
}

void DrawingLayer::loadDrawings(std::vector<Drawing> drawings) {
  ToolbarBatch batch(*this);
  std::size_t before = drawings.size();
  drawings.erase(
    std::remove_if(drawings.begin(), drawings.end(),
      [](const Drawing& d) { return !geometry::hasValidPointCount(d); }),
    drawings.end());
  if (drawings.size() != before) {
    std::fprintf(stderr, "[DrawingLayer] skipped %zu drawings with invalid points\n",
                 before - drawings.size());
  }

  std::size_t renumbered = repairDrawingIds(drawings);
  if (renumbered > 0) {
    std::fprintf(stderr, "[DrawingLayer] assigned fresh ids to %zu drawings\n", renumbered);
  }

  state_.exitEditMode();
  dragSnapshotPushed_ = false;
  history_.clear();
  recolor(drawings);
  state_.setDrawings(std::move(drawings));

  if (!state_.find(state_.selectedDrawingId())) state_.setSelectedDrawingId(kInvalidId);
  if (!state_.find(state_.hoveredDrawingId())) state_.setHoveredDrawingId(kInvalidId);
}

void DrawingLayer::setInstrument(const std::string& instrumentCode) {
  ToolbarBatch batch(*this);
  discardTransient();
  history_.clear();
  instrument_ = instrumentCode;

  // Build the new set fully, then swap it in with one assignment
  std::vector<Drawing> loaded;
  if (!repository_.load(instrumentCode, loaded)) loaded.clear();
  recolor(loaded);
  state_.setDrawings(std::move(loaded));
}

void DrawingLayer::refreshDrawings(const std::string& instrumentCode) {
  if (instrumentCode != instrument_) return;
  std::vector<Drawing> loaded;
  if (!repository_.load(instrumentCode, loaded)) loaded.clear();
  loadDrawings(std::move(loaded));
}

void DrawingLayer::setTheme(const std::string& themeName) {
  ToolbarBatch batch(*this);
  Theme theme;
  if (!themeByName(themeName, theme)) {
    std::fprintf(stderr, "[DrawingLayer] unknown theme \"%s\", using dark\n", themeName.c_str());
    theme = darkTheme();
  }
  themeName_ = theme.name;
  handleFill_ = theme.handleFillColor;

  std::vector<Drawing> recolored = state_.drawings();
  recolor(recolored);
  state_.setDrawings(std::move(recolored));
}

void DrawingLayer::setCandles(std::vector<CandleBar> candles) {
  snap_.setCandles(std::move(candles));
}

void DrawingLayer::setSelectedDrawingConfig(const DrawingConfig& config) {
  ToolbarBatch batch(*this);
  const Drawing* d = state_.find(state_.selectedDrawingId());
  if (!d || !geometry::configMatchesType(d->type, config)) return;
  if (d->config == config) return;

  Drawing next = *d;
  next.config = config;
  pushHistory("edit config");
  state_.replaceDrawing(next);
  persist();
}

void DrawingLayer::setDrawingVisible(DrawingId id, bool visible) {
  ToolbarBatch batch(*this);
  const Drawing* d = state_.find(id);
  if (!d || d->visible == visible) return;

  Drawing next = *d;
  next.visible = visible;
  pushHistory(visible ? "show drawing" : "hide drawing");
  if (!visible) {
    if (state_.editingDrawingId() == id) state_.exitEditMode();
    if (state_.selectedDrawingId() == id) state_.setSelectedDrawingId(kInvalidId);
    if (state_.hoveredDrawingId() == id) state_.setHoveredDrawingId(kInvalidId);
  }
  state_.replaceDrawing(next);
  persist();
}

void DrawingLayer::setDrawingLocked(DrawingId id, bool locked) {
  ToolbarBatch batch(*this);
  const Drawing* d = state_.find(id);
  if (!d || d->locked == locked) return;

  Drawing next = *d;
  next.locked = locked;
  pushHistory(locked ? "lock drawing" : "unlock drawing");
  if (locked && state_.editingDrawingId() == id) state_.exitEditMode();
  state_.replaceDrawing(next);
  persist();
}

void DrawingLayer::setToolbarListener(ToolbarListener listener) {
  toolbarListener_ = std::move(listener);
  lastToolbar_ = toolbarState();
  if (toolbarListener_) toolbarListener_(lastToolbar_);
}

ToolbarState DrawingLayer::toolbarState() const {
  ToolbarState s;
  s.hasSelection = state_.hasSelection();
  s.canUndo = history_.canUndo();
  s.canRedo = history_.canRedo();
  s.activeTool = state_.activeTool();
  s.drawingMode = drawingMode_;
  return s;
}

void DrawingLayer::dispose() {
  // A disposed layer no longer reports to the host
  toolbarListener_ = nullptr;
  discardTransient();
  BaseLayer::dispose();
}

// -------------------- Internals --------------------

void DrawingLayer::pushHistory(const std::string& description) {
  history_.push(description, state_.drawings());
}

void DrawingLayer::applyRestored(std::vector<Drawing> restored) {
  state_.exitEditMode();
  dragSnapshotPushed_ = false;
  recolor(restored);
  state_.setDrawings(std::move(restored));
  if (!state_.find(state_.selectedDrawingId())) state_.setSelectedDrawingId(kInvalidId);
  if (!state_.find(state_.hoveredDrawingId())) state_.setHoveredDrawingId(kInvalidId);
}

void DrawingLayer::persist() {
  if (instrument_.empty()) return;
  // Logged by the repository; memory stays authoritative
  if (!repository_.save(instrument_, state_.drawings())) ++saveFailures_;
}

void DrawingLayer::discardTransient() {
  dragSnapshotPushed_ = false;
  state_.clearCurrentDrawing();
  state_.exitEditMode();
  state_.setSelectedDrawingId(kInvalidId);
  state_.setHoveredDrawingId(kInvalidId);
}

void DrawingLayer::recolor(std::vector<Drawing>& drawings) const {
  std::string color = drawingColorForTheme(themeName_);
  for (auto& d : drawings) d.color = color;
}

void DrawingLayer::emitToolbarIfChanged() {
  if (toolbarHold_ > 0) return;
  ToolbarState s = toolbarState();
  if (s == lastToolbar_) return;
  lastToolbar_ = s;
  if (toolbarListener_) toolbarListener_(s);
}

} // namespace cm
