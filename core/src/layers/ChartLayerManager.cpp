#include "cm/layers/ChartLayerManager.hpp"
#include "cm/style/Theme.hpp"
#include <algorithm>

namespace cm {

ChartLayerManager::ChartLayerManager(KeyValueStore& store) {
  auto drawing = std::make_unique<DrawingLayer>(store);
  auto crosshair = std::make_unique<CrosshairLayer>();
  auto labels = std::make_unique<ValueLabelsLayer>();
  drawing_ = drawing.get();
  crosshair_ = crosshair.get();
  labels_ = labels.get();

  addLayer(std::move(labels));
  addLayer(std::move(drawing));
  addLayer(std::move(crosshair));
}

ChartLayerManager::~ChartLayerManager() {
  dispose();
}

void ChartLayerManager::updateViewport(const IndexRange& visibleIndexRange,
                                       const PriceRange& priceRange,
                                       const CanvasSize& canvasSize) {
  cs_.updateViewport(visibleIndexRange, priceRange, canvasSize);
}

void ChartLayerManager::setPlotBounds(const PixelRect& bounds) {
  cs_.setPlotBounds(bounds);
}

BaseLayer* ChartLayerManager::addLayer(std::unique_ptr<BaseLayer> layer) {
  if (!layer) return nullptr;
  BaseLayer* raw = layer.get();
  raw->mount(cs_);
  layers_.push_back(std::move(layer));
  sortLayers();
  return raw;
}

bool ChartLayerManager::removeLayer(const BaseLayer* layer) {
  // Built-in layers back the facade and stay
  if (layer == drawing_ || layer == crosshair_ || layer == labels_) return false;
  auto it = std::find_if(layers_.begin(), layers_.end(),
    [layer](const std::unique_ptr<BaseLayer>& l) { return l.get() == layer; });
  if (it == layers_.end()) return false;
  (*it)->dispose();
  layers_.erase(it);
  return true;
}

std::vector<LayerFrame> ChartLayerManager::render() {
  std::vector<LayerFrame> frames;
  frames.reserve(layers_.size());
  for (auto& layer : layers_) {
    LayerFrame frame;
    frame.layerName = layer->name();
    frame.zIndex = layer->zIndex();
    layer->render(frame);
    frames.push_back(std::move(frame));
  }
  return frames;
}

bool ChartLayerManager::handleEvent(const PointerEvent& e) {
  for (auto it = layers_.rbegin(); it != layers_.rend(); ++it) {
    if ((*it)->handleEvent(e)) return true;
  }
  return false;
}

bool ChartLayerManager::handleKey(const KeyEvent& e) {
  for (auto it = layers_.rbegin(); it != layers_.rend(); ++it) {
    if ((*it)->handleKey(e)) return true;
  }
  return false;
}

void ChartLayerManager::applySettings(const LayerSettings& settings) {
  drawing_->setConfig(settings.drawing);
  crosshair_->setConfig(settings.crosshair);
  setTheme(settings.themeName);
}

LayerSettings ChartLayerManager::currentSettings() const {
  LayerSettings s;
  s.themeName = drawing_->themeName();
  s.drawing = drawing_->config();
  s.crosshair = crosshair_->config();
  return s;
}

void ChartLayerManager::setDrawingMode(bool enabled) {
  drawing_->setDrawingMode(enabled);
  crosshair_->setSuppressed(enabled);
}

void ChartLayerManager::setInstrument(const std::string& instrumentCode) {
  crosshair_->hide();
  drawing_->setInstrument(instrumentCode);
}

void ChartLayerManager::setTheme(const std::string& themeName) {
  drawing_->setTheme(themeName);
  Theme theme;
  if (!themeByName(drawing_->themeName(), theme)) theme = darkTheme();
  crosshair_->setTheme(theme);
  labels_->setTheme(theme);
}

void ChartLayerManager::dispose() {
  if (disposed_) return;
  disposed_ = true;
  for (auto& layer : layers_) layer->dispose();
}

void ChartLayerManager::sortLayers() {
  std::stable_sort(layers_.begin(), layers_.end(),
    [](const std::unique_ptr<BaseLayer>& a, const std::unique_ptr<BaseLayer>& b) {
      return a->zIndex() < b->zIndex();
    });
}

} // namespace cm
