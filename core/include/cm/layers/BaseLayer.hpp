#pragma once
#include "cm/input/PointerEvent.hpp"
#include "cm/layers/LayerFrame.hpp"
#include "cm/viewport/CoordinateSystem.hpp"

namespace cm {

// Lifecycle shared by all overlay layers composed by ChartLayerManager.
// A layer reads the manager's CoordinateSystem between mount() and dispose().
class BaseLayer {
public:
  explicit BaseLayer(int zIndex) : zIndex_(zIndex) {}
  virtual ~BaseLayer() = default;

  BaseLayer(const BaseLayer&) = delete;
  BaseLayer& operator=(const BaseLayer&) = delete;

  int zIndex() const { return zIndex_; }
  virtual const char* name() const = 0;

  virtual void mount(const CoordinateSystem& cs) { cs_ = &cs; }
  virtual void dispose() { cs_ = nullptr; }
  bool isMounted() const { return cs_ != nullptr; }

  // Append this frame's primitives to `out`.
  virtual void render(LayerFrame& out) = 0;

  // Returns true if the event was consumed (stops dispatch to lower layers).
  virtual bool handleEvent(const PointerEvent& e) { (void)e; return false; }
  virtual bool handleKey(const KeyEvent& e) { (void)e; return false; }

protected:
  // Null until mounted, or when the mapping is degenerate.
  const CoordinateSystem* validCoordinates() const {
    return (cs_ && cs_->isValid()) ? cs_ : nullptr;
  }

  const CoordinateSystem* cs_{nullptr};
  int zIndex_;
};

} // namespace cm
