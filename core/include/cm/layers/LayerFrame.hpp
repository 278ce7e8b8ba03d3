#pragma once
#include "cm/geometry/Primitives.hpp"
#include <string>
#include <vector>

namespace cm {

// Renderer-agnostic output of one layer for one frame, in canvas pixels.
// The host maps these onto its canvas/GL/scene API.

struct LinePrimitive {
  PixelPoint a, b;
  std::string color;
  float width{1.0f};
  bool dashed{false};
};

struct TextPrimitive {
  PixelPoint position;        // left/middle anchor
  std::string text;
  std::string color;
  std::string background;     // empty = none
};

struct HandlePrimitive {
  PixelPoint center;
  float radius{3.0f};
  std::string strokeColor;
  std::string fillColor;
};

struct LayerFrame {
  std::string layerName;
  int zIndex{0};
  std::vector<LinePrimitive> lines;
  std::vector<TextPrimitive> texts;
  std::vector<HandlePrimitive> handles;

  bool empty() const { return lines.empty() && texts.empty() && handles.empty(); }
  void clear() {
    lines.clear();
    texts.clear();
    handles.clear();
  }
};

} // namespace cm
