#pragma once
#include "cm/geometry/Primitives.hpp"
#include <cstdint>

namespace cm {

enum class PointerPhase : std::uint8_t { Down = 0, Move, Up };
enum class PointerSource : std::uint8_t { Mouse = 0, Touch };

// Generic pointer snapshot, fed by the host for every mouse/touch callback.
// Position is in canvas pixels, 0=left/top.
struct PointerEvent {
  PixelPoint position;
  PointerPhase phase{PointerPhase::Down};
  PointerSource source{PointerSource::Mouse};
  int touchCount{1}; // active contacts; >1 means pinch/pan for the host
};

enum class KeyCode : std::uint8_t {
  None = 0, Tab, Delete, Backspace, Escape, Z
};

struct KeyEvent {
  KeyCode key{KeyCode::None};
  bool ctrl{false};
  bool meta{false};  // Cmd on macOS
  bool shift{false};
};

} // namespace cm
