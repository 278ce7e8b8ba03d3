#pragma once
#include <string>

namespace cm {

// Colors are CSS-style hex strings handed through to the host renderer.
struct Theme {
  std::string name{"dark"};

  // Drawing tools
  std::string drawingColor{"#FFFFFF"};
  std::string handleFillColor{"#1E1E24"};

  // Crosshair / interactive
  std::string crosshairColor{"#B3B3B8"};
  std::string labelTextColor{"#D0D0D8"};
  std::string labelBackgroundColor{"#33333D"};
};

// Built-in presets
Theme darkTheme();
Theme lightTheme();

// Case-insensitive lookup of a built-in preset. Returns false (and leaves
// `out` untouched) for unknown names.
bool themeByName(const std::string& name, Theme& out);

// Stroke color for new and reloaded drawings: "#000000" for light,
// "#FFFFFF" for anything else.
std::string drawingColorForTheme(const std::string& themeName);

} // namespace cm
