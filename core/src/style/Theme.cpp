#include "cm/style/Theme.hpp"
#include <cctype>

namespace cm {

static std::string lowerCase(const std::string& s) {
  std::string out = s;
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

// -------------------- Built-in presets --------------------

Theme darkTheme() {
  Theme t;
  t.name = "dark";
  // All fields already carry the dark-theme defaults from the struct initializers.
  return t;
}

Theme lightTheme() {
  Theme t;
  t.name = "light";
  t.drawingColor = "#000000";
  t.handleFillColor = "#F2F2F5";
  t.crosshairColor = "#4D4D59";
  t.labelTextColor = "#26262E";
  t.labelBackgroundColor = "#E0E0E6";
  return t;
}

bool themeByName(const std::string& name, Theme& out) {
  std::string key = lowerCase(name);
  if (key == "dark") { out = darkTheme(); return true; }
  if (key == "light") { out = lightTheme(); return true; }
  return false;
}

std::string drawingColorForTheme(const std::string& themeName) {
  return lowerCase(themeName) == "light" ? lightTheme().drawingColor
                                         : darkTheme().drawingColor;
}

} // namespace cm
