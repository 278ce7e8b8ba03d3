// D6.2 — LayerSettings: JSON serialize/deserialize, partial and bad input

#include "cm/settings/LayerSettings.hpp"
#include <cmath>
#include <cstdio>
#include <cstdlib>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static void requireNear(double a, double b, double eps, const char* msg) {
  if (std::fabs(a - b) > eps) {
    std::fprintf(stderr, "ASSERT FAIL [%s]: %.8f != %.8f (eps=%.8f)\n",
                 msg, a, b, eps);
    std::exit(1);
  }
}

int main() {
  constexpr double EPS = 1e-6;

  // ---- Test 1: Everything survives serialize/deserialize ----
  {
    cm::LayerSettings s;
    s.themeName = "light";
    s.drawing.hitTolerancePx = 9.0;
    s.drawing.snapToCandles = false;
    s.drawing.maxHistory = 20;
    s.drawing.lineWidth = 2.5f;
    s.crosshair.dashed = false;
    s.crosshair.priceDecimals = 5;

    std::string json = cm::serializeLayerSettings(s);
    cm::LayerSettings r;
    requireTrue(cm::deserializeLayerSettings(json, r), "deserialize ok");
    requireTrue(r.version == "1.0", "version");
    requireTrue(r.themeName == "light", "theme");
    requireNear(r.drawing.hitTolerancePx, 9.0, EPS, "hit tolerance");
    requireTrue(!r.drawing.snapToCandles, "snap flag");
    requireTrue(r.drawing.maxHistory == 20, "history depth");
    requireNear(r.drawing.lineWidth, 2.5, EPS, "line width");
    requireNear(r.drawing.controlPointTolerancePx, 10.0, EPS, "untouched default");
    requireTrue(!r.crosshair.dashed, "crosshair dashed");
    requireTrue(r.crosshair.priceDecimals == 5, "price decimals");

    std::printf("  Test 1 (serialize + deserialize): PASS\n");
  }

  // ---- Test 2: Missing and wrongly-typed keys keep current values ----
  {
    cm::LayerSettings r;
    r.drawing.snapThresholdPx = 33.0;
    const char* json = R"({
      "theme": 7,
      "drawing": {"hitTolerancePx": "wide", "roundToBar": false, "maxHistory": -3},
      "crosshair": {"priceDecimals": 1.5, "showLabels": false}
    })";
    requireTrue(cm::deserializeLayerSettings(json, r), "partial ok");
    requireTrue(r.themeName == "dark", "theme kept");
    requireNear(r.drawing.hitTolerancePx, 6.0, EPS, "tolerance kept");
    requireNear(r.drawing.snapThresholdPx, 33.0, EPS, "absent key kept");
    requireTrue(!r.drawing.roundToBar, "round flag read");
    requireTrue(r.drawing.maxHistory == 50, "negative depth ignored");
    requireTrue(r.crosshair.priceDecimals == 2, "fractional decimals ignored");
    requireTrue(!r.crosshair.showLabels, "labels flag read");

    std::printf("  Test 2 (partial input): PASS\n");
  }

  // ---- Test 3: Unusable documents ----
  {
    cm::LayerSettings r;
    requireTrue(!cm::deserializeLayerSettings("{\"theme\":", r), "truncated");
    requireTrue(!cm::deserializeLayerSettings("[1,2]", r), "array");
    requireTrue(!cm::deserializeLayerSettings("", r), "empty");
    requireTrue(r.themeName == "dark", "unchanged");

    std::printf("  Test 3 (bad documents): PASS\n");
  }

  std::printf("D6.2 layer_settings: ALL PASS\n");
  return 0;
}
