// D1.1 — CoordinateSystem: data <-> pixel mapping, ratio, pan/zoom, validity

#include "cm/viewport/CoordinateSystem.hpp"
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
  constexpr double EPS = 1e-9;

  // ---- Test 1: Linear mapping with Y flipped ----
  {
    cm::CoordinateSystem cs;
    cs.updateViewport({0, 100}, {0, 200}, {800, 600});

    auto p = cs.dataToPixel(0, 0);
    requireNear(p.x, 0.0, EPS, "origin x");
    requireNear(p.y, 600.0, EPS, "origin y at bottom");

    p = cs.dataToPixel(100, 200);
    requireNear(p.x, 800.0, EPS, "max x");
    requireNear(p.y, 0.0, EPS, "max y at top");

    p = cs.dataToPixel(50, 100);
    requireNear(p.x, 400.0, EPS, "center x");
    requireNear(p.y, 300.0, EPS, "center y");

    auto d = cs.pixelToData(200, 450);
    requireNear(d.index, 25.0, EPS, "pixelToData index");
    requireNear(d.price, 50.0, EPS, "pixelToData price");

    std::printf("  Test 1 (linear mapping): PASS\n");
  }

  // ---- Test 2: Round trip inside the viewport ----
  {
    cm::CoordinateSystem cs;
    cs.updateViewport({120.5, 340.25}, {3012.7, 3311.9}, {1280, 720});

    const cm::DataPoint samples[] = {
      {120.5, 3012.7}, {200.0, 3100.0}, {333.3, 3300.1}, {150.75, 3200.5}
    };
    for (const auto& s : samples) {
      auto back = cs.pixelToData(cs.dataToPixel(s));
      requireNear(back.index, s.index, 1e-9, "round trip index");
      requireNear(back.price, s.price, 1e-9, "round trip price");
    }

    std::printf("  Test 2 (round trip): PASS\n");
  }

  // ---- Test 3: Plot bounds narrower than the canvas ----
  {
    cm::CoordinateSystem cs;
    cs.setPlotBounds({50, 20, 750, 580});
    cs.updateViewport({0, 100}, {0, 200}, {800, 600});

    auto p = cs.dataToPixel(0, 0);
    requireNear(p.x, 50.0, EPS, "plot left");
    requireNear(p.y, 580.0, EPS, "plot bottom");
    p = cs.dataToPixel(100, 200);
    requireNear(p.x, 750.0, EPS, "plot right");
    requireNear(p.y, 20.0, EPS, "plot top");

    requireTrue(cs.containsPixel({60, 30}), "inside plot");
    requireTrue(!cs.containsPixel({10, 30}), "left margin outside");

    // Custom bounds survive the next viewport update
    cs.updateViewport({0, 50}, {0, 100}, {1024, 768});
    requireNear(cs.plotBounds().right, 750.0, EPS, "bounds kept");

    std::printf("  Test 3 (plot bounds): PASS\n");
  }

  // ---- Test 4: Pixel ratio ----
  {
    cm::CoordinateSystem cs;
    cs.updateViewport({0, 100}, {0, 200}, {800, 600});
    requireNear(cs.pixelsPerIndex(), 8.0, EPS, "8 px per bar");
    requireNear(cs.pixelsPerPrice(), 3.0, EPS, "3 px per price unit");
    requireNear(cs.priceUnitsPerIndexUnit(), 8.0 / 3.0, EPS, "ratio");

    // One bar and one ratio-price span the same pixel length
    auto a = cs.dataToPixel(10, 50);
    auto b = cs.dataToPixel(11, 50 + cs.priceUnitsPerIndexUnit());
    requireNear(b.x - a.x, a.y - b.y, 1e-9, "1:1 is square on screen");

    cs.updateViewport({0, 50}, {0, 200}, {800, 600});
    requireNear(cs.priceUnitsPerIndexUnit(), 16.0 / 3.0, EPS, "ratio follows zoom");

    std::printf("  Test 4 (ratio): PASS\n");
  }

  // ---- Test 5: Pan and zoom ----
  {
    cm::CoordinateSystem cs;
    cs.updateViewport({0, 100}, {0, 200}, {800, 600});

    cs.pan(80, 0); // 10 bars to the right shows earlier bars
    requireNear(cs.indexRange().min, -10.0, EPS, "pan index min");
    requireNear(cs.indexRange().max, 90.0, EPS, "pan index max");

    cs.pan(0, 30); // dragging down shows higher prices
    requireNear(cs.priceRange().min, 10.0, EPS, "pan price min");
    requireNear(cs.priceRange().max, 210.0, EPS, "pan price max");

    cm::CoordinateSystem z;
    z.updateViewport({0, 100}, {0, 200}, {800, 600});
    z.zoom(1.0, 400, 300); // 2x around the center
    requireNear(z.indexRange().min, 25.0, EPS, "zoom index min");
    requireNear(z.indexRange().max, 75.0, EPS, "zoom index max");
    requireNear(z.priceRange().min, 50.0, EPS, "zoom price min");
    requireNear(z.priceRange().max, 150.0, EPS, "zoom price max");

    std::printf("  Test 5 (pan/zoom): PASS\n");
  }

  // ---- Test 6: Degenerate viewports are invalid ----
  {
    cm::CoordinateSystem cs;
    cs.updateViewport({0, 100}, {0, 200}, {800, 600});
    requireTrue(cs.isValid(), "normal viewport valid");

    cs.updateViewport({10, 10}, {0, 200}, {800, 600});
    requireTrue(!cs.isValid(), "zero index span invalid");
    requireNear(cs.pixelsPerIndex(), 0.0, EPS, "no px per bar");

    cs.updateViewport({0, 100}, {50, 50}, {800, 600});
    requireTrue(!cs.isValid(), "zero price span invalid");
    requireNear(cs.priceUnitsPerIndexUnit(), 0.0, EPS, "no ratio");

    cs.updateViewport({0, 100}, {0, 200}, {0, 600});
    requireTrue(!cs.isValid(), "empty canvas invalid");

    std::printf("  Test 6 (validity): PASS\n");
  }

  std::printf("D1.1 coordinate_system: ALL PASS\n");
  return 0;
}
