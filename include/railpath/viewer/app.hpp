#pragma once
#include <railpath/track_geom.hpp>

namespace railpath {

class Level;
class OrbitSimulator;

// RAII application that renders the level's tiles, markers and trails.
class ViewerApp {
public:
  ViewerApp(const Level& level, OrbitSimulator& sim);
  int run(); // returns 0 on normal exit

private:
  // Input & simulation
  void process_input_();
  void advance_(float frame_seconds);
  // Rendering
  void render_frame_();
  void draw_tiles_();
  void draw_markers_();
  void draw_hud_();

  // Helpers
  struct Vec2f { float x; float y; };
  Vec2f worldToScreen_(double x, double y) const;
  bool on_screen_(Vec2 world, float margin_px) const;

  // Dependencies
  const Level& level_;
  OrbitSimulator& sim_;

  // UI state
  float scale_px_per_unit_{48.0f};
  // Camera pan (world units)
  float pan_x_{0.0f};
  float pan_y_{0.0f};
  bool follow_{true};
};

} // namespace railpath
