#include <raylib.h>
#include <cmath>
#include <cstddef>

#include <railpath/viewer/app.hpp>
#include <railpath/level.hpp>
#include <railpath/orbit.hpp>

namespace railpath {

namespace {

static Color toColor(float r, float g, float b, unsigned char a = 255) {
  auto c8 = [](float v){ return static_cast<unsigned char>(std::lround(std::fmin(1.0f, std::fmax(0.0f, v)) * 255.0f)); };
  return Color{c8(r), c8(g), c8(b), a};
}

// raylib culls clockwise triangles; the y flip in worldToScreen_ reverses winding.
static void draw_triangle_any_winding(Vector2 a, Vector2 b, Vector2 c, Color col) {
  const float cross = (b.x - a.x) * (c.y - a.y) - (b.y - a.y) * (c.x - a.x);
  if (cross < 0.0f) DrawTriangle(a, b, c, col);
  else              DrawTriangle(a, c, b, col);
}

} // namespace

// ---- ViewerApp ----

ViewerApp::ViewerApp(const Level& level, OrbitSimulator& sim) : level_(level), sim_(sim) {}

ViewerApp::Vec2f ViewerApp::worldToScreen_(double x, double y) const {
  const float cx = GetScreenWidth()  * 0.5f - pan_x_ * scale_px_per_unit_;
  const float cy = GetScreenHeight() * 0.5f + pan_y_ * scale_px_per_unit_;
  return { cx + float(x * scale_px_per_unit_), cy - float(y * scale_px_per_unit_) };
}

bool ViewerApp::on_screen_(Vec2 world, float margin_px) const {
  const auto p = worldToScreen_(world.x, world.y);
  return p.x > -margin_px && p.y > -margin_px &&
         p.x < GetScreenWidth() + margin_px && p.y < GetScreenHeight() + margin_px;
}

int ViewerApp::run() {
  const int W = 1280, H = 800;
  InitWindow(W, H, "railpath - Viewer");
  SetExitKey(KEY_Q); // Escape returns to Holding instead
  SetTargetFPS(144);

  while (!WindowShouldClose()) {
    process_input_();
    advance_(GetFrameTime());
    render_frame_();
  }

  CloseWindow();
  return 0;
}

void ViewerApp::process_input_() {
  if (IsKeyPressed(KEY_SPACE)) {
    if (sim_.playback() == Playback::Holding) sim_.set_playback(Playback::Playing);
    else sim_.set_playback(Playback::Holding);
  }
  if (IsKeyPressed(KEY_ESCAPE)) sim_.set_playback(Playback::Holding);

  // Zoom
  if (IsKeyDown(KEY_W) || IsKeyDown(KEY_KP_ADD))      scale_px_per_unit_ *= 1.01f;
  if (IsKeyDown(KEY_S) || IsKeyDown(KEY_KP_SUBTRACT)) scale_px_per_unit_ *= 0.99f;

  // Camera pan; any manual pan stops following the center marker
  const float pan_step = 6.0f / scale_px_per_unit_;
  if (IsKeyDown(KEY_LEFT))  { pan_x_ -= pan_step; follow_ = false; }
  if (IsKeyDown(KEY_RIGHT)) { pan_x_ += pan_step; follow_ = false; }
  if (IsKeyDown(KEY_UP))    { pan_y_ += pan_step; follow_ = false; }
  if (IsKeyDown(KEY_DOWN))  { pan_y_ -= pan_step; follow_ = false; }
  if (IsKeyPressed(KEY_C))  follow_ = true;
}

void ViewerApp::advance_(float frame_seconds) {
  sim_.step(static_cast<double>(frame_seconds) * 1000.0);

  if (!follow_) return;
  if (const auto c = sim_.center_marker()) {
    const Vec2 p = sim_.markers()[*c].position;
    pan_x_ = float(p.x);
    pan_y_ = float(p.y);
  }
}

void ViewerApp::render_frame_() {
  BeginDrawing();
  ClearBackground(Color{18, 18, 24, 255});

  draw_tiles_();
  draw_markers_();
  draw_hud_();
  EndDrawing();
}

void ViewerApp::draw_tiles_() {
  const float margin = 2.0f * scale_px_per_unit_;
  for (std::size_t i = 0; i < level_.tile_count(); ++i) {
    const Vec2 anchor = level_.anchor_of(i);
    if (!on_screen_(anchor, margin)) continue;
    const TrackMesh* mesh = level_.mesh_of(i);
    if (mesh == nullptr) continue;

    const auto& v = mesh->vertices;
    const auto& col = mesh->colors;
    for (std::size_t f = 0; f + 2 < mesh->faces.size(); f += 3) {
      Vector2 pts[3];
      for (int k = 0; k < 3; ++k) {
        const std::size_t vi = mesh->faces[f + k];
        const auto s = worldToScreen_(anchor.x + v[vi*3], anchor.y + v[vi*3 + 1]);
        pts[k] = {s.x, s.y};
      }
      const std::size_t c0 = mesh->faces[f] * 3;
      draw_triangle_any_winding(pts[0], pts[1], pts[2], toColor(col[c0], col[c0+1], col[c0+2]));
    }
  }
}

void ViewerApp::draw_markers_() {
  const auto& markers = sim_.markers();
  for (const auto& m : markers) {
    const Color c = toColor(m.color.r, m.color.g, m.color.b);
    if (const auto* trail = sim_.trail(m.id)) {
      const float n = float(trail->size());
      float k = 0.0f;
      for (const auto& p : *trail) {
        const auto s = worldToScreen_(p.position.x, p.position.y);
        const unsigned char a = static_cast<unsigned char>(200.0f * (k + 1.0f) / n);
        DrawCircleV({s.x, s.y}, 0.08f * scale_px_per_unit_, Color{c.r, c.g, c.b, a});
        k += 1.0f;
      }
    }
    const auto s = worldToScreen_(m.position.x, m.position.y);
    DrawCircleV({s.x, s.y}, 0.3f * scale_px_per_unit_, c);
    if (m.is_center) DrawCircleLines(int(s.x), int(s.y), 0.36f * scale_px_per_unit_, RAYWHITE);
  }
}

void ViewerApp::draw_hud_() {
  const bool playing = sim_.playback() == Playback::Playing;
  DrawText(TextFormat("tiles=%d  %s  bpm=%.1f  tile=%d  crossings=%d  spin=%s",
                      (int)level_.tile_count(),
                      playing ? "Playing" : "Holding",
                      playing ? sim_.bpm() : (level_.base_bpm() ? *level_.base_bpm() : 0.0),
                      (int)sim_.center_tile_index(),
                      (int)sim_.crossing_count(),
                      sim_.spin_direction() > 0 ? "cw" : "ccw"),
           20, 20, 20, Color{220,225,235,255});

  DrawText("Space: Play/Hold | Esc: Hold | W/S or +/-: Zoom | Arrows: Pan | C: Follow | Q: Quit",
           20, 46, 14, Color{170,180,195,255});
}

} // namespace railpath
