#pragma once
#include <cstddef>
#include <deque>
#include <optional>
#include <vector>
#include <railpath/track_geom.hpp>

namespace railpath {

class Level;

enum class Playback { Holding, Playing };

struct Rgb {
  float r = 0.0f;
  float g = 0.0f;
  float b = 0.0f;
};

struct OrbitMarker {
  std::size_t id = 0;
  double angle = 0.0;      // radians, relative to the center marker
  bool is_center = false;
  Rgb color{};
  Vec2 position{};
};

struct TrailPoint {
  double time_ms = 0.0;
  Vec2 position{};
};

struct OrbitConfig {
  std::size_t marker_count = 2;
  double radius = 3.0;
  double crossing_distance = 0.5;
  double default_bpm = 120.0;          // used when settings.bpm is missing
  double max_substep_ms = 1000.0 / 240.0;
  double max_step_ms = 1000.0;         // longer step() calls are clamped
  double trail_window_ms = 500.0;
};

// Marker 0 red, marker 1 blue, the rest spread around the hue circle.
Rgb marker_color(std::size_t index, std::size_t count);

// Markers orbiting the current center tile. Externally clocked: nothing moves
// unless step() is called. The level must outlive the simulator.
class OrbitSimulator {
public:
  explicit OrbitSimulator(const Level& level, OrbitConfig cfg = {});

  // Holding->Playing needs at least two tiles; returns false otherwise.
  bool set_playback(Playback p);
  Playback playback() const { return state_ ? Playback::Playing : Playback::Holding; }

  void step(double dt_ms);

  // Empty while Holding.
  const std::vector<OrbitMarker>& markers() const;
  std::optional<std::size_t> center_marker() const;
  std::size_t center_tile_index() const { return state_ ? state_->center_tile : 0; }
  double bpm() const { return state_ ? state_->bpm : 0.0; }
  int spin_direction() const { return state_ ? state_->spin : 1; }
  // Signed, radians per millisecond.
  double angular_velocity() const;
  std::size_t crossing_count() const { return state_ ? state_->crossings : 0; }
  double elapsed_ms() const { return state_ ? state_->time_ms : 0.0; }

  // nullptr for an unknown marker or while Holding.
  const std::deque<TrailPoint>* trail(std::size_t marker_id) const;

  const OrbitConfig& config() const { return cfg_; }

private:
  struct State {
    int spin = 1;
    double bpm = 120.0;
    std::size_t center_tile = 0;
    std::size_t center = 0;   // marker index
    std::size_t crossings = 0;
    double time_ms = 0.0;
    std::vector<OrbitMarker> markers;
    std::vector<std::deque<TrailPoint>> trails;
  };

  void start_();
  void substep_(double dt_ms);
  bool try_cross_(std::size_t marker);
  void apply_tile_effects_(std::size_t tile);
  void rebase_();
  void record_trails_();

  const Level& level_;
  OrbitConfig cfg_;
  std::optional<State> state_;
};

} // namespace railpath
