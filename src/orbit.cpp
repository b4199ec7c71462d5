#include <railpath/orbit.hpp>
#include <algorithm>
#include <cmath>
#include <string>
#include <railpath/level.hpp>
#include <railpath/log.hpp>

namespace railpath {

static Rgb hsl_to_rgb(double h, double s, double l) {
  auto channel = [&](double n) {
    const double k = fmod_floor(n + h * 12.0, 12.0);
    const double a = s * std::min(l, 1.0 - l);
    return static_cast<float>(l - a * std::max(-1.0, std::min({k - 3.0, 9.0 - k, 1.0})));
  };
  return {channel(0.0), channel(8.0), channel(4.0)};
}

Rgb marker_color(std::size_t index, std::size_t count) {
  if (index == 0) return {1.0f, 0.0f, 0.0f};
  if (index == 1) return {0.0f, 0.0f, 1.0f};
  const double hue = fmod_floor(static_cast<double>(index) * 360.0 / static_cast<double>(count), 360.0);
  return hsl_to_rgb(hue / 360.0, 1.0, 0.5);
}

OrbitSimulator::OrbitSimulator(const Level& level, OrbitConfig cfg)
  : level_(level), cfg_(cfg) {
  if (cfg_.marker_count < 2) cfg_.marker_count = 2;
  if (!(cfg_.max_substep_ms > 0.0)) cfg_.max_substep_ms = 1000.0 / 240.0;
  if (!(cfg_.max_step_ms >= cfg_.max_substep_ms)) cfg_.max_step_ms = std::max(1000.0, cfg_.max_substep_ms);
}

bool OrbitSimulator::set_playback(Playback p) {
  if (p == Playback::Holding) {
    if (state_) {
      RAILPATH_LOGI("orbit") << "holding after " << state_->crossings << " crossing(s)";
    }
    state_.reset();
    return true;
  }
  if (state_) return true;
  if (level_.tile_count() < 2) {
    RAILPATH_LOGW("orbit") << "cannot play a level with " << level_.tile_count() << " tile(s)";
    return false;
  }
  start_();
  RAILPATH_LOGI("orbit") << "playing at " << state_->bpm << " bpm";
  return true;
}

void OrbitSimulator::start_() {
  State s;
  if (auto bpm = level_.base_bpm()) {
    s.bpm = *bpm;
  } else {
    RAILPATH_LOGW("orbit") << "settings.bpm missing or invalid, using " << cfg_.default_bpm;
    s.bpm = cfg_.default_bpm;
  }

  const Vec2 p0 = level_.tiles()[0].position;
  const Vec2 p1 = level_.tiles()[1].position;
  const std::size_t n = cfg_.marker_count;
  s.markers.resize(n);
  s.trails.resize(n);
  for (std::size_t i = 0; i < n; ++i) {
    OrbitMarker& m = s.markers[i];
    m.id = i;
    m.is_center = (i == 0);
    m.color = marker_color(i, n);
    if (i == 0) {
      m.angle = 0.0;
      m.position = p0;
    } else if (i == 1) {
      m.angle = kPI;
      m.position = p1;
    } else {
      m.angle = kPI + kTAU * static_cast<double>(i - 1) / static_cast<double>(n - 1);
      m.position = on_circle(p0, cfg_.radius, m.angle);
    }
  }
  state_ = std::move(s);
}

double OrbitSimulator::angular_velocity() const {
  if (!state_ || !(state_->bpm > 0.0)) return 0.0;
  return kTAU / (60000.0 / state_->bpm) * static_cast<double>(state_->spin);
}

const std::vector<OrbitMarker>& OrbitSimulator::markers() const {
  static const std::vector<OrbitMarker> kNone;
  return state_ ? state_->markers : kNone;
}

std::optional<std::size_t> OrbitSimulator::center_marker() const {
  if (!state_) return std::nullopt;
  return state_->center;
}

const std::deque<TrailPoint>* OrbitSimulator::trail(std::size_t marker_id) const {
  if (!state_ || marker_id >= state_->trails.size()) return nullptr;
  return &state_->trails[marker_id];
}

void OrbitSimulator::step(double dt_ms) {
  if (!state_ || !(dt_ms > 0.0) || !std::isfinite(dt_ms)) return;
  if (dt_ms > cfg_.max_step_ms) {
    RAILPATH_LOGW("orbit") << "step of " << dt_ms << " ms clamped to " << cfg_.max_step_ms << " ms";
    dt_ms = cfg_.max_step_ms;
  }
  double left = dt_ms;
  while (left > 0.0) {
    const double dt = std::min(left, cfg_.max_substep_ms);
    substep_(dt);
    left -= dt;
  }
  record_trails_();
}

void OrbitSimulator::substep_(double dt_ms) {
  State& s = *state_;
  s.time_ms += dt_ms;

  const double delta = angular_velocity() * dt_ms;
  const Vec2 c = s.markers[s.center].position;
  for (OrbitMarker& m : s.markers) {
    if (m.is_center) continue;
    m.angle += delta;
    m.position = on_circle(c, cfg_.radius, m.angle);
  }

  for (std::size_t i = 0; i < s.markers.size(); ++i) {
    if (s.markers[i].is_center) continue;
    if (try_cross_(i)) break; // one crossing per substep
  }
}

bool OrbitSimulator::try_cross_(std::size_t marker) {
  State& s = *state_;
  const std::size_t next = s.center_tile + 1;
  const auto target = level_.position_of(next);
  if (!target) return false;
  if (distance(s.markers[marker].position, *target) >= cfg_.crossing_distance) return false;

  s.markers[s.center].is_center = false;
  s.center = marker;
  s.markers[marker].is_center = true;
  s.markers[marker].position = *target;
  s.center_tile = next;
  ++s.crossings;
  RAILPATH_LOGD("orbit") << "marker " << marker << " crossed onto tile " << next;

  apply_tile_effects_(next);
  rebase_();
  return true;
}

void OrbitSimulator::apply_tile_effects_(std::size_t tile) {
  State& s = *state_;

  if (const auto pauses = level_.actions_at(EventKind::Pause, tile); !pauses.empty()) {
    const double beats = pauses.front()->number_or("duration", 0.0);
    const double extra = (beats / 2.0) * kTAU * static_cast<double>(s.spin);
    const Vec2 c = s.markers[s.center].position;
    for (OrbitMarker& m : s.markers) {
      if (m.is_center) continue;
      const Vec2 d = m.position - c;
      m.position = on_circle(c, length(d), std::atan2(d.y, d.x) + extra);
    }
  }

  if (const auto speeds = level_.actions_at(EventKind::SetSpeed, tile); !speeds.empty()) {
    const Action& a = *speeds.front();
    const std::string type = a.string_or("speedType", "Bpm");
    double bpm = s.bpm;
    bool known = true;
    if (type == "Multiplier") bpm *= a.number_or("bpmMultiplier", 1.0);
    else if (type == "Bpm") bpm = a.number_or("beatsPerMinute", s.bpm);
    else known = false;

    if (!known) {
      RAILPATH_LOGW("orbit") << "ignoring SetSpeed on tile " << tile << " (speedType '" << type << "')";
    } else if (std::isfinite(bpm) && bpm > 0.0) {
      s.bpm = bpm;
    } else {
      RAILPATH_LOGW("orbit") << "ignoring SetSpeed on tile " << tile << " (bpm " << bpm << ")";
    }
  }

  if (!level_.actions_at(EventKind::Twirl, tile).empty()) s.spin = -s.spin;
}

void OrbitSimulator::rebase_() {
  State& s = *state_;
  const Vec2 c = s.markers[s.center].position;
  for (OrbitMarker& m : s.markers) {
    if (m.is_center) continue;
    m.angle = std::atan2(m.position.y - c.y, m.position.x - c.x);
  }
}

void OrbitSimulator::record_trails_() {
  State& s = *state_;
  for (std::size_t i = 0; i < s.markers.size(); ++i) {
    auto& trail = s.trails[i];
    trail.push_back({s.time_ms, s.markers[i].position});
    while (!trail.empty() && s.time_ms - trail.front().time_ms >= cfg_.trail_window_ms) {
      trail.pop_front();
    }
  }
}

} // namespace railpath
