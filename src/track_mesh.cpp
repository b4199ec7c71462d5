#include <railpath/track_mesh.hpp>
#include <algorithm>
#include <cmath>
#include <railpath/track_geom.hpp>

namespace railpath {

namespace {

constexpr double kCurvedLimitDeg = 120.0;
constexpr double kCurvedLimit = kCurvedLimitDeg * kDegToRad;
constexpr double kMidspinBackOffset = 0.04;

struct Shade { float r, g, b; };
constexpr Shade kBlack{0.0f, 0.0f, 0.0f};
constexpr Shade kWhite{1.0f, 1.0f, 1.0f};

// Appends vertices of one shape; faces are given relative to its first vertex.
class MeshWriter {
public:
  explicit MeshWriter(TrackMesh& m) : m_(m) {}

  std::uint32_t base() const { return static_cast<std::uint32_t>(m_.vertices.size() / 3); }

  void vertex(double x, double y, Shade c) {
    m_.vertices.push_back(static_cast<float>(x));
    m_.vertices.push_back(static_cast<float>(y));
    m_.vertices.push_back(0.0f);
    m_.colors.push_back(c.r);
    m_.colors.push_back(c.g);
    m_.colors.push_back(c.b);
  }

  void tri(std::uint32_t b, std::uint32_t i0, std::uint32_t i1, std::uint32_t i2) {
    m_.faces.push_back(b + i0);
    m_.faces.push_back(b + i1);
    m_.faces.push_back(b + i2);
  }

private:
  TrackMesh& m_;
};

// Swept interval [a0, a1] in radians, taking the smaller circular difference.
// deg is the swept angle itself, kept exact for classification.
struct Sweep { double a0; double a1; double deg; };

Sweep sweep_of(double start_deg, double end_deg) {
  const double fwd = fmod_floor(end_deg - start_deg, 360.0);
  const double back = fmod_floor(start_deg - end_deg, 360.0);
  if (back >= fwd) {
    const double a0 = fmod_floor(start_deg, 360.0) * kDegToRad;
    return {a0, a0 + fwd * kDegToRad, fwd};
  }
  const double a0 = fmod_floor(end_deg, 360.0) * kDegToRad;
  return {a0, a0 + back * kDegToRad, back};
}

void add_circle(MeshWriter& w, Vec2 c, double radius, Shade col, int resolution) {
  if (resolution <= 0) resolution = 32;
  const std::uint32_t b = w.base();
  w.vertex(c.x, c.y, col);
  for (int i = 0; i < resolution; ++i) {
    const double a = kTAU * double(i) / double(resolution);
    w.vertex(c.x + std::cos(a) * radius, c.y + std::sin(a) * radius, col);
  }
  const auto res = static_cast<std::uint32_t>(resolution);
  for (std::uint32_t i = 1; i < res; ++i) w.tri(b, 0, i, i + 1);
  w.tri(b, 0, res, 1);
}

// Hex joining the chamfer fan to both rail edges.
void add_bridge(MeshWriter& w, const Sweep& s, Vec2 c, double radius, double width, Shade col) {
  const std::uint32_t b = w.base();
  w.vertex(-radius * std::sin(s.a1) + c.x, radius * std::cos(s.a1) + c.y, col);
  w.vertex(c.x, c.y, col);
  w.vertex(radius * std::sin(s.a0) + c.x, -radius * std::cos(s.a0) + c.y, col);
  w.vertex(width * std::sin(s.a0), -width * std::cos(s.a0), col);
  w.vertex(0.0, 0.0, col);
  w.vertex(-width * std::sin(s.a1), width * std::cos(s.a1), col);
  w.tri(b, 0, 1, 5);
  w.tri(b, 4, 1, 5);
  w.tri(b, 2, 3, 4);
  w.tri(b, 1, 3, 4);
}

// Quad wedge used instead of the fan once the sweep is past 120 degrees.
void add_wedge(MeshWriter& w, const Sweep& s, Vec2 c, double width, Shade col) {
  const std::uint32_t b = w.base();
  w.vertex(c.x, c.y, col);
  w.vertex(width * std::sin(s.a0), -width * std::cos(s.a0), col);
  w.vertex(0.0, 0.0, col);
  w.vertex(-width * std::sin(s.a1), width * std::cos(s.a1), col);
  w.tri(b, 0, 1, 2);
  w.tri(b, 2, 3, 0);
}

// Rectangle extruded from the origin along one heading.
void add_end_cap(MeshWriter& w, double deg, double length, double width, Shade col) {
  const double m1 = std::cos(deg * kDegToRad);
  const double m2 = std::sin(deg * kDegToRad);
  const std::uint32_t b = w.base();
  w.vertex(length * m1 + width * m2, length * m2 - width * m1, col);
  w.vertex(length * m1 - width * m2, length * m2 + width * m1, col);
  w.vertex(-width * m2, width * m1, col);
  w.vertex(width * m2, -width * m1, col);
  w.tri(b, 0, 1, 2);
  w.tri(b, 2, 3, 0);
}

void add_end_caps(MeshWriter& w, double start_deg, double end_deg,
                  double length, double width, Shade col) {
  add_end_cap(w, start_deg, length, width, col);
  add_end_cap(w, end_deg, length, width, col);
}

// Outline diamond plus inset white diamond, pushed slightly back along the heading.
void add_midspin(MeshWriter& w, double deg, const MeshConfig& cfg) {
  const double m1 = std::cos(deg * kDegToRad);
  const double m2 = std::sin(deg * kDegToRad);
  const Vec2 mid{-m1 * kMidspinBackOffset, -m2 * kMidspinBackOffset};

  auto layer = [&](double width, double length, Shade col) {
    const std::uint32_t b = w.base();
    w.vertex(mid.x + length * m1 + width * m2, mid.y + length * m2 - width * m1, col);
    w.vertex(mid.x + length * m1 - width * m2, mid.y + length * m2 + width * m1, col);
    w.vertex(mid.x - width * m2, mid.y + width * m1, col);
    w.vertex(mid.x + width * m2, mid.y - width * m1, col);
    w.vertex(mid.x - width * m1, mid.y - width * m2, col);
    w.vertex(mid.x + width * m2, mid.y - width * m1, col);
    w.vertex(mid.x - width * m2, mid.y + width * m1, col);
    w.tri(b, 0, 1, 2);
    w.tri(b, 2, 3, 0);
    w.tri(b, 4, 5, 6);
  };

  // The marker is square: its length is the rail half-width too.
  const double outer_w = cfg.rail_half_width + cfg.outline;
  const double outer_l = cfg.rail_half_width + cfg.outline;
  layer(outer_w, outer_l, kBlack);
  layer(cfg.rail_half_width - cfg.outline * 2.0, outer_l - cfg.outline * 2.0, kWhite);
}

} // namespace

MeshShape classify_tile_mesh(double incoming_deg, double outgoing_deg, bool midspin) {
  if (midspin) return MeshShape::Midspin;
  const Sweep s = sweep_of(outgoing_deg, incoming_deg);
  if (s.deg <= 0.0) return MeshShape::Hairpin;
  return s.deg <= kCurvedLimitDeg ? MeshShape::Curved : MeshShape::Wide;
}

double chamfer_scale(double a) {
  constexpr double k5  = 5.0  * kDegToRad;
  constexpr double k30 = 30.0 * kDegToRad;
  constexpr double k45 = 45.0 * kDegToRad;
  constexpr double k90 = 90.0 * kDegToRad;
  if (a < k5)  return 1.0;
  if (a < k30) return lerp(1.0, 0.83, std::sqrt((a - k5) / (k30 - k5)));
  if (a < k45) return lerp(0.83, 0.77, (a - k30) / (k45 - k30));
  if (a < k90) return lerp(0.77, 0.15, std::pow((a - k45) / (k90 - k45), 0.7));
  const double t = std::min(1.0, (a - k90) / (kCurvedLimit - k90));
  return lerp(0.15, 0.0, std::sqrt(t));
}

TrackMesh generate_track_mesh(double incoming_deg, double outgoing_deg, bool midspin,
                              const MeshConfig& cfg) {
  TrackMesh mesh;
  MeshWriter w(mesh);

  if (midspin) {
    add_midspin(w, incoming_deg, cfg);
    return mesh;
  }

  const double start_deg = outgoing_deg;
  const double end_deg = incoming_deg;
  const Sweep s = sweep_of(start_deg, end_deg);
  const double angle = s.deg * kDegToRad;
  const double mid = s.a0 + angle / 2.0;

  double width = cfg.rail_half_width;
  double length = cfg.rail_length;
  const double outline = cfg.outline;

  if (s.deg <= 0.0) {
    // Full turn back onto itself: both rails coincide, only the caps remain.
    add_end_caps(w, start_deg, end_deg, length + outline, width + outline, kBlack);
    add_end_caps(w, start_deg, end_deg, length - outline, width - outline, kWhite);
    return mesh;
  }

  if (s.deg <= kCurvedLimitDeg) {
    const double x = chamfer_scale(angle);
    double radius = width;
    double dist = 0.0;
    if (x != 1.0) {
      radius = lerp(0.0, width, x);
      dist = (width - radius) / std::sin(angle / 2.0);
    }
    Vec2 c{-dist * std::cos(mid), -dist * std::sin(mid)};

    width += outline;
    length += outline;
    radius += outline;
    add_circle(w, c, radius, kBlack, cfg.circle_resolution);
    add_bridge(w, s, c, radius, width, kBlack);
    add_end_caps(w, start_deg, end_deg, length, width, kBlack);

    width -= outline * 2.0;
    length -= outline * 2.0;
    radius -= outline * 2.0;
    if (radius < 0.0) {
      radius = 0.0;
      const double d = width / std::sin(angle / 2.0);
      c = {-d * std::cos(mid), -d * std::sin(mid)};
    }
    add_circle(w, c, radius, kWhite, cfg.circle_resolution);
    add_bridge(w, s, c, radius, width, kWhite);
    add_end_caps(w, start_deg, end_deg, length, width, kWhite);
    return mesh;
  }

  width += outline;
  length += outline;
  {
    const double d = width / std::sin(angle / 2.0);
    add_wedge(w, s, {-d * std::cos(mid), -d * std::sin(mid)}, width, kBlack);
    add_end_caps(w, start_deg, end_deg, length, width, kBlack);
  }
  width -= outline * 2.0;
  length -= outline * 2.0;
  {
    const double d = width / std::sin(angle / 2.0);
    add_wedge(w, s, {-d * std::cos(mid), -d * std::sin(mid)}, width, kWhite);
    add_end_caps(w, start_deg, end_deg, length, width, kWhite);
  }
  return mesh;
}

} // namespace railpath
