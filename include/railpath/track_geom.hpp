#pragma once
#include <cmath>
#include <numbers>

namespace railpath {

// Constant naming convention (kCamelCase)
inline constexpr double kPI  = std::numbers::pi_v<double>;
inline constexpr double kTAU = 2.0 * kPI;
inline constexpr double kDegToRad = kPI / 180.0;

struct Vec2 {
  double x{};
  double y{};
};

inline Vec2 operator+(Vec2 a, Vec2 b) { return {a.x + b.x, a.y + b.y}; }
inline Vec2 operator-(Vec2 a, Vec2 b) { return {a.x - b.x, a.y - b.y}; }
inline Vec2 operator*(Vec2 a, double k) { return {a.x * k, a.y * k}; }

inline double length(Vec2 v) { return std::sqrt(v.x*v.x + v.y*v.y); }
inline double distance(Vec2 a, Vec2 b) { return length(b - a); }

// Unit vector at a heading given in degrees (0 = +x, counter-clockwise).
inline Vec2 heading_vector(double heading_deg) {
  const double r = heading_deg * kDegToRad;
  return {std::cos(r), std::sin(r)};
}

// Point on a circle of radius r around c at angle a (radians).
inline Vec2 on_circle(Vec2 c, double r, double a) {
  return {c.x + r * std::cos(a), c.y + r * std::sin(a)};
}

// Floored modulo: result has the sign of y.
inline double fmod_floor(double x, double y) {
  double m = std::fmod(x, y);
  if (m != 0.0 && ((m < 0.0) != (y < 0.0))) m += y;
  return m;
}

inline double lerp(double a, double b, double t) { return a + (b - a) * t; }

inline double round_to(double v, int digits) {
  const double p = std::pow(10.0, digits);
  return std::round(v * p) / p + 0.0; // +0.0 folds -0 into 0
}

} // namespace railpath
