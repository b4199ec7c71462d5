#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace railpath {

struct MeshConfig {
  double rail_half_width = 0.275;
  double rail_length = 0.5;
  double outline = 0.025;
  int circle_resolution = 32; // chamfer fan segments
};

// Flat-colored geometry for one tile, in tile-local coordinates (z = 0).
// vertices and colors are xyz / rgb triples; faces is a triangle list.
struct TrackMesh {
  std::vector<float> vertices;
  std::vector<std::uint32_t> faces;
  std::vector<float> colors;

  std::size_t vertex_count() const { return vertices.size() / 3; }
  std::size_t triangle_count() const { return faces.size() / 3; }
};

// Swept angle family chosen for a pair of headings.
enum class MeshShape { Hairpin, Midspin, Curved, Wide };

MeshShape classify_tile_mesh(double incoming_deg, double outgoing_deg, bool midspin);

// Radius scale of the chamfer fan for a swept angle in radians, 1 (full
// width) at small angles down to 0 at 120 degrees.
double chamfer_scale(double swept_rad);

// Builds the outlined tile: a black outer layer, then a white inner layer
// shrunk by twice the outline thickness.
TrackMesh generate_track_mesh(double incoming_deg, double outgoing_deg, bool midspin,
                              const MeshConfig& cfg = {});

} // namespace railpath
