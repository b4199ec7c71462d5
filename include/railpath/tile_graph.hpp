#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <railpath/events.hpp>
#include <railpath/heading.hpp>
#include <railpath/track_geom.hpp>

namespace railpath {

using Json = nlohmann::ordered_json;

// One event attached to a tile. fields is the object as written in the file
// minus its "floor" key; the floor is implicit from the owning tile.
struct Action {
  EventKind kind = EventKind::Unknown;
  std::string event_type;
  Json fields = Json::object();

  double number_or(const char* key, double fallback) const;
  std::string string_or(const char* key, const std::string& fallback) const;
};

struct Decoration {
  Json fields = Json::object(); // without "floor"
};

// Editable source record for one tile.
struct Floor {
  double heading = 0.0; // degrees, or kMidspin
  std::vector<Action> actions;
  std::vector<Decoration> decorations;
};

struct Tile {
  std::size_t index = 0;
  double raw_heading = 0.0;     // as stored (kMidspin for midspins)
  double direction = 0.0;       // midspins inherit the predecessor's direction
  double relative_angle = 0.0;  // (0, 360] except midspins (0)
  int twirl_parity = 0;         // 0 or 1
  Vec2 position{};              // rounded to 8 decimals
  double incoming_heading = 0.0;
  double outgoing_heading = 0.0;
  double closing_heading = 0.0;
  std::vector<Action> actions;
  std::vector<Decoration> decorations;

  bool midspin() const { return is_midspin(raw_heading); }
};

// Accumulator threaded through the angle recurrence.
struct AngleState {
  double angle_dir = 180.0;      // absolute reference heading (degrees)
  std::size_t twirl_count = 0;   // Twirl actions seen so far
};

struct AngleStep {
  AngleState next;
  double relative_angle = 0.0;
  int twirl_parity = 0;
};

// One step of the recurrence for tile `index`. prev_heading is the raw
// heading of tile index-1 (ignored for index 0); twirls_here is the number of
// Twirl actions on this tile.
AngleStep advance_angle(const AngleState& state, std::size_t index,
                        double heading, double prev_heading,
                        std::size_t twirls_here);

// Full replay from tile 0: angles, parity, action/decoration copies, then
// positions. Floors must not start with a midspin.
std::vector<Tile> build_tiles(const std::vector<Floor>& floors);

// Position pass over an already-angled tile list (N tiles, N+1 steps).
void resolve_positions(std::vector<Tile>& tiles);

} // namespace railpath
