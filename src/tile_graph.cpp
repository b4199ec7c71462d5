#include <railpath/tile_graph.hpp>
#include <algorithm>

namespace railpath {

double Action::number_or(const char* key, double fallback) const {
  const auto it = fields.find(key);
  if (it == fields.end() || !it->is_number()) return fallback;
  return it->get<double>();
}

std::string Action::string_or(const char* key, const std::string& fallback) const {
  const auto it = fields.find(key);
  if (it == fields.end() || !it->is_string()) return fallback;
  return it->get<std::string>();
}

static std::size_t count_kind(const std::vector<Action>& actions, EventKind kind) {
  return static_cast<std::size_t>(std::count_if(actions.begin(), actions.end(),
    [kind](const Action& a){ return a.kind == kind; }));
}

AngleStep advance_angle(const AngleState& state, std::size_t index,
                        double heading, double prev_heading,
                        std::size_t twirls_here) {
  AngleStep out;
  out.next = state;
  if (index == 0) out.next.angle_dir = 180.0;

  if (is_midspin(heading)) {
    // Midspins neither read nor advance the twirl count.
    out.next.angle_dir = prev_heading;
    out.relative_angle = 0.0;
    out.twirl_parity = static_cast<int>(out.next.twirl_count % 2);
    return out;
  }

  out.next.twirl_count += twirls_here;
  out.twirl_parity = static_cast<int>(out.next.twirl_count % 2);

  const double diff = fmod_floor(out.next.angle_dir - heading, 360.0);
  double rel = (out.twirl_parity == 0) ? diff : 360.0 - diff;
  if (rel <= 0.0 || rel > 360.0) rel = 360.0; // a tile always subtends positive arc
  out.relative_angle = rel;
  out.next.angle_dir = heading + 180.0;
  return out;
}

std::vector<Tile> build_tiles(const std::vector<Floor>& floors) {
  std::vector<Tile> tiles;
  tiles.reserve(floors.size());

  AngleState state{};
  for (std::size_t i = 0; i < floors.size(); ++i) {
    const Floor& f = floors[i];
    const double prev = (i == 0) ? 0.0 : floors[i-1].heading;
    const AngleStep step = advance_angle(state, i, f.heading, prev,
                                         count_kind(f.actions, EventKind::Twirl));
    state = step.next;

    Tile t;
    t.index = i;
    t.raw_heading = f.heading;
    t.direction = (is_midspin(f.heading) && i > 0) ? tiles[i-1].direction : f.heading;
    t.relative_angle = step.relative_angle;
    t.twirl_parity = step.twirl_parity;
    t.actions = f.actions;
    t.decorations = f.decorations;
    tiles.push_back(std::move(t));
  }

  resolve_positions(tiles);
  return tiles;
}

void resolve_positions(std::vector<Tile>& tiles) {
  const std::size_t n = tiles.size();
  if (n == 0) return;

  // Step headings: a midspin walks back the way the previous step came.
  std::vector<double> step(n);
  for (std::size_t i = 0; i < n; ++i) {
    step[i] = (tiles[i].midspin() && i > 0) ? step[i-1] + 180.0 : tiles[i].raw_heading;
  }
  const double closing = step[n-1] + 180.0;

  Vec2 cursor{0.0, 0.0};
  for (std::size_t i = 0; i <= n; ++i) {
    const double heading = (i == n) ? step[n-1] : step[i];

    if (i < n) {
      for (const Action& a : tiles[i].actions) {
        if (a.kind != EventKind::PositionTrack) continue;
        const auto off = a.fields.find("positionOffset");
        if (off == a.fields.end() || !off->is_array()) continue;
        const auto eo = a.fields.find("editorOnly");
        const bool editor_only = eo != a.fields.end() &&
          ((eo->is_boolean() && eo->get<bool>()) ||
           (eo->is_string() && eo->get<std::string>() == "Enabled"));
        if (!editor_only) {
          if (off->size() > 0 && (*off)[0].is_number()) cursor.x += (*off)[0].get<double>();
          if (off->size() > 1 && (*off)[1].is_number()) cursor.y += (*off)[1].get<double>();
        }
        break; // first PositionTrack on the floor only
      }
    }

    cursor = cursor + heading_vector(heading);

    if (i < n) {
      Tile& t = tiles[i];
      t.position = {round_to(cursor.x, 8), round_to(cursor.y, 8)};
      t.incoming_heading = heading;
      t.outgoing_heading = ((i == 0) ? 0.0 : step[i-1]) - 180.0;
      t.closing_heading = closing;
    }
  }
}

} // namespace railpath
