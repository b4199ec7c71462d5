#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <railpath/events.hpp>
#include <railpath/level_parser.hpp>
#include <railpath/tile_graph.hpp>
#include <railpath/track_mesh.hpp>

namespace railpath {

// A floor operation referenced an index outside the current tile range (or
// would leave a midspin at tile 0).
struct StructuralError {
  std::size_t index = 0;
  std::size_t tile_count = 0;
  std::string message;
};

struct IndexedAction {
  std::size_t index;
  const Action* action;
};

// A loaded level: editable floors plus the tile list derived from them.
// Every edit replays the whole angle recurrence and position pass.
class Level {
public:
  Level() = default;
  explicit Level(RawLevel raw);

  // --- Query surface
  std::size_t tile_count() const { return tiles_.size(); }
  const std::vector<Tile>& tiles() const { return tiles_; }
  const Tile* tile_at(std::size_t index) const;
  std::optional<Vec2> position_of(std::size_t index) const;

  // Where tile `index` is drawn: the end of the previous step (origin for 0).
  Vec2 anchor_of(std::size_t index) const;

  std::vector<const Action*> actions_at(EventKind kind, std::size_t index) const;
  std::vector<IndexedAction> actions_of(EventKind kind) const;

  // Memoized per tile; nullptr when index is out of range.
  const TrackMesh* mesh_of(std::size_t index) const;
  void set_mesh_config(const MeshConfig& cfg);

  const Json& settings() const { return settings_; }
  // settings.bpm if it is a positive number.
  std::optional<double> base_bpm() const;

  // --- Floor operations
  std::optional<StructuralError> append_floor(double heading);
  std::optional<StructuralError> insert_floor(std::size_t index, double heading);
  std::optional<StructuralError> delete_floor(std::size_t index);

  // --- Event cleanup
  void apply_filter(const EventFilter& filter);
  void clear_decorations();

  // --- Export
  Json to_json() const;
  std::string export_text() const;

private:
  void rebuild_();

  std::vector<Floor> floors_;
  Json settings_ = Json::object();
  std::vector<Decoration> loose_decorations_; // decorations without a floor
  std::vector<Tile> tiles_;
  MeshConfig mesh_cfg_{};
  mutable std::vector<std::optional<TrackMesh>> mesh_cache_;
};

struct LoadResult {
  std::optional<Level> level;
  ParseError error;

  explicit operator bool() const { return level.has_value(); }
};

LoadResult load_level(std::string_view text);
LoadResult load_level_object(const Json& root);

// Filesystem wrapper; an unreadable file is reported as a ParseError.
LoadResult load_level_file(const std::string& path);

} // namespace railpath
