#include <railpath/level.hpp>
#include <cmath>
#include <fstream>
#include <cstdint>
#include <sstream>
#include <railpath/level_format.hpp>
#include <railpath/log.hpp>

namespace railpath {

namespace {

// Integral, non-negative floor index, or nullopt.
std::optional<std::size_t> floor_of(const Json& obj) {
  const auto it = obj.find("floor");
  if (it == obj.end() || !it->is_number()) return std::nullopt;
  if (it->is_number_unsigned()) return it->get<std::size_t>();
  if (it->is_number_integer()) {
    const auto v = it->get<std::int64_t>();
    if (v < 0) return std::nullopt;
    return static_cast<std::size_t>(v);
  }
  const double d = it->get<double>();
  if (!std::isfinite(d) || d < 0.0 || std::floor(d) != d) return std::nullopt;
  return static_cast<std::size_t>(d);
}

Json without_floor(const Json& obj) {
  Json out = Json::object();
  for (auto it = obj.begin(); it != obj.end(); ++it) {
    if (it.key() == "floor") continue;
    out[it.key()] = it.value();
  }
  return out;
}

Json with_floor(std::size_t floor, const Json& fields) {
  Json out = Json::object();
  out["floor"] = floor;
  for (auto it = fields.begin(); it != fields.end(); ++it) out[it.key()] = it.value();
  return out;
}

Action make_action(const Json& obj) {
  Action a;
  a.fields = without_floor(obj);
  if (const auto it = a.fields.find("eventType"); it != a.fields.end() && it->is_string()) {
    a.event_type = it->get<std::string>();
    a.kind = event_kind_from_name(a.event_type);
  }
  return a;
}

Json heading_json(double h) {
  if (std::floor(h) == h && std::fabs(h) < 1e15) return Json(static_cast<std::int64_t>(h));
  return Json(h);
}

std::optional<StructuralError> check_heading(double heading, std::size_t index,
                                             std::size_t tile_count) {
  if (!std::isfinite(heading) || is_reserved_sentinel(heading)) {
    return StructuralError{index, tile_count, "heading is not a valid tile direction"};
  }
  if (index == 0 && is_midspin(heading)) {
    return StructuralError{index, tile_count, "tile 0 cannot be a midspin"};
  }
  return std::nullopt;
}

} // namespace

Level::Level(RawLevel raw)
  : settings_(std::move(raw.settings)) {
  floors_.resize(raw.headings.size());
  for (std::size_t i = 0; i < raw.headings.size(); ++i) floors_[i].heading = raw.headings[i];

  std::size_t dropped = 0;
  for (const Json& obj : raw.actions) {
    const auto floor = obj.is_object() ? floor_of(obj) : std::nullopt;
    if (!floor || *floor >= floors_.size()) { ++dropped; continue; }
    floors_[*floor].actions.push_back(make_action(obj));
  }
  if (dropped > 0) {
    RAILPATH_LOGW("level") << "dropped " << dropped << " action(s) without a valid floor";
  }

  dropped = 0;
  for (const Json& obj : raw.decorations) {
    if (!obj.is_object()) { ++dropped; continue; }
    if (obj.find("floor") == obj.end()) {
      loose_decorations_.push_back(Decoration{obj});
      continue;
    }
    const auto floor = floor_of(obj);
    if (!floor || *floor >= floors_.size()) { ++dropped; continue; }
    floors_[*floor].decorations.push_back(Decoration{without_floor(obj)});
  }
  if (dropped > 0) {
    RAILPATH_LOGW("level") << "dropped " << dropped << " decoration(s) without a valid floor";
  }

  rebuild_();
}

void Level::rebuild_() {
  tiles_ = build_tiles(floors_);
  mesh_cache_.assign(tiles_.size(), std::nullopt);
}

const Tile* Level::tile_at(std::size_t index) const {
  if (index >= tiles_.size()) return nullptr;
  return &tiles_[index];
}

std::optional<Vec2> Level::position_of(std::size_t index) const {
  if (index >= tiles_.size()) return std::nullopt;
  return tiles_[index].position;
}

Vec2 Level::anchor_of(std::size_t index) const {
  if (index == 0 || index > tiles_.size()) return {0.0, 0.0};
  return tiles_[index-1].position;
}

std::vector<const Action*> Level::actions_at(EventKind kind, std::size_t index) const {
  std::vector<const Action*> out;
  if (index >= tiles_.size()) return out;
  for (const Action& a : tiles_[index].actions) {
    if (a.kind == kind) out.push_back(&a);
  }
  return out;
}

std::vector<IndexedAction> Level::actions_of(EventKind kind) const {
  std::vector<IndexedAction> out;
  for (const Tile& t : tiles_) {
    for (const Action& a : t.actions) {
      if (a.kind == kind) out.push_back({t.index, &a});
    }
  }
  return out;
}

const TrackMesh* Level::mesh_of(std::size_t index) const {
  if (index >= tiles_.size()) return nullptr;
  auto& slot = mesh_cache_[index];
  if (!slot) {
    const Tile& t = tiles_[index];
    slot = generate_track_mesh(t.incoming_heading, t.outgoing_heading, t.midspin(), mesh_cfg_);
  }
  return &*slot;
}

void Level::set_mesh_config(const MeshConfig& cfg) {
  mesh_cfg_ = cfg;
  mesh_cache_.assign(tiles_.size(), std::nullopt);
}

std::optional<double> Level::base_bpm() const {
  const auto it = settings_.find("bpm");
  if (it == settings_.end() || !it->is_number()) return std::nullopt;
  const double bpm = it->get<double>();
  if (!std::isfinite(bpm) || bpm <= 0.0) return std::nullopt;
  return bpm;
}

std::optional<StructuralError> Level::append_floor(double heading) {
  return insert_floor(floors_.size(), heading);
}

std::optional<StructuralError> Level::insert_floor(std::size_t index, double heading) {
  const std::size_t n = floors_.size();
  if (index > n) {
    return StructuralError{index, n, "insert position is past the end of the level"};
  }
  if (auto err = check_heading(heading, index, n)) return err;

  Floor f;
  f.heading = heading;
  floors_.insert(floors_.begin() + static_cast<std::ptrdiff_t>(index), std::move(f));
  rebuild_();
  RAILPATH_LOGD("level") << "inserted floor " << index << " (" << tiles_.size() << " tiles)";
  return std::nullopt;
}

std::optional<StructuralError> Level::delete_floor(std::size_t index) {
  const std::size_t n = floors_.size();
  if (index >= n) {
    return StructuralError{index, n, "no floor at this index"};
  }
  if (index == 0 && n > 1 && is_midspin(floors_[1].heading)) {
    return StructuralError{index, n, "deleting tile 0 would leave a midspin first"};
  }

  floors_.erase(floors_.begin() + static_cast<std::ptrdiff_t>(index));
  rebuild_();
  RAILPATH_LOGD("level") << "deleted floor " << index << " (" << tiles_.size() << " tiles)";
  return std::nullopt;
}

void Level::apply_filter(const EventFilter& filter) {
  std::size_t removed = 0;
  for (Floor& f : floors_) {
    const auto before = f.actions.size();
    std::erase_if(f.actions, [&](const Action& a){ return !filter.keeps(a.kind); });
    removed += before - f.actions.size();
  }
  RAILPATH_LOGI("level") << "filter removed " << removed << " action(s)";
  rebuild_();
}

void Level::clear_decorations() {
  loose_decorations_.clear();
  for (Floor& f : floors_) {
    f.decorations.clear();
    std::erase_if(f.actions, [](const Action& a){
      return presets::kDecorationActions.contains(a.kind);
    });
  }
  rebuild_();
}

Json Level::to_json() const {
  Json root = Json::object();

  Json angles = Json::array();
  for (const Floor& f : floors_) angles.push_back(heading_json(f.heading));
  root["angleData"] = std::move(angles);
  root["settings"] = settings_;

  Json actions = Json::array();
  Json decorations = Json::array();
  for (std::size_t i = 0; i < floors_.size(); ++i) {
    for (const Action& a : floors_[i].actions) actions.push_back(with_floor(i, a.fields));
    for (const Decoration& d : floors_[i].decorations) decorations.push_back(with_floor(i, d.fields));
  }
  for (const Decoration& d : loose_decorations_) decorations.push_back(d.fields);
  root["actions"] = std::move(actions);
  root["decorations"] = std::move(decorations);
  return root;
}

std::string Level::export_text() const {
  return format_level_json(to_json());
}

LoadResult load_level(std::string_view text) {
  LoadResult out;
  auto raw = parse_level_text(text, out.error);
  if (!raw) {
    RAILPATH_LOGE("level") << "load failed: " << out.error.message;
    return out;
  }
  out.level.emplace(std::move(*raw));
  RAILPATH_LOGI("level") << "loaded " << out.level->tile_count() << " tiles";
  return out;
}

LoadResult load_level_object(const Json& root) {
  LoadResult out;
  auto raw = parse_level_object(root, out.error);
  if (!raw) {
    RAILPATH_LOGE("level") << "load failed: " << out.error.message;
    return out;
  }
  out.level.emplace(std::move(*raw));
  return out;
}

LoadResult load_level_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    LoadResult out;
    out.error.message = "cannot open " + path;
    RAILPATH_LOGE("level") << out.error.message;
    return out;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return load_level(ss.str());
}

} // namespace railpath
