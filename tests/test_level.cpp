#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <string>

#include <railpath/level.hpp>

using Catch::Approx;
using namespace railpath;

namespace {

Level load_ok(const std::string& text) {
  LoadResult r = load_level(text);
  INFO(r.error.message);
  REQUIRE(r);
  return std::move(*r.level);
}

const char* kSquare = R"({
  "angleData": [0, 90, 180, 270, 0],
  "settings": {"bpm": 150, "author": "x"},
  "actions": [
    {"floor": 2, "eventType": "Twirl"},
    {"floor": 3, "eventType": "SetSpeed", "speedType": "Multiplier", "bpmMultiplier": 2},
    {"floor": 3, "eventType": "Hold", "duration": 1},
    {"floor": 4, "eventType": "SetText", "decText": "hi"},
    {"floor": 4, "eventType": "CustomThing", "payload": [1, 2]}
  ],
  "decorations": [
    {"floor": 1, "eventType": "AddDecoration", "tag": "a"},
    {"eventType": "AddText", "tag": "loose"}
  ]
})";

} // namespace

TEST_CASE("Level: query surface") {
  Level lv = load_ok(kSquare);
  REQUIRE(lv.tile_count() == 5);
  REQUIRE(lv.base_bpm() == 150.0);
  REQUIRE(lv.settings()["author"] == "x");

  const Tile* t = lv.tile_at(1);
  REQUIRE(t != nullptr);
  REQUIRE(t->relative_angle == Approx(90.0));
  REQUIRE(t->decorations.size() == 1);
  REQUIRE(lv.tile_at(5) == nullptr);

  auto p = lv.position_of(1);
  REQUIRE(p.has_value());
  REQUIRE(p->x == Approx(1.0));
  REQUIRE(p->y == Approx(1.0));
  REQUIRE_FALSE(lv.position_of(99).has_value());

  REQUIRE(lv.anchor_of(0).x == 0.0);
  REQUIRE(lv.anchor_of(2).x == Approx(1.0));
  REQUIRE(lv.anchor_of(2).y == Approx(1.0));
}

TEST_CASE("Level: action lookup by kind and tile") {
  Level lv = load_ok(kSquare);
  auto speeds = lv.actions_at(EventKind::SetSpeed, 3);
  REQUIRE(speeds.size() == 1);
  REQUIRE(speeds[0]->number_or("bpmMultiplier", 0.0) == 2.0);
  REQUIRE(speeds[0]->fields.find("floor") == speeds[0]->fields.end());

  REQUIRE(lv.actions_at(EventKind::SetSpeed, 2).empty());
  REQUIRE(lv.actions_at(EventKind::SetSpeed, 400).empty());

  auto twirls = lv.actions_of(EventKind::Twirl);
  REQUIRE(twirls.size() == 1);
  REQUIRE(twirls[0].index == 2);

  auto unknown = lv.actions_of(EventKind::Unknown);
  REQUIRE(unknown.size() == 1);
  REQUIRE(unknown[0].action->event_type == "CustomThing");
}

TEST_CASE("Level: twirls from the file drive the recurrence") {
  Level lv = load_ok(kSquare);
  REQUIRE(lv.tile_at(1)->relative_angle == Approx(90.0));
  REQUIRE(lv.tile_at(3)->relative_angle == Approx(270.0));
  REQUIRE(lv.tile_at(4)->twirl_parity == 1);
}

TEST_CASE("Level: actions without a usable floor are dropped") {
  Level lv = load_ok(R"({
    "pathData": "RRR", "settings": {},
    "actions": [
      {"floor": 1, "eventType": "Twirl"},
      {"floor": 3, "eventType": "Twirl"},
      {"floor": -1, "eventType": "Twirl"},
      {"floor": 1.5, "eventType": "Twirl"},
      {"eventType": "Twirl"},
      "not an object",
      {"floor": 2.0, "eventType": "Twirl"}
    ],
    "decorations": [{"floor": 7, "tag": "gone"}]
  })");
  auto twirls = lv.actions_of(EventKind::Twirl);
  REQUIRE(twirls.size() == 2);
  REQUIRE(twirls[0].index == 1);
  REQUIRE(twirls[1].index == 2);
  REQUIRE(lv.to_json()["decorations"].empty());
}

TEST_CASE("Level: load failures are reported, not thrown") {
  LoadResult r = load_level("{ nope");
  REQUIRE_FALSE(r);
  REQUIRE_FALSE(r.error.message.empty());

  LoadResult missing = load_level_file("/nonexistent/railpath/level.adofai");
  REQUIRE_FALSE(missing);
  REQUIRE(missing.error.message.find("cannot open") != std::string::npos);

  Json root = Json{{"pathData", "RU"}, {"settings", Json::object()}};
  LoadResult from_json = load_level_object(root);
  REQUIRE(from_json);
  REQUIRE(from_json.level->tile_count() == 2);
}

TEST_CASE("Level: append, insert and delete replay the recurrence") {
  Level lv = load_ok(R"({"pathData": "RRR", "settings": {}, "actions": [{"floor": 1, "eventType": "Twirl"}]})");

  REQUIRE_FALSE(lv.append_floor(90.0).has_value());
  REQUIRE(lv.tile_count() == 4);
  REQUIRE(lv.tile_at(3)->relative_angle == Approx(270.0)); // twirled
  REQUIRE(lv.position_of(3)->y == Approx(1.0));

  REQUIRE_FALSE(lv.insert_floor(0, 0.0).has_value());
  REQUIRE(lv.tile_count() == 5);
  auto twirls = lv.actions_of(EventKind::Twirl);
  REQUIRE(twirls.size() == 1);
  REQUIRE(twirls[0].index == 2); // shifted with its floor
  REQUIRE(lv.position_of(4)->x == Approx(4.0));

  REQUIRE_FALSE(lv.delete_floor(2).has_value());
  REQUIRE(lv.tile_count() == 4);
  REQUIRE(lv.actions_of(EventKind::Twirl).empty());
  REQUIRE(lv.tile_at(3)->relative_angle == Approx(90.0));
}

TEST_CASE("Level: out-of-range floor operations are structural errors") {
  Level lv = load_ok(R"({"pathData": "R!R", "settings": {}})");

  auto e1 = lv.insert_floor(4, 0.0);
  REQUIRE(e1.has_value());
  REQUIRE(e1->index == 4);
  REQUIRE(e1->tile_count == 3);

  auto e2 = lv.delete_floor(3);
  REQUIRE(e2.has_value());
  REQUIRE(e2->index == 3);

  // Tile 0 must never become a midspin.
  REQUIRE(lv.insert_floor(0, kMidspin).has_value());
  REQUIRE(lv.delete_floor(0).has_value());

  REQUIRE(lv.append_floor(555.0).has_value());
  REQUIRE(lv.tile_count() == 3);

  // Inserting at the end is an append.
  REQUIRE_FALSE(lv.insert_floor(3, 90.0).has_value());
  REQUIRE(lv.tile_count() == 4);
}

TEST_CASE("Level: editing an empty level") {
  Level lv = load_ok(R"({"angleData": [], "settings": {}})");
  REQUIRE(lv.tile_count() == 0);
  REQUIRE(lv.delete_floor(0).has_value());
  REQUIRE(lv.append_floor(kMidspin).has_value());
  REQUIRE_FALSE(lv.append_floor(0.0).has_value());
  REQUIRE(lv.tile_count() == 1);
  REQUIRE(lv.position_of(0)->x == Approx(1.0));
}

TEST_CASE("Level: meshes are memoized per tile") {
  Level lv = load_ok(R"({"pathData": "RU!R", "settings": {}})");
  const TrackMesh* a = lv.mesh_of(1);
  REQUIRE(a != nullptr);
  REQUIRE(a == lv.mesh_of(1));
  REQUIRE(a->vertex_count() == 94);
  REQUIRE(lv.mesh_of(2)->vertex_count() == 14);
  REQUIRE(lv.mesh_of(4) == nullptr);

  MeshConfig cfg;
  cfg.circle_resolution = 8;
  lv.set_mesh_config(cfg);
  REQUIRE(lv.mesh_of(1)->vertex_count() == 46);

  REQUIRE_FALSE(lv.delete_floor(2).has_value());
  REQUIRE(lv.mesh_of(2)->vertex_count() == 46); // R after U: curved again
}

TEST_CASE("Level: filters and decoration cleanup") {
  Level lv = load_ok(kSquare);
  lv.apply_filter(presets::kNoHolds);
  REQUIRE(lv.actions_of(EventKind::Hold).empty());
  REQUIRE(lv.actions_of(EventKind::SetSpeed).size() == 1);

  lv.clear_decorations();
  REQUIRE(lv.actions_of(EventKind::SetText).empty());
  REQUIRE(lv.actions_of(EventKind::Twirl).size() == 1);
  REQUIRE(lv.tile_at(1)->decorations.empty());
  REQUIRE(lv.to_json()["decorations"].empty());

  // Dropping the twirl changes the turning angles.
  lv.apply_filter(EventFilter{EventFilter::Mode::Include, {EventKind::SetSpeed}});
  REQUIRE(lv.actions_of(EventKind::Twirl).empty());
  REQUIRE(lv.actions_of(EventKind::Unknown).empty());
  REQUIRE(lv.tile_at(3)->relative_angle == Approx(90.0));
}

TEST_CASE("Level: export reattaches floors") {
  Level lv = load_ok(kSquare);
  const Json out = lv.to_json();
  REQUIRE(out["angleData"] == Json::array({0, 90, 180, 270, 0}));
  REQUIRE(out["settings"]["bpm"] == 150);

  const Json& actions = out["actions"];
  REQUIRE(actions.size() == 5);
  REQUIRE(actions[0].begin().key() == "floor");
  REQUIRE(actions[0]["floor"] == 2);
  REQUIRE(actions[4]["eventType"] == "CustomThing");
  REQUIRE(actions[4]["payload"] == Json::array({1, 2}));

  const Json& decos = out["decorations"];
  REQUIRE(decos.size() == 2);
  REQUIRE(decos[0]["floor"] == 1);
  REQUIRE(decos[1].find("floor") == decos[1].end());
  REQUIRE(decos[1]["tag"] == "loose");
}

TEST_CASE("Level: export text reloads to the same angles and actions") {
  Level first = load_ok(kSquare);
  const std::string text = first.export_text();
  REQUIRE(text.find("\"angleData\": [0,90,180,270,0]") != std::string::npos);
  REQUIRE(text.find("    {\"floor\": 2, \"eventType\": \"Twirl\"}") != std::string::npos);

  Level second = load_ok(text);
  REQUIRE(second.to_json()["angleData"] == first.to_json()["angleData"]);
  REQUIRE(second.to_json()["actions"] == first.to_json()["actions"]);
  REQUIRE(second.export_text() == text);
}

TEST_CASE("Level: path-code levels export as angle data") {
  Level lv = load_ok(R"({"pathData": "RpU!", "settings": {"bpm": 100}})");
  REQUIRE(lv.to_json()["angleData"] == Json::array({0, 15, 90, 999}));
}
