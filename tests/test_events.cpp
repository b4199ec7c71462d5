#include <catch2/catch_test_macros.hpp>
#include <string>

#include <railpath/events.hpp>

using namespace railpath;

TEST_CASE("Event kinds map to and from their names") {
  REQUIRE(event_kind_from_name("Twirl") == EventKind::Twirl);
  REQUIRE(event_kind_from_name("SetSpeed") == EventKind::SetSpeed);
  REQUIRE(event_kind_from_name("PositionTrack") == EventKind::PositionTrack);
  REQUIRE(event_kind_name(EventKind::MoveCamera) == "MoveCamera");

  REQUIRE(event_kind_from_name("NotAnEvent") == EventKind::Unknown);
  REQUIRE(event_kind_from_name("twirl") == EventKind::Unknown);
  REQUIRE(event_kind_name(EventKind::Unknown).empty());
}

TEST_CASE("Every known kind has a distinct name") {
  for (std::size_t i = 1; i < kEventKindCount; ++i) {
    const auto kind = static_cast<EventKind>(i);
    const auto name = event_kind_name(kind);
    REQUIRE_FALSE(name.empty());
    REQUIRE(event_kind_from_name(name) == kind);
  }
}

TEST_CASE("EventKindSet is usable at compile time") {
  constexpr EventKindSet s{EventKind::Pause, EventKind::Twirl, EventKind::Pause};
  STATIC_REQUIRE(s.size() == 2);
  STATIC_REQUIRE(s.contains(EventKind::Twirl));
  STATIC_REQUIRE_FALSE(s.contains(EventKind::SetSpeed));
  STATIC_REQUIRE(EventKindSet{}.empty());

  EventKindSet t;
  t.insert(EventKind::Bookmark);
  REQUIRE(t.contains(EventKind::Bookmark));
  REQUIRE(t.size() == 1);
}

TEST_CASE("Filter presets keep gameplay timing") {
  STATIC_REQUIRE_FALSE(presets::kNoHolds.keeps(EventKind::Hold));
  STATIC_REQUIRE(presets::kNoHolds.keeps(EventKind::Twirl));
  STATIC_REQUIRE_FALSE(presets::kNoMoveCamera.keeps(EventKind::MoveCamera));
  STATIC_REQUIRE_FALSE(presets::kNoEffect.keeps(EventKind::Flash));
  STATIC_REQUIRE(presets::kNoEffect.keeps(EventKind::MoveCamera));

  const auto& full = presets::kNoEffectCompletely;
  REQUIRE(full.keeps(EventKind::SetSpeed));
  REQUIRE(full.keeps(EventKind::Twirl));
  REQUIRE(full.keeps(EventKind::Pause));
  REQUIRE(full.keeps(EventKind::MultiPlanet));
  REQUIRE(full.keeps(EventKind::FreeRoam));
  REQUIRE_FALSE(full.keeps(EventKind::PositionTrack));
  REQUIRE_FALSE(full.keeps(EventKind::Hold));
  REQUIRE_FALSE(full.keeps(EventKind::EditorComment));
  // Unrecognized events are not named by any preset and survive it.
  REQUIRE(full.keeps(EventKind::Unknown));
}

TEST_CASE("Include filters keep only the listed kinds") {
  constexpr EventFilter only_speed{EventFilter::Mode::Include, {EventKind::SetSpeed}};
  STATIC_REQUIRE(only_speed.keeps(EventKind::SetSpeed));
  STATIC_REQUIRE_FALSE(only_speed.keeps(EventKind::Twirl));
  STATIC_REQUIRE_FALSE(only_speed.keeps(EventKind::Unknown));
}
