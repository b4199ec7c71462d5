#pragma once
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string_view>

namespace railpath {

// Every event type the level format defines. Anything else in a file maps to
// Unknown and is carried through untouched.
enum class EventKind : std::uint8_t {
  Unknown = 0,
  SetSpeed, Twirl, Pause, Hold, SetHoldSound, Checkpoint,
  SetHitsound, PlaySound, SetPlanetRotation, ScalePlanets, MultiPlanet,
  FreeRoam, FreeRoamTwirl, FreeRoamRemove, AutoPlayTiles, Hide,
  ScaleMargin, ScaleRadius,
  ColorTrack, AnimateTrack, RecolorTrack, MoveTrack, PositionTrack,
  AddDecoration, AddText, AddObject, MoveDecorations, SetText, SetObject,
  SetDefaultText, CustomBackground,
  Flash, MoveCamera, SetFilter, SetFilterAdvanced, HallOfMirrors,
  ShakeScreen, Bloom, ScreenTile, ScreenScroll, SetFrameRate,
  RepeatEvents, SetConditionalEvents, EditorComment, Bookmark,
  Count
};

inline constexpr std::size_t kEventKindCount = static_cast<std::size_t>(EventKind::Count);
static_assert(kEventKindCount <= 64, "EventKindSet stores kinds in a 64-bit mask");

EventKind event_kind_from_name(std::string_view name);
std::string_view event_kind_name(EventKind kind); // "" for Unknown

// Fixed-size set of kinds, usable in constant expressions.
class EventKindSet {
public:
  constexpr EventKindSet() = default;
  constexpr EventKindSet(std::initializer_list<EventKind> kinds) {
    for (EventKind k : kinds) bits_ |= bit_(k);
  }

  constexpr bool contains(EventKind k) const { return (bits_ & bit_(k)) != 0; }
  constexpr void insert(EventKind k) { bits_ |= bit_(k); }
  constexpr bool empty() const { return bits_ == 0; }
  constexpr std::size_t size() const {
    std::size_t n = 0;
    for (std::uint64_t b = bits_; b != 0; b &= b - 1) ++n;
    return n;
  }

private:
  static constexpr std::uint64_t bit_(EventKind k) {
    return std::uint64_t{1} << static_cast<unsigned>(k);
  }
  std::uint64_t bits_{0};
};

struct EventFilter {
  enum class Mode { Include, Exclude };
  Mode mode = Mode::Exclude;
  EventKindSet kinds;

  // Whether an action of this kind survives the filter.
  constexpr bool keeps(EventKind k) const {
    return mode == Mode::Include ? kinds.contains(k) : !kinds.contains(k);
  }
};

namespace presets {

inline constexpr EventFilter kNoEffect{EventFilter::Mode::Exclude, {
  EventKind::Flash, EventKind::SetFilter, EventKind::SetFilterAdvanced,
  EventKind::HallOfMirrors, EventKind::Bloom, EventKind::ScalePlanets,
  EventKind::ScreenTile, EventKind::ScreenScroll, EventKind::ShakeScreen,
}};

inline constexpr EventFilter kNoHolds{EventFilter::Mode::Exclude, {EventKind::Hold}};

inline constexpr EventFilter kNoMoveCamera{EventFilter::Mode::Exclude, {EventKind::MoveCamera}};

// Strips everything but gameplay timing (speed, twirl, pause, planets, free roam).
inline constexpr EventFilter kNoEffectCompletely{EventFilter::Mode::Exclude, {
  EventKind::AddDecoration, EventKind::AddText, EventKind::AddObject,
  EventKind::Checkpoint, EventKind::SetHitsound, EventKind::PlaySound,
  EventKind::SetPlanetRotation, EventKind::ScalePlanets, EventKind::ColorTrack,
  EventKind::AnimateTrack, EventKind::RecolorTrack, EventKind::MoveTrack,
  EventKind::PositionTrack, EventKind::MoveDecorations, EventKind::SetText,
  EventKind::SetObject, EventKind::SetDefaultText, EventKind::CustomBackground,
  EventKind::Flash, EventKind::MoveCamera, EventKind::SetFilter,
  EventKind::HallOfMirrors, EventKind::ShakeScreen, EventKind::Bloom,
  EventKind::ScreenTile, EventKind::ScreenScroll, EventKind::SetFrameRate,
  EventKind::RepeatEvents, EventKind::SetConditionalEvents,
  EventKind::EditorComment, EventKind::Bookmark, EventKind::Hold,
  EventKind::SetHoldSound, EventKind::Hide, EventKind::ScaleMargin,
  EventKind::ScaleRadius,
}};

// Actions that only make sense while decorations exist.
inline constexpr EventKindSet kDecorationActions{
  EventKind::MoveDecorations, EventKind::SetText, EventKind::SetObject,
  EventKind::SetDefaultText,
};

} // namespace presets

} // namespace railpath
