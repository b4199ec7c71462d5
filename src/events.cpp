#include <railpath/events.hpp>
#include <array>

namespace railpath {

namespace {

struct KindName { EventKind kind; std::string_view name; };

constexpr std::array<KindName, kEventKindCount - 1> kNames{{
  {EventKind::SetSpeed, "SetSpeed"},
  {EventKind::Twirl, "Twirl"},
  {EventKind::Pause, "Pause"},
  {EventKind::Hold, "Hold"},
  {EventKind::SetHoldSound, "SetHoldSound"},
  {EventKind::Checkpoint, "Checkpoint"},
  {EventKind::SetHitsound, "SetHitsound"},
  {EventKind::PlaySound, "PlaySound"},
  {EventKind::SetPlanetRotation, "SetPlanetRotation"},
  {EventKind::ScalePlanets, "ScalePlanets"},
  {EventKind::MultiPlanet, "MultiPlanet"},
  {EventKind::FreeRoam, "FreeRoam"},
  {EventKind::FreeRoamTwirl, "FreeRoamTwirl"},
  {EventKind::FreeRoamRemove, "FreeRoamRemove"},
  {EventKind::AutoPlayTiles, "AutoPlayTiles"},
  {EventKind::Hide, "Hide"},
  {EventKind::ScaleMargin, "ScaleMargin"},
  {EventKind::ScaleRadius, "ScaleRadius"},
  {EventKind::ColorTrack, "ColorTrack"},
  {EventKind::AnimateTrack, "AnimateTrack"},
  {EventKind::RecolorTrack, "RecolorTrack"},
  {EventKind::MoveTrack, "MoveTrack"},
  {EventKind::PositionTrack, "PositionTrack"},
  {EventKind::AddDecoration, "AddDecoration"},
  {EventKind::AddText, "AddText"},
  {EventKind::AddObject, "AddObject"},
  {EventKind::MoveDecorations, "MoveDecorations"},
  {EventKind::SetText, "SetText"},
  {EventKind::SetObject, "SetObject"},
  {EventKind::SetDefaultText, "SetDefaultText"},
  {EventKind::CustomBackground, "CustomBackground"},
  {EventKind::Flash, "Flash"},
  {EventKind::MoveCamera, "MoveCamera"},
  {EventKind::SetFilter, "SetFilter"},
  {EventKind::SetFilterAdvanced, "SetFilterAdvanced"},
  {EventKind::HallOfMirrors, "HallOfMirrors"},
  {EventKind::ShakeScreen, "ShakeScreen"},
  {EventKind::Bloom, "Bloom"},
  {EventKind::ScreenTile, "ScreenTile"},
  {EventKind::ScreenScroll, "ScreenScroll"},
  {EventKind::SetFrameRate, "SetFrameRate"},
  {EventKind::RepeatEvents, "RepeatEvents"},
  {EventKind::SetConditionalEvents, "SetConditionalEvents"},
  {EventKind::EditorComment, "EditorComment"},
  {EventKind::Bookmark, "Bookmark"},
}};

} // namespace

EventKind event_kind_from_name(std::string_view name) {
  for (const auto& e : kNames) if (e.name == name) return e.kind;
  return EventKind::Unknown;
}

std::string_view event_kind_name(EventKind kind) {
  for (const auto& e : kNames) if (e.kind == kind) return e.name;
  return {};
}

} // namespace railpath
