#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <railpath/tile_graph.hpp>

namespace railpath {

// Unsalvageable text or a level missing required top-level keys.
struct ParseError {
  std::string message;
};

// Level as read from disk, before actions are bound to tiles.
struct RawLevel {
  std::vector<double> headings;
  Json settings = Json::object();
  Json actions = Json::array();     // flat, each with a "floor"
  Json decorations = Json::array(); // flat, "floor" optional
  bool from_path_data = false;
};

// Repairs, then parses with comment skipping. Fails on syntax errors.
std::optional<Json> parse_level_json(std::string_view text, ParseError& err);

// Validates the top-level shape and decodes headings.
std::optional<RawLevel> parse_level_object(const Json& root, ParseError& err);

std::optional<RawLevel> parse_level_text(std::string_view text, ParseError& err);

} // namespace railpath
