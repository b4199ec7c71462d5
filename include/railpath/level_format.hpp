#pragma once
#include <string>
#include <railpath/tile_graph.hpp>

namespace railpath {

// Level-file layout:
//  - top-level keys one per line, two-space indent
//  - arrays of primitives on one line: [0,90,180]
//  - arrays of objects one element per line, each element on a single line
//  - nested objects below the top level expand one key per line
std::string format_level_json(const Json& root);

// Single-line rendering used for array elements: {"a": 1, "b": [1,2]}
std::string format_single_line(const Json& v);

} // namespace railpath
