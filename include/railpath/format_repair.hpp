#pragma once
#include <string>
#include <string_view>

namespace railpath {

// Counts of each substitution made by repair_level_text.
struct RepairReport {
  bool bom_stripped = false;
  std::size_t escape_newlines = 0;   // "\n\\n" collapsed to "\\n"
  std::size_t trailing_commas = 0;   // ",  }" / ", ]"
  std::size_t decoration_commas = 0; // comma inserted before "decorations"
  std::size_t doubled_commas = 0;    // ",," collapsed

  std::size_t total() const {
    return (bom_stripped ? 1u : 0u) + escape_newlines + trailing_commas +
           decoration_commas + doubled_commas;
  }
};

// Applies the known level-file quirk fixes once, in a fixed order:
//   1. strip a leading UTF-8 byte-order mark
//   2. a raw newline directly followed by a literal \n becomes just the \n
//   3. drop a comma followed only by whitespace and then '}' or ']'
//   4. insert a missing comma before a whitespace-preceded "decorations" key
//   5. collapse ",," to ","
// Each pass runs over the output of the previous one; none is iterated.
std::string repair_level_text(std::string_view raw, RepairReport* report = nullptr);

} // namespace railpath
