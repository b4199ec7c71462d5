#include <railpath/format_repair.hpp>
#include <cctype>

namespace railpath {

namespace {

constexpr std::string_view kBom = "\xEF\xBB\xBF";
constexpr std::string_view kDecorationsKey = "\"decorations\"";

bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

std::string collapse_escape_newlines(std::string_view in, std::size_t& n) {
  std::string out;
  out.reserve(in.size());
  for (std::size_t i = 0; i < in.size(); ++i) {
    if (in[i] == '\n' && i + 2 < in.size() && in[i+1] == '\\' && in[i+2] == 'n') {
      ++n;
      continue; // keep the literal "\n", drop the raw newline
    }
    out.push_back(in[i]);
  }
  return out;
}

std::string drop_trailing_commas(std::string_view in, std::size_t& n) {
  std::string out;
  out.reserve(in.size());
  for (std::size_t i = 0; i < in.size(); ++i) {
    if (in[i] == ',') {
      std::size_t j = i + 1;
      while (j < in.size() && is_space(in[j])) ++j;
      if (j < in.size() && (in[j] == '}' || in[j] == ']')) {
        ++n;
        continue;
      }
    }
    out.push_back(in[i]);
  }
  return out;
}

std::string insert_decoration_commas(std::string_view in, std::size_t& n) {
  std::string out;
  out.reserve(in.size() + 4);
  std::size_t pos = 0;
  while (pos < in.size()) {
    const std::size_t hit = in.find(kDecorationsKey, pos);
    if (hit == std::string_view::npos) break;
    out.append(in.substr(pos, hit - pos));
    if (hit > 0 && is_space(in[hit - 1])) {
      // Look back past whitespace: only a value end can be missing its comma.
      std::size_t k = hit;
      while (k > 0 && is_space(in[k - 1])) --k;
      const char prev = k > 0 ? in[k - 1] : '\0';
      if (prev == ']' || prev == '}' || prev == '"' ||
          std::isalnum(static_cast<unsigned char>(prev))) {
        out.push_back(',');
        ++n;
      }
    }
    out.append(kDecorationsKey);
    pos = hit + kDecorationsKey.size();
  }
  out.append(in.substr(pos));
  return out;
}

std::string collapse_doubled_commas(std::string_view in, std::size_t& n) {
  std::string out;
  out.reserve(in.size());
  for (std::size_t i = 0; i < in.size(); ++i) {
    out.push_back(in[i]);
    // Non-overlapping pairs: ",,," leaves ",,".
    if (in[i] == ',' && i + 1 < in.size() && in[i+1] == ',') { ++n; ++i; }
  }
  return out;
}

} // namespace

std::string repair_level_text(std::string_view raw, RepairReport* report) {
  RepairReport r{};
  if (raw.substr(0, kBom.size()) == kBom) {
    raw.remove_prefix(kBom.size());
    r.bom_stripped = true;
  }
  std::string s = collapse_escape_newlines(raw, r.escape_newlines);
  s = drop_trailing_commas(s, r.trailing_commas);
  s = insert_decoration_commas(s, r.decoration_commas);
  s = collapse_doubled_commas(s, r.doubled_commas);
  if (report) *report = r;
  return s;
}

} // namespace railpath
