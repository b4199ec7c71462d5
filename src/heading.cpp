#include <railpath/heading.hpp>
#include <array>

namespace railpath {

namespace {

struct CodeEntry { char code; double heading; };

constexpr std::array<CodeEntry, 29> kPathCodes{{
  {'R',   0}, {'p',  15}, {'J',  30}, {'E',  45}, {'T',  60}, {'o',  75},
  {'U',  90}, {'q', 105}, {'G', 120}, {'Q', 135}, {'H', 150}, {'W', 165},
  {'L', 180}, {'x', 195}, {'N', 210}, {'Z', 225}, {'F', 240}, {'V', 255},
  {'D', 270}, {'Y', 285}, {'B', 300}, {'C', 315}, {'M', 330}, {'A', 345},
  {'5', 555}, {'6', 666}, {'7', 777}, {'8', 888},
  {'!', kMidspin},
}};

} // namespace

bool is_reserved_sentinel(double heading) {
  for (double s : kReservedSentinels) if (heading == s) return true;
  return false;
}

std::optional<double> decode_path_code(char c) {
  for (const auto& e : kPathCodes) if (e.code == c) return e.heading;
  return std::nullopt;
}

std::optional<std::vector<double>> decode_path_data(std::string_view path,
                                                    std::size_t* bad_pos) {
  std::vector<double> out;
  out.reserve(path.size());
  for (std::size_t i = 0; i < path.size(); ++i) {
    const auto h = decode_path_code(path[i]);
    if (!h) {
      if (bad_pos) *bad_pos = i;
      return std::nullopt;
    }
    out.push_back(*h);
  }
  return out;
}

} // namespace railpath
