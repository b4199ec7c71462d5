#include <railpath/level_parser.hpp>
#include <cmath>
#include <railpath/format_repair.hpp>
#include <railpath/log.hpp>

namespace railpath {

static bool decode_angle_data(const Json& arr, std::vector<double>& out, ParseError& err) {
  if (!arr.is_array()) {
    err.message = "angleData must be an array";
    return false;
  }
  out.clear();
  out.reserve(arr.size());
  for (std::size_t i = 0; i < arr.size(); ++i) {
    const Json& v = arr[i];
    if (!v.is_number()) {
      err.message = "angleData[" + std::to_string(i) + "] is not a number";
      return false;
    }
    const double h = v.get<double>();
    if (!std::isfinite(h)) {
      err.message = "angleData[" + std::to_string(i) + "] is not finite";
      return false;
    }
    out.push_back(h);
  }
  return true;
}

std::optional<Json> parse_level_json(std::string_view text, ParseError& err) {
  RepairReport report{};
  const std::string repaired = repair_level_text(text, &report);
  if (report.total() > 0) {
    RAILPATH_LOGD("parser") << "repaired " << report.total() << " format quirk(s)"
                            << " (trailing commas=" << report.trailing_commas
                            << ", doubled commas=" << report.doubled_commas << ")";
  }
  try {
    return Json::parse(repaired, /*cb*/ nullptr, /*allow_exceptions*/ true,
                       /*ignore_comments*/ true);
  } catch (const Json::parse_error& e) {
    err.message = std::string("malformed level text: ") + e.what();
    return std::nullopt;
  }
}

std::optional<RawLevel> parse_level_object(const Json& root, ParseError& err) {
  if (!root.is_object()) {
    err.message = "level root is not an object";
    return std::nullopt;
  }

  RawLevel out;
  if (const auto it = root.find("pathData"); it != root.end()) {
    if (!it->is_string()) {
      err.message = "pathData must be a string";
      return std::nullopt;
    }
    const std::string path = it->get<std::string>();
    std::size_t bad = 0;
    auto decoded = decode_path_data(path, &bad);
    if (!decoded) {
      err.message = "unknown path code '" + std::string(1, path[bad]) +
                    "' at offset " + std::to_string(bad);
      return std::nullopt;
    }
    out.headings = std::move(*decoded);
    out.from_path_data = true;
  } else if (const auto ad = root.find("angleData"); ad != root.end()) {
    if (!decode_angle_data(*ad, out.headings, err)) return std::nullopt;
  } else {
    err.message = "level has neither pathData nor angleData";
    return std::nullopt;
  }

  for (std::size_t i = 0; i < out.headings.size(); ++i) {
    if (is_reserved_sentinel(out.headings[i])) {
      err.message = "tile " + std::to_string(i) + " uses reserved heading " +
                    std::to_string(static_cast<int>(out.headings[i]));
      return std::nullopt;
    }
  }
  if (!out.headings.empty() && is_midspin(out.headings.front())) {
    err.message = "tile 0 cannot be a midspin";
    return std::nullopt;
  }

  const auto st = root.find("settings");
  if (st == root.end() || !st->is_object()) {
    err.message = "level has no settings object";
    return std::nullopt;
  }
  out.settings = *st;

  if (const auto it = root.find("actions"); it != root.end()) {
    if (it->is_array()) out.actions = *it;
    else RAILPATH_LOGW("parser") << "ignoring non-array actions";
  }
  if (const auto it = root.find("decorations"); it != root.end()) {
    if (it->is_array()) out.decorations = *it;
    else RAILPATH_LOGW("parser") << "ignoring non-array decorations";
  }
  return out;
}

std::optional<RawLevel> parse_level_text(std::string_view text, ParseError& err) {
  auto root = parse_level_json(text, err);
  if (!root) return std::nullopt;
  return parse_level_object(*root, err);
}

} // namespace railpath
