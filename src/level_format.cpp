#include <railpath/level_format.hpp>
#include <algorithm>

namespace railpath {

namespace {

std::string dump_primitive(const Json& v) {
  return v.dump(-1, ' ', false, Json::error_handler_t::replace);
}

std::string dump_key(const std::string& key) {
  return Json(key).dump(-1, ' ', false, Json::error_handler_t::replace);
}

bool all_primitive(const Json& arr) {
  return std::all_of(arr.begin(), arr.end(),
    [](const Json& e){ return !e.is_object() && !e.is_array(); });
}

std::string format_value(const Json& v, int indent) {
  if (v.is_array()) {
    if (all_primitive(v)) {
      std::string out = "[";
      bool first = true;
      for (const auto& e : v) {
        if (!first) out += ',';
        first = false;
        out += dump_primitive(e);
      }
      return out + "]";
    }
    const std::string pad(static_cast<std::size_t>(indent), ' ');
    std::string out = "[\n";
    bool first = true;
    for (const auto& e : v) {
      if (!first) out += ",\n";
      first = false;
      out += pad + "  " + format_single_line(e);
    }
    return out + "\n" + pad + "]";
  }
  if (v.is_object()) {
    const std::string pad(static_cast<std::size_t>(indent), ' ');
    if (v.empty()) return "{\n\n" + pad + "}";
    std::string out = "{\n";
    bool first = true;
    for (auto it = v.begin(); it != v.end(); ++it) {
      if (!first) out += ",\n";
      first = false;
      out += pad + "  " + dump_key(it.key()) + ": " + format_value(it.value(), indent + 2);
    }
    return out + "\n" + pad + "}";
  }
  return dump_primitive(v);
}

} // namespace

std::string format_single_line(const Json& v) {
  if (v.is_array()) {
    std::string out = "[";
    bool first = true;
    for (const auto& e : v) {
      if (!first) out += ',';
      first = false;
      out += format_single_line(e);
    }
    return out + "]";
  }
  if (v.is_object()) {
    std::string out = "{";
    bool first = true;
    for (auto it = v.begin(); it != v.end(); ++it) {
      if (!first) out += ", ";
      first = false;
      out += dump_key(it.key()) + ": " + format_single_line(it.value());
    }
    return out + "}";
  }
  return dump_primitive(v);
}

std::string format_level_json(const Json& root) {
  if (!root.is_object()) return format_value(root, 0);
  std::string out = "{\n";
  bool first = true;
  for (auto it = root.begin(); it != root.end(); ++it) {
    if (!first) out += ",\n";
    first = false;
    out += "  " + dump_key(it.key()) + ": " + format_value(it.value(), 2);
  }
  return out + "\n}";
}

} // namespace railpath
