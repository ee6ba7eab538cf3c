#include "starpack_data/serialization.h"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <vector>

namespace starpack::data {

#if STARPACK_ENABLE_DATA_YAML
namespace {
bool parse_int64(const std::string& value, int64_t& out) {
  const char* begin = value.data();
  const char* end = value.data() + value.size();
  if (begin == end) return false;
  auto result = std::from_chars(begin, end, out);
  return result.ec == std::errc() && result.ptr == end;
}

// Decimal and exponent notation only; independent of the C locale.
bool parse_double(const std::string& value, double& out) {
  const char* begin = value.data();
  const char* end = value.data() + value.size();
  if (begin == end) return false;
  auto result = std::from_chars(begin, end, out, std::chars_format::general);
  return result.ec == std::errc() && result.ptr == end && std::isfinite(out);
}
} // namespace

bool load_yaml_file(const std::filesystem::path& path, YAML::Node& out, std::string& error) {
  try {
    out = YAML::LoadFile(path.string());
    return true;
  } catch (const std::exception& e) {
    error = std::string("YAML parse failed: ") + e.what();
    return false;
  }
}

nlohmann::json yaml_to_json(const YAML::Node& node) {
  if (!node.IsDefined() || node.IsNull()) {
    return nullptr;
  }
  if (node.IsScalar()) {
    const std::string scalar = node.as<std::string>();
    if (node.Tag() == "!") {
      return scalar;
    }
    if (scalar == "true") return true;
    if (scalar == "false") return false;
    int64_t as_int = 0;
    if (parse_int64(scalar, as_int)) {
      return as_int;
    }
    double as_double = 0.0;
    if (parse_double(scalar, as_double)) {
      return as_double;
    }
    return scalar;
  }
  if (node.IsSequence()) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& item : node) {
      arr.push_back(yaml_to_json(item));
    }
    return arr;
  }
  if (node.IsMap()) {
    std::vector<std::string> keys;
    keys.reserve(node.size());
    for (const auto& pair : node) {
      keys.push_back(pair.first.as<std::string>());
    }
    std::sort(keys.begin(), keys.end());
    nlohmann::json obj = nlohmann::json::object();
    for (const auto& key : keys) {
      obj[key] = yaml_to_json(node[key]);
    }
    return obj;
  }
  return nullptr;
}
#endif

} // namespace starpack::data
