#include "starpack_data/serialization.h"

#include "starpack/log.h"

#include <fstream>

namespace starpack::data {

bool load_json_file(const std::filesystem::path& path, nlohmann::json& out, std::string& error) {
  std::ifstream in(path);
  if (!in) {
    error = "JSON read failed: " + path.string();
    return false;
  }
  try {
    in >> out;
  } catch (const std::exception& e) {
    error = std::string("JSON parse failed: ") + e.what();
    return false;
  }
  return true;
}

bool save_json_file(const std::filesystem::path& path, const nlohmann::json& node) {
  return write_text_file(path, node.dump(2) + "\n");
}

} // namespace starpack::data
