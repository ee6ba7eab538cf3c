#include "starpack_data/serialization.h"

#include "starpack/log.h"

#include <fstream>

namespace starpack::data {

DocumentFormat format_for_path(const std::filesystem::path& path) {
  const auto ext = path.extension().string();
  if (ext == ".json") return DocumentFormat::Json;
  if (ext == ".yaml" || ext == ".yml") return DocumentFormat::Yaml;
  return DocumentFormat::Unknown;
}

const char* format_name(DocumentFormat format) {
  switch (format) {
    case DocumentFormat::Json:
      return "json";
    case DocumentFormat::Yaml:
      return "yaml";
    case DocumentFormat::Unknown:
    default:
      return "unknown";
  }
}

bool load_document(const std::filesystem::path& path, nlohmann::json& out, std::string& error) {
  switch (format_for_path(path)) {
    case DocumentFormat::Json:
      return load_json_file(path, out, error);
    case DocumentFormat::Yaml: {
#if STARPACK_ENABLE_DATA_YAML
      YAML::Node doc;
      if (!load_yaml_file(path, doc, error)) {
        return false;
      }
      try {
        out = yaml_to_json(doc);
      } catch (const std::exception& e) {
        error = std::string("YAML conversion failed: ") + e.what();
        return false;
      }
      return true;
#else
      error = "YAML support is disabled in this build";
      return false;
#endif
    }
    case DocumentFormat::Unknown:
    default:
      error = "unsupported extension: " + path.extension().string();
      return false;
  }
}

bool write_text_file(const std::filesystem::path& path, const std::string& contents) {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path, std::ios::trunc);
  if (!out) {
    starpack::log::warn(std::string("failed to write file: ") + path.string());
    return false;
  }
  out << contents;
  return true;
}

} // namespace starpack::data
