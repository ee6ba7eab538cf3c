#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#if STARPACK_ENABLE_DATA_YAML
#include <yaml-cpp/yaml.h>
#endif

namespace starpack::data {

enum class DocumentFormat { Unknown, Json, Yaml };

DocumentFormat format_for_path(const std::filesystem::path& path);
const char* format_name(DocumentFormat format);

#if STARPACK_ENABLE_DATA_YAML
bool load_yaml_file(const std::filesystem::path& path, YAML::Node& out, std::string& error);
// Scalars become bool, integer or finite float where they parse fully; quoted scalars stay strings.
// Map keys are emitted sorted.
nlohmann::json yaml_to_json(const YAML::Node& node);
#endif

bool load_json_file(const std::filesystem::path& path, nlohmann::json& out, std::string& error);
bool save_json_file(const std::filesystem::path& path, const nlohmann::json& node);

// Loads a .json, .yaml or .yml file into a JSON value tree.
bool load_document(const std::filesystem::path& path, nlohmann::json& out, std::string& error);

bool write_text_file(const std::filesystem::path& path, const std::string& contents);

} // namespace starpack::data
