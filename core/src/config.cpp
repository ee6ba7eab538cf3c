#include "starpack/config.h"

#include "starpack/log.h"

#include <nlohmann/json.hpp>

#if STARPACK_ENABLE_DATA_YAML
#include <yaml-cpp/yaml.h>
#endif

#include <fstream>
#include <optional>

namespace starpack {

namespace {
bool file_exists(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec);
}

struct ConfigFields {
  std::string data_root;
  std::string mods_root;
  std::vector<std::string> locales;
  std::optional<bool> hot_reload;
  std::optional<int> debounce_ms;
  std::optional<int> poll_interval_ms;
  std::optional<int> queue_capacity;
  std::optional<bool> data_yaml;
  std::optional<bool> data_json;
  std::string log_level;
};

void apply_common_fields(PipelineConfig& cfg, const ConfigFields& f) {
  if (!f.data_root.empty()) {
    cfg.data_root = f.data_root;
  }
  if (!f.mods_root.empty()) {
    cfg.mods_root = f.mods_root;
  }
  if (!f.locales.empty()) {
    cfg.locales = f.locales;
  }
  if (f.hot_reload.has_value()) {
    cfg.hot_reload = *f.hot_reload;
  }
  if (f.debounce_ms.has_value() && *f.debounce_ms >= 0) {
    cfg.debounce_ms = *f.debounce_ms;
  }
  if (f.poll_interval_ms.has_value() && *f.poll_interval_ms > 0) {
    cfg.poll_interval_ms = *f.poll_interval_ms;
  }
  if (f.queue_capacity.has_value() && *f.queue_capacity > 0) {
    cfg.queue_capacity = static_cast<size_t>(*f.queue_capacity);
  }
  if (f.data_yaml.has_value()) {
    cfg.enable_data_yaml = *f.data_yaml;
  }
  if (f.data_json.has_value()) {
    cfg.enable_data_json = *f.data_json;
  }
  if (!f.log_level.empty()) {
    if (log::parse_level(f.log_level)) {
      cfg.log_level = f.log_level;
    } else {
      log::warn("unknown log_level '" + f.log_level + "'; keeping " + cfg.log_level);
    }
  }
}
} // namespace

PipelineConfig load_pipeline_config(const std::filesystem::path& path) {
  PipelineConfig cfg;

  if (!file_exists(path)) {
    log::warn(std::string("config not found: ") + path.string());
    return cfg;
  }

  const auto ext = path.extension().string();
  if (ext == ".json") {
    ConfigFields fields;
    try {
      std::ifstream in(path);
      nlohmann::json j;
      in >> j;
      const auto& root = j.contains("starpack") ? j["starpack"] : j;

      if (root.contains("data_root")) fields.data_root = root["data_root"].get<std::string>();
      if (root.contains("mods_root")) fields.mods_root = root["mods_root"].get<std::string>();
      if (root.contains("locales") && root["locales"].is_array()) {
        for (const auto& v : root["locales"]) {
          fields.locales.push_back(v.get<std::string>());
        }
      }
      if (root.contains("hot_reload")) fields.hot_reload = root["hot_reload"].get<bool>();
      if (root.contains("debounce_ms")) fields.debounce_ms = root["debounce_ms"].get<int>();
      if (root.contains("poll_interval_ms")) fields.poll_interval_ms = root["poll_interval_ms"].get<int>();
      if (root.contains("queue_capacity")) fields.queue_capacity = root["queue_capacity"].get<int>();
      if (root.contains("log_level")) fields.log_level = root["log_level"].get<std::string>();
      if (root.contains("data")) {
        const auto& data = root["data"];
        if (data.contains("yaml")) fields.data_yaml = data["yaml"].get<bool>();
        if (data.contains("json")) fields.data_json = data["json"].get<bool>();
      }
    } catch (const std::exception& e) {
      log::warn(std::string("config parse failed; using defaults: ") + e.what());
      return cfg;
    }
    apply_common_fields(cfg, fields);
    return cfg;
  }

  if (ext == ".yaml" || ext == ".yml") {
#if STARPACK_ENABLE_DATA_YAML
    ConfigFields fields;
    try {
      YAML::Node doc = YAML::LoadFile(path.string());
      YAML::Node root = doc["starpack"] ? doc["starpack"] : doc;

      if (root["data_root"]) fields.data_root = root["data_root"].as<std::string>();
      if (root["mods_root"]) fields.mods_root = root["mods_root"].as<std::string>();
      if (root["locales"]) {
        for (const auto& v : root["locales"]) {
          fields.locales.push_back(v.as<std::string>());
        }
      }
      if (root["hot_reload"]) fields.hot_reload = root["hot_reload"].as<bool>();
      if (root["debounce_ms"]) fields.debounce_ms = root["debounce_ms"].as<int>();
      if (root["poll_interval_ms"]) fields.poll_interval_ms = root["poll_interval_ms"].as<int>();
      if (root["queue_capacity"]) fields.queue_capacity = root["queue_capacity"].as<int>();
      if (root["log_level"]) fields.log_level = root["log_level"].as<std::string>();
      if (root["data"]) {
        auto data = root["data"];
        if (data["yaml"]) fields.data_yaml = data["yaml"].as<bool>();
        if (data["json"]) fields.data_json = data["json"].as<bool>();
      }
    } catch (const std::exception& e) {
      log::warn(std::string("config parse failed; using defaults: ") + e.what());
      return cfg;
    }
    apply_common_fields(cfg, fields);
#else
    log::warn("YAML config requested but YAML support is disabled.");
#endif
    return cfg;
  }

  log::warn("Unknown config extension; using defaults.");
  return cfg;
}

} // namespace starpack
