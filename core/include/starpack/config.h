#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace starpack {

struct PipelineConfig {
  std::filesystem::path data_root = "packs/base";
  // Empty means the "mods" sibling of data_root.
  std::filesystem::path mods_root;
  std::vector<std::string> locales{"en", "ru"};
  bool hot_reload = true;
  int debounce_ms = 300;
  int poll_interval_ms = 50;
  size_t queue_capacity = 256;
  bool enable_data_yaml = true;
  bool enable_data_json = true;
  std::string log_level = "info";
};

PipelineConfig load_pipeline_config(const std::filesystem::path& path);

} // namespace starpack
