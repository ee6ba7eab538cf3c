#pragma once

#include <filesystem>
#include <string>

namespace starpack::content {

struct PackSource {
  std::string name;                // "base" or the mod folder name
  std::filesystem::path root;      // pack directory
  std::filesystem::path data_dir;  // directory holding the collection files
  bool is_base = false;
  int priority = 0;
  int schema_version = 0;
  bool has_descriptor = false;
};

} // namespace starpack::content
