#pragma once

#include <filesystem>
#include <optional>

namespace starpack {

struct ResolvedPaths {
  std::filesystem::path root;
  std::filesystem::path config_path;
  std::filesystem::path packs_root;
  std::filesystem::path logs_dir;
};

ResolvedPaths resolve_paths(const char* argv0,
                            const std::optional<std::filesystem::path>& config_override);

// Relative paths are taken from the repository root, absolute ones pass through.
std::filesystem::path resolve_against(const std::filesystem::path& root, const std::filesystem::path& path);

std::filesystem::path default_mods_root(const std::filesystem::path& data_root);

} // namespace starpack
