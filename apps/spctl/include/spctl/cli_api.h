#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>

struct ContentCliOptions {
  std::optional<std::filesystem::path> data_root;
  std::optional<std::filesystem::path> mods_root;
  std::optional<std::filesystem::path> config_path;
  std::optional<std::filesystem::path> out_path;
  bool json_output = false;
  bool strict = false;
  bool verbose = false;  // debug logging; otherwise log_level from config
  std::optional<int> debounce_ms;
  int seconds = 0;  // watch: 0 runs until interrupted
};

// Exit codes: 0 success, 1 content rejected (or, for strict lint, any error or warning), 2 usage.
int content_lint(const char* argv0, const ContentCliOptions& opts, std::ostream& out);
int content_sources(const char* argv0, const ContentCliOptions& opts, std::ostream& out);
int content_dump(const char* argv0, const ContentCliOptions& opts, std::ostream& out);
int content_watch(const char* argv0, const ContentCliOptions& opts, std::ostream& out);
