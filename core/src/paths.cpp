#include "starpack/paths.h"

#include "starpack/log.h"

#include <cstdlib>
#include <string>

#if defined(_WIN32)
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace starpack {

namespace {
std::filesystem::path executable_dir(const char* argv0) {
#if defined(_WIN32)
  char buffer[MAX_PATH];
  DWORD len = GetModuleFileNameA(nullptr, buffer, MAX_PATH);
  if (len > 0) {
    return std::filesystem::path(buffer).parent_path();
  }
#elif defined(__linux__)
  char buffer[4096];
  const ssize_t len = readlink("/proc/self/exe", buffer, sizeof(buffer) - 1);
  if (len > 0) {
    buffer[len] = '\0';
    return std::filesystem::path(buffer).parent_path();
  }
#endif
  if (argv0) {
    return std::filesystem::absolute(argv0).parent_path();
  }
  return std::filesystem::current_path();
}

std::filesystem::path find_root_from(const std::filesystem::path& start) {
  std::error_code ec;
  std::filesystem::path cur = start;
  for (int i = 0; i < 6; ++i) {
    if (std::filesystem::exists(cur / "packs", ec) && std::filesystem::exists(cur / "config", ec)) {
      return cur;
    }
    if (cur.has_parent_path() && cur.parent_path() != cur) {
      cur = cur.parent_path();
    } else {
      break;
    }
  }
  return std::filesystem::current_path();
}
} // namespace

ResolvedPaths resolve_paths(const char* argv0,
                            const std::optional<std::filesystem::path>& config_override) {
  ResolvedPaths out;
  if (const char* env_root = std::getenv("STARPACK_ROOT")) {
    out.root = std::filesystem::path(env_root);
  } else {
    out.root = find_root_from(executable_dir(argv0));
  }

  if (config_override.has_value()) {
    out.config_path = config_override->is_absolute() ? *config_override
                                                     : std::filesystem::absolute(*config_override);
  } else {
    out.config_path = out.root / "config" / "starpack.yaml";
  }
  out.packs_root = out.root / "packs";
  out.logs_dir = out.root / "build" / "logs";

  std::error_code ec;
  if (!std::filesystem::exists(out.packs_root, ec)) {
    log::warn(std::string("packs directory not found: ") + out.packs_root.string());
  }
  return out;
}

std::filesystem::path resolve_against(const std::filesystem::path& root, const std::filesystem::path& path) {
  if (path.empty() || path.is_absolute()) {
    return path;
  }
  return root / path;
}

std::filesystem::path default_mods_root(const std::filesystem::path& data_root) {
  std::filesystem::path base = data_root;
  if (!base.has_filename()) {
    base = base.parent_path();
  }
  return base.parent_path() / "mods";
}

} // namespace starpack
