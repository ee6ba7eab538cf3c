#pragma once

#include "starpack_content/decoder.h"
#include "starpack_content/diagnostics.h"
#include "starpack_content/pack_source.h"

#include <filesystem>
#include <string>
#include <vector>

namespace starpack::content {

struct ResolveOptions {
  std::filesystem::path data_root;
  std::filesystem::path mods_root;
};

struct SkippedMod {
  std::string name;
  std::string reason;
};

struct ResolvedSources {
  bool ok = false;
  int manifest_schema_version = kRuntimeSchemaVersion;
  // Load order: base first, then mods by (priority, folder name).
  std::vector<PackSource> sources;
  std::vector<SkippedMod> skipped;
  Diagnostics diagnostics;
};

ResolvedSources resolve_sources(const ResolveOptions& options);

// Strict weak order used for mod load order.
bool mod_load_order_less(const PackSource& a, const PackSource& b);

} // namespace starpack::content
