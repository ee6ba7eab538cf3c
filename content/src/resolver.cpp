#include "starpack_content/resolver.h"

#include <algorithm>

namespace starpack::content {

namespace {
void skip_mod(ResolvedSources& out, const PackSource& mod, Severity severity, DiagnosticKind kind,
              const std::string& reason, const std::filesystem::path& file) {
  out.skipped.push_back({mod.name, reason});
  add_diagnostic(out.diagnostics, severity, kind, "", "", "mod skipped: " + reason, mod.name, file);
}

bool resolve_manifest(const std::filesystem::path& data_root, ResolvedSources& out) {
  const auto manifest_path = find_descriptor(data_root, "manifest");
  if (manifest_path.empty()) {
    out.manifest_schema_version = kRuntimeSchemaVersion;
    return true;
  }
  PackDescriptor manifest;
  std::string error;
  if (!decode_descriptor(manifest_path, manifest, error)) {
    add_diagnostic(out.diagnostics, Severity::Fatal, DiagnosticKind::ParseError, "", "",
                   "manifest unreadable: " + error, "base", manifest_path);
    return false;
  }
  out.manifest_schema_version = manifest.schema_version.value_or(kRuntimeSchemaVersion);
  if (out.manifest_schema_version > kRuntimeSchemaVersion) {
    add_diagnostic(out.diagnostics, Severity::Fatal, DiagnosticKind::SchemaVersionRejected, "", "",
                   "manifest schema_version " + std::to_string(out.manifest_schema_version) +
                       " is newer than supported version " + std::to_string(kRuntimeSchemaVersion),
                   "base", manifest_path);
    return false;
  }
  return true;
}
} // namespace

bool mod_load_order_less(const PackSource& a, const PackSource& b) {
  if (a.priority != b.priority) {
    return a.priority < b.priority;
  }
  return a.name < b.name;
}

ResolvedSources resolve_sources(const ResolveOptions& options) {
  ResolvedSources out;
  std::error_code ec;

  if (!std::filesystem::is_directory(options.data_root, ec)) {
    add_diagnostic(out.diagnostics, Severity::Fatal, DiagnosticKind::IoError, "", "",
                   "base pack directory not found", "base", options.data_root);
    return out;
  }
  if (!resolve_manifest(options.data_root, out)) {
    return out;
  }

  PackSource base;
  base.name = "base";
  base.root = options.data_root;
  base.data_dir = options.data_root;
  base.is_base = true;
  base.priority = 0;
  base.schema_version = out.manifest_schema_version;
  base.has_descriptor = !find_descriptor(options.data_root, "manifest").empty();
  out.sources.push_back(base);

  std::vector<PackSource> mods;
  if (!options.mods_root.empty() && std::filesystem::is_directory(options.mods_root, ec)) {
    std::vector<std::filesystem::path> dirs;
    for (std::filesystem::directory_iterator it(options.mods_root, ec), end; !ec && it != end;
         it.increment(ec)) {
      std::error_code entry_ec;
      if (it->is_directory(entry_ec)) {
        dirs.push_back(it->path());
      }
    }
    if (ec) {
      add_diagnostic(out.diagnostics, Severity::Warning, DiagnosticKind::IoError, "", "",
                     "mods directory listing incomplete: " + ec.message(), "", options.mods_root);
    }
    // Listing order is filesystem dependent; diagnostics must not be.
    std::sort(dirs.begin(), dirs.end());

    for (const auto& dir : dirs) {
      std::error_code entry_ec;
      PackSource mod;
      mod.name = dir.filename().string();
      mod.root = dir;
      mod.data_dir = dir / "data";
      mod.schema_version = out.manifest_schema_version;

      if (!std::filesystem::is_directory(mod.data_dir, entry_ec)) {
        add_diagnostic(out.diagnostics, Severity::Warning, DiagnosticKind::IoError, "", "",
                       "directory has no data/ folder; not a mod", mod.name, mod.root);
        continue;
      }

      const auto descriptor_path = find_descriptor(mod.root, "mod");
      if (!descriptor_path.empty()) {
        PackDescriptor descriptor;
        std::string error;
        if (!decode_descriptor(descriptor_path, descriptor, error)) {
          skip_mod(out, mod, Severity::Error, DiagnosticKind::ParseError, "descriptor unreadable: " + error,
                   descriptor_path);
          continue;
        }
        mod.has_descriptor = true;
        mod.priority = descriptor.priority.value_or(0);
        mod.schema_version = descriptor.schema_version.value_or(out.manifest_schema_version);
      }

      if (mod.schema_version > out.manifest_schema_version) {
        skip_mod(out, mod, Severity::Error, DiagnosticKind::SchemaVersionRejected,
                 "schema_version " + std::to_string(mod.schema_version) + " is newer than manifest version " +
                     std::to_string(out.manifest_schema_version),
                 descriptor_path);
        continue;
      }
      mods.push_back(std::move(mod));
    }
  }

  std::sort(mods.begin(), mods.end(), mod_load_order_less);
  for (auto& mod : mods) {
    out.sources.push_back(std::move(mod));
  }
  out.ok = true;
  return out;
}

} // namespace starpack::content
