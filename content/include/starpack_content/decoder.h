#pragma once

#include "starpack_content/diagnostics.h"
#include "starpack_content/pack_source.h"
#include "starpack_content/schema.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace starpack::content {

// One entity as read from a file: shape-checked, defaults filled in, not yet validated.
struct RawRecord {
  std::string key;
  nlohmann::json fields;
};

struct DecodedFile {
  std::string collection;
  std::filesystem::path file;
  std::vector<RawRecord> records;
  Diagnostics diagnostics;
  bool ok = false;
};

struct DecodedSource {
  PackSource source;
  std::vector<DecodedFile> files;
  Diagnostics diagnostics;
  bool ok = false;
};

struct DecodeOptions {
  bool enable_yaml = true;
  bool enable_json = true;
};

struct PackDescriptor {
  std::optional<int> priority;
  std::optional<int> schema_version;
};

// Parse and shape errors are reported with Severity::Error; callers decide whether the
// failure is fatal for their source.
DecodedFile decode_document(const nlohmann::json& doc,
                            const CollectionSchema& schema,
                            const std::filesystem::path& file,
                            const std::string& source);
DecodedFile decode_file(const std::filesystem::path& path,
                        const CollectionSchema& schema,
                        const std::string& source);

// Decodes every collection file found in source.data_dir.
DecodedSource decode_source(const PackSource& source, const DecodeOptions& options);

// Reads a manifest or mod descriptor (optional "priority" and "schema_version" integers).
bool decode_descriptor(const std::filesystem::path& path, PackDescriptor& out, std::string& error);

// First existing "<dir>/<stem>.yaml|.yml|.json", or an empty path.
std::filesystem::path find_descriptor(const std::filesystem::path& dir, const std::string& stem);

} // namespace starpack::content
