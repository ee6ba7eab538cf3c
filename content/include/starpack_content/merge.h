#pragma once

#include "starpack_content/decoder.h"

#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace starpack::content {

struct MergedRecord {
  std::string key;
  nlohmann::json fields;
  // Every source that wrote this key, in load order. The last entry owns the current fields.
  std::vector<std::string> trail;
  std::filesystem::path file;

  const std::string& last_source() const { return trail.back(); }
};

// Same key written twice by one source. Recorded here, rejected by the validator.
struct DuplicateOccurrence {
  std::string key;
  std::string source;
  std::filesystem::path file;
};

struct MergedCollection {
  std::string name;
  std::vector<MergedRecord> records;  // first-occurrence order
  std::unordered_map<std::string, size_t> index_by_key;
  std::vector<DuplicateOccurrence> duplicates;

  const MergedRecord* find(const std::string& key) const;
};

struct MergedSet {
  std::vector<MergedCollection> collections;  // one per schema, in schema order

  const MergedCollection* find(const std::string& name) const;
  size_t record_count() const;
};

// Folds the decoded sources, given in load order, into one ordered map per collection.
// Later sources replace the whole field set of an existing key; position is kept.
MergedSet merge_sources(const std::vector<DecodedSource>& ordered_sources);

} // namespace starpack::content
