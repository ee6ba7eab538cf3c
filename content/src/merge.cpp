#include "starpack_content/merge.h"

#include <unordered_set>

namespace starpack::content {

const MergedRecord* MergedCollection::find(const std::string& key) const {
  auto it = index_by_key.find(key);
  return it == index_by_key.end() ? nullptr : &records[it->second];
}

const MergedCollection* MergedSet::find(const std::string& name) const {
  for (const auto& collection : collections) {
    if (collection.name == name) {
      return &collection;
    }
  }
  return nullptr;
}

size_t MergedSet::record_count() const {
  size_t count = 0;
  for (const auto& collection : collections) {
    count += collection.records.size();
  }
  return count;
}

MergedSet merge_sources(const std::vector<DecodedSource>& ordered_sources) {
  MergedSet out;
  const auto& schemas = collection_schemas();
  out.collections.reserve(schemas.size());
  std::unordered_map<std::string, size_t> slot_by_name;
  for (const auto& schema : schemas) {
    slot_by_name[schema.name] = out.collections.size();
    MergedCollection collection;
    collection.name = schema.name;
    out.collections.push_back(std::move(collection));
  }

  for (const auto& decoded : ordered_sources) {
    const std::string& source = decoded.source.name;
    for (const auto& file : decoded.files) {
      auto slot = slot_by_name.find(file.collection);
      if (slot == slot_by_name.end()) continue;
      MergedCollection& collection = out.collections[slot->second];

      std::unordered_set<std::string> seen_in_file;
      for (const auto& record : file.records) {
        if (!seen_in_file.insert(record.key).second) {
          collection.duplicates.push_back({record.key, source, file.file});
        }

        auto existing = collection.index_by_key.find(record.key);
        if (existing == collection.index_by_key.end()) {
          collection.index_by_key.emplace(record.key, collection.records.size());
          collection.records.push_back({record.key, record.fields, {source}, file.file});
          continue;
        }
        MergedRecord& merged = collection.records[existing->second];
        merged.fields = record.fields;
        merged.file = file.file;
        merged.trail.push_back(source);
      }
    }
  }
  return out;
}

} // namespace starpack::content
