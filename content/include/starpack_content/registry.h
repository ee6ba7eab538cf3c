#pragma once

#include "starpack_content/derived_stats.h"
#include "starpack_content/entities.h"
#include "starpack_content/typed_id.h"

#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace starpack::content {

// Validated entities of one kind plus their derived stats, addressable by id or dense index.
// Index assignment follows merge order and is stable within one snapshot.
template <typename E>
class Collection {
 public:
  using Entity = E;
  using Stats = derived_stats_t<E>;

  const std::string& name() const { return name_; }
  size_t size() const { return entities_.size(); }
  bool empty() const { return entities_.empty(); }

  std::optional<EntityIndex<E>> resolve(std::string_view id) const {
    auto it = index_by_id_.find(std::string(id));
    if (it == index_by_id_.end()) {
      return std::nullopt;
    }
    return EntityIndex<E>(it->second);
  }

  // Throws std::out_of_range for an invalid index or one taken from a larger snapshot.
  const E& get(EntityIndex<E> index) const { return entities_.at(index.value()); }
  const Stats& get_derived(EntityIndex<E> index) const { return stats_.at(index.value()); }
  const TypedId<E>& id_of(EntityIndex<E> index) const { return ids_.at(index.value()); }

  // Pointer variants for callers that prefer a null check.
  const E* find(std::string_view id) const {
    const auto index = resolve(id);
    return index ? &entities_[index->value()] : nullptr;
  }

  std::vector<EntityIndex<E>> indices() const {
    std::vector<EntityIndex<E>> out;
    out.reserve(entities_.size());
    for (uint32_t i = 0; i < entities_.size(); ++i) {
      out.push_back(EntityIndex<E>(i));
    }
    return out;
  }

 private:
  friend class RegistryBuilder;

  std::string name_;
  std::vector<TypedId<E>> ids_;
  std::vector<E> entities_;
  std::vector<Stats> stats_;
  std::unordered_map<std::string, uint32_t> index_by_id_;
};

class GameRegistry {
 public:
  template <typename E>
  const Collection<E>& collection() const {
    return std::get<Collection<E>>(collections_);
  }

  template <typename E>
  std::optional<EntityIndex<E>> resolve(std::string_view id) const {
    return collection<E>().resolve(id);
  }

  template <typename E>
  const E& get(EntityIndex<E> index) const {
    return collection<E>().get(index);
  }

  template <typename E>
  const derived_stats_t<E>& get_derived(EntityIndex<E> index) const {
    return collection<E>().get_derived(index);
  }

  size_t entity_count() const;

  // Canonical dump keyed by collection name, entities in index order, with derived values.
  nlohmann::json to_json() const;

 private:
  friend class RegistryBuilder;

  template <typename E>
  Collection<E>& mutable_collection() {
    return std::get<Collection<E>>(collections_);
  }

  std::tuple<Collection<CellType>,
             Collection<Technology>,
             Collection<TechEdge>,
             Collection<Building>,
             Collection<Weapon>,
             Collection<Engine>,
             Collection<Shield>,
             Collection<HullClass>,
             Collection<VictoryCondition>,
             Collection<Scenario>>
      collections_;
};

} // namespace starpack::content
