#include "starpack_content/registry.h"

#include "starpack_content/registry_builder.h"

namespace starpack::content {

namespace {
using json = nlohmann::json;

json text_json(const LocalizedText& text) {
  json out = json::object();
  for (const auto& [locale, value] : text.by_locale) {
    out[locale] = value;
  }
  return out;
}

template <typename T>
json id_json(const GameRegistry& registry, EntityIndex<T> index) {
  return registry.collection<T>().id_of(index).str();
}

template <typename T>
json id_json(const GameRegistry& registry, const std::optional<EntityIndex<T>>& index) {
  return index ? id_json(registry, *index) : json(nullptr);
}

json optional_json(const std::optional<double>& value) {
  return value ? json(*value) : json(nullptr);
}

json entity_json(const GameRegistry&, const CellType& e) {
  return {{"name", text_json(e.name)}, {"is_usable", e.is_usable}};
}

json entity_json(const GameRegistry&, const Technology& e) {
  json out = {{"name", text_json(e.name)}, {"research_cost", e.research_cost}};
  if (!e.description.by_locale.empty()) {
    out["description"] = text_json(e.description);
  }
  return out;
}

json entity_json(const GameRegistry& r, const TechEdge& e) {
  return {{"from", id_json(r, e.from)}, {"to", id_json(r, e.to)}};
}

json entity_json(const GameRegistry& r, const Building& e) {
  json cells = json::array();
  for (const auto& cell : e.buildable_on) {
    cells.push_back(id_json(r, cell));
  }
  return {{"name", text_json(e.name)},
          {"cost", e.cost},
          {"buildable_on", cells},
          {"counts_for_adjacency", e.counts_for_adjacency},
          {"yields_food", e.yields.food},
          {"yields_housing", e.yields.housing},
          {"yields_production", e.yields.production},
          {"yields_science", e.yields.science},
          {"unlocked_by", id_json(r, e.unlocked_by)},
          {"special_behavior", special_behavior_name(e.special_behavior)}};
}

json entity_json(const GameRegistry& r, const Weapon& e) {
  return {{"name", text_json(e.name)}, {"damage", e.damage},     {"fire_rate", e.fire_rate},
          {"range", e.range},          {"power_use", e.power_use}, {"cost", e.cost},
          {"requires_tech", id_json(r, e.requires_tech)}};
}

json entity_json(const GameRegistry& r, const Engine& e) {
  return {{"name", text_json(e.name)}, {"thrust", e.thrust}, {"power_use", e.power_use},
          {"cost", e.cost},            {"requires_tech", id_json(r, e.requires_tech)}};
}

json entity_json(const GameRegistry& r, const Shield& e) {
  return {{"name", text_json(e.name)}, {"strength", e.strength}, {"power_use", e.power_use},
          {"cost", e.cost},            {"requires_tech", id_json(r, e.requires_tech)}};
}

json entity_json(const GameRegistry&, const HullClass& e) {
  return {{"name", text_json(e.name)}, {"size_index", e.size_index}, {"max_items", e.max_items}, {"cost", e.cost}};
}

json entity_json(const GameRegistry&, const VictoryCondition& e) {
  return {{"name", text_json(e.name)}, {"kind", victory_kind_name(e.kind)}, {"threshold", e.threshold}};
}

json entity_json(const GameRegistry& r, const Scenario& e) {
  return {{"name", text_json(e.name)},
          {"grid_width", e.grid_width},
          {"grid_height", e.grid_height},
          {"start_building", id_json(r, e.start_building)},
          {"victory_condition", id_json(r, e.victory_condition)},
          {"generation_mode", generation_mode_name(e.generation_mode)},
          {"black_ratio", e.black_ratio}};
}

json stats_json(const GameRegistry&, const NoDerivedStats&) {
  return nullptr;
}

json stats_json(const GameRegistry&, const BuildingStats& s) {
  return {{"total_yield", s.total_yield}, {"yield_per_cost", s.yield_per_cost}};
}

json stats_json(const GameRegistry& r, const TechnologyStats& s) {
  json prereqs = json::array();
  for (const auto& index : s.prerequisites) {
    prereqs.push_back(id_json(r, index));
  }
  json unlocks = json::array();
  for (const auto& index : s.unlocks) {
    unlocks.push_back(id_json(r, index));
  }
  return {{"prerequisites", prereqs}, {"unlocks", unlocks}, {"depth", s.depth}};
}

json stats_json(const GameRegistry&, const WeaponStats& s) {
  return {{"throughput", s.throughput}, {"throughput_per_power", optional_json(s.throughput_per_power)}};
}

json stats_json(const GameRegistry&, const EngineStats& s) {
  return {{"efficiency", optional_json(s.efficiency)}};
}

json stats_json(const GameRegistry&, const ShieldStats& s) {
  return {{"strength_per_cost", s.strength_per_cost}};
}

json stats_json(const GameRegistry&, const HullStats& s) {
  return {{"cost_per_slot", s.cost_per_slot}};
}

json stats_json(const GameRegistry&, const ScenarioStats& s) {
  return {{"tile_count", s.tile_count}, {"black_tiles", s.black_tiles}};
}

template <typename E>
void dump_collection(const GameRegistry& registry, json& out) {
  const Collection<E>& collection = registry.collection<E>();
  json list = json::array();
  for (const auto index : collection.indices()) {
    json entry;
    entry["index"] = index.value();
    entry["id"] = collection.id_of(index).str();
    entry["fields"] = entity_json(registry, collection.get(index));
    json derived = stats_json(registry, collection.get_derived(index));
    if (!derived.is_null()) {
      entry["derived"] = std::move(derived);
    }
    list.push_back(std::move(entry));
  }
  out[collection.name()] = std::move(list);
}

template <typename... Es>
void dump_all(TypeList<Es...>, const GameRegistry& registry, json& out) {
  (dump_collection<Es>(registry, out), ...);
}

template <typename... Es>
size_t count_all(TypeList<Es...>, const GameRegistry& registry) {
  return (registry.collection<Es>().size() + ...);
}
} // namespace

size_t GameRegistry::entity_count() const {
  return count_all(EntityTypes{}, *this);
}

nlohmann::json GameRegistry::to_json() const {
  json out = json::object();
  dump_all(EntityTypes{}, *this, out);
  return out;
}

} // namespace starpack::content
