#include "starpack_content/registry_builder.h"

#include "starpack_content/schema.h"

#include <stdexcept>

namespace starpack::content {

namespace {
using json = nlohmann::json;

template <typename E>
struct EntityTraits;

template <>
struct EntityTraits<CellType> {
  static constexpr const char* kName = collections::kCellTypes;
};
template <>
struct EntityTraits<Technology> {
  static constexpr const char* kName = collections::kTechnologies;
};
template <>
struct EntityTraits<TechEdge> {
  static constexpr const char* kName = collections::kTechEdges;
};
template <>
struct EntityTraits<Building> {
  static constexpr const char* kName = collections::kBuildings;
};
template <>
struct EntityTraits<Weapon> {
  static constexpr const char* kName = collections::kWeapons;
};
template <>
struct EntityTraits<Engine> {
  static constexpr const char* kName = collections::kEngines;
};
template <>
struct EntityTraits<Shield> {
  static constexpr const char* kName = collections::kShields;
};
template <>
struct EntityTraits<HullClass> {
  static constexpr const char* kName = collections::kHullClasses;
};
template <>
struct EntityTraits<VictoryCondition> {
  static constexpr const char* kName = collections::kVictoryConditions;
};
template <>
struct EntityTraits<Scenario> {
  static constexpr const char* kName = collections::kScenarios;
};

LocalizedText read_text(const json& fields, const char* field) {
  LocalizedText text;
  if (!fields.contains(field) || !fields[field].is_object()) {
    return text;
  }
  for (auto it = fields[field].begin(); it != fields[field].end(); ++it) {
    text.by_locale[it.key()] = it.value().get<std::string>();
  }
  return text;
}

template <typename T>
bool link(const GameRegistry& registry, const std::string& id, const char* field, EntityIndex<T>& out,
          std::string& error) {
  const auto index = registry.resolve<T>(id);
  if (!index) {
    error = std::string(field) + " refers to unknown id '" + id + "'";
    return false;
  }
  out = *index;
  return true;
}

template <typename T>
bool link_required(const GameRegistry& registry, const json& fields, const char* field, EntityIndex<T>& out,
                   std::string& error) {
  return link(registry, fields.at(field).get<std::string>(), field, out, error);
}

template <typename T>
bool link_optional(const GameRegistry& registry, const json& fields, const char* field,
                   std::optional<EntityIndex<T>>& out, std::string& error) {
  if (!fields.contains(field)) {
    return true;
  }
  EntityIndex<T> index;
  if (!link(registry, fields[field].get<std::string>(), field, index, error)) {
    return false;
  }
  out = index;
  return true;
}

bool read_entity(const json& f, const GameRegistry&, CellType& out, std::string&) {
  out.name = read_text(f, "name");
  out.is_usable = f.at("is_usable").get<bool>();
  return true;
}

bool read_entity(const json& f, const GameRegistry&, Technology& out, std::string&) {
  out.name = read_text(f, "name");
  out.description = read_text(f, "description");
  out.research_cost = f.at("research_cost").get<int64_t>();
  return true;
}

bool read_entity(const json& f, const GameRegistry& registry, TechEdge& out, std::string& error) {
  return link_required(registry, f, "from", out.from, error) && link_required(registry, f, "to", out.to, error);
}

bool read_entity(const json& f, const GameRegistry& registry, Building& out, std::string& error) {
  out.name = read_text(f, "name");
  out.cost = f.at("cost").get<int64_t>();
  out.counts_for_adjacency = f.at("counts_for_adjacency").get<bool>();
  out.yields.food = f.at("yields_food").get<int64_t>();
  out.yields.housing = f.at("yields_housing").get<int64_t>();
  out.yields.production = f.at("yields_production").get<int64_t>();
  out.yields.science = f.at("yields_science").get<int64_t>();
  out.special_behavior =
      f.at("special_behavior").get<std::string>() == "terraformer" ? SpecialBehavior::Terraformer : SpecialBehavior::None;
  for (const auto& cell : f.at("buildable_on")) {
    EntityIndex<CellType> index;
    if (!link(registry, cell.get<std::string>(), "buildable_on", index, error)) {
      return false;
    }
    out.buildable_on.push_back(index);
  }
  return link_optional(registry, f, "unlocked_by", out.unlocked_by, error);
}

bool read_entity(const json& f, const GameRegistry& registry, Weapon& out, std::string& error) {
  out.name = read_text(f, "name");
  out.damage = f.at("damage").get<double>();
  out.fire_rate = f.at("fire_rate").get<double>();
  out.range = f.at("range").get<int64_t>();
  out.power_use = f.at("power_use").get<double>();
  out.cost = f.at("cost").get<int64_t>();
  return link_optional(registry, f, "requires_tech", out.requires_tech, error);
}

bool read_entity(const json& f, const GameRegistry& registry, Engine& out, std::string& error) {
  out.name = read_text(f, "name");
  out.thrust = f.at("thrust").get<double>();
  out.power_use = f.at("power_use").get<double>();
  out.cost = f.at("cost").get<int64_t>();
  return link_optional(registry, f, "requires_tech", out.requires_tech, error);
}

bool read_entity(const json& f, const GameRegistry& registry, Shield& out, std::string& error) {
  out.name = read_text(f, "name");
  out.strength = f.at("strength").get<int64_t>();
  out.power_use = f.at("power_use").get<double>();
  out.cost = f.at("cost").get<int64_t>();
  return link_optional(registry, f, "requires_tech", out.requires_tech, error);
}

bool read_entity(const json& f, const GameRegistry&, HullClass& out, std::string&) {
  out.name = read_text(f, "name");
  out.size_index = f.at("size_index").get<int64_t>();
  out.max_items = f.at("max_items").get<int64_t>();
  out.cost = f.at("cost").get<int64_t>();
  return true;
}

bool read_entity(const json& f, const GameRegistry&, VictoryCondition& out, std::string&) {
  out.name = read_text(f, "name");
  out.kind = f.at("kind").get<std::string>() == "domination" ? VictoryKind::Domination : VictoryKind::CoverAllTiles;
  out.threshold = f.at("threshold").get<double>();
  return true;
}

bool read_entity(const json& f, const GameRegistry& registry, Scenario& out, std::string& error) {
  out.name = read_text(f, "name");
  out.grid_width = f.at("grid_width").get<int64_t>();
  out.grid_height = f.at("grid_height").get<int64_t>();
  out.generation_mode = GenerationMode::RandomWhiteBlack;
  out.black_ratio = f.at("black_ratio").get<double>();
  return link_required(registry, f, "start_building", out.start_building, error) &&
         link_required(registry, f, "victory_condition", out.victory_condition, error);
}
} // namespace

RegistryBuilder::RegistryBuilder() : registry_(std::make_shared<GameRegistry>()) {}

template <typename E>
bool RegistryBuilder::fill(const MergedSet& merged, Diagnostics& diagnostics) {
  const char* name = EntityTraits<E>::kName;
  Collection<E>& collection = registry_->mutable_collection<E>();
  collection.name_ = name;

  const MergedCollection* source = merged.find(name);
  if (!source) {
    return true;
  }
  bool ok = true;
  collection.entities_.reserve(source->records.size());
  for (const auto& record : source->records) {
    E entity;
    std::string error;
    bool converted = false;
    try {
      converted = read_entity(record.fields, *registry_, entity, error);
    } catch (const std::exception& e) {
      error = e.what();
    }
    if (!converted) {
      add_diagnostic(diagnostics, Severity::Fatal, DiagnosticKind::InvariantViolation, name, record.key,
                     "cannot build typed entity: " + error, record.last_source(), record.file);
      ok = false;
      continue;
    }
    const auto index = static_cast<uint32_t>(collection.entities_.size());
    collection.index_by_id_.emplace(record.key, index);
    collection.ids_.push_back(TypedId<E>(record.key));
    collection.entities_.push_back(std::move(entity));
  }
  return ok;
}

template <typename E>
void RegistryBuilder::derive() {
  Collection<E>& collection = registry_->mutable_collection<E>();
  collection.stats_.clear();
  collection.stats_.reserve(collection.entities_.size());
  for (const auto& entity : collection.entities_) {
    collection.stats_.push_back(compute_stats(entity));
  }
}

template <>
void RegistryBuilder::derive<Technology>() {
  Collection<Technology>& technologies = registry_->mutable_collection<Technology>();
  const Collection<TechEdge>& edges = registry_->mutable_collection<TechEdge>();
  technologies.stats_ = compute_research_stats(technologies.entities_.size(), edges.entities_);
}

template <typename... Es>
bool RegistryBuilder::fill_all(TypeList<Es...>, const MergedSet& merged, Diagnostics& diagnostics) {
  bool ok = true;
  ((ok = fill<Es>(merged, diagnostics) && ok), ...);
  return ok;
}

template <typename... Es>
void RegistryBuilder::derive_all(TypeList<Es...>) {
  (derive<Es>(), ...);
}

bool RegistryBuilder::add_entities(const MergedSet& merged, Diagnostics& diagnostics) {
  return fill_all(EntityTypes{}, merged, diagnostics);
}

void RegistryBuilder::compile_derived() {
  derive_all(EntityTypes{});
}

std::shared_ptr<const GameRegistry> RegistryBuilder::finish() {
  std::shared_ptr<const GameRegistry> out = std::move(registry_);
  registry_ = std::make_shared<GameRegistry>();
  return out;
}

} // namespace starpack::content
