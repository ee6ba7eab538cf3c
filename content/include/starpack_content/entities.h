#pragma once

#include "starpack_content/typed_id.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace starpack::content {

struct LocalizedText {
  std::map<std::string, std::string> by_locale;

  // Falls back to English when the locale has no text.
  const std::string& get(std::string_view locale) const;
};

enum class SpecialBehavior { None, Terraformer };
enum class VictoryKind { CoverAllTiles, Domination };
enum class GenerationMode { RandomWhiteBlack };

struct CellType {
  LocalizedText name;
  bool is_usable = false;
};

struct Technology {
  LocalizedText name;
  LocalizedText description;
  int64_t research_cost = 0;
};

struct TechEdge {
  EntityIndex<Technology> from;
  EntityIndex<Technology> to;
};

struct Yields {
  int64_t food = 0;
  int64_t housing = 0;
  int64_t production = 0;
  int64_t science = 0;
};

struct Building {
  LocalizedText name;
  int64_t cost = 0;
  std::vector<EntityIndex<CellType>> buildable_on;
  bool counts_for_adjacency = false;
  Yields yields;
  std::optional<EntityIndex<Technology>> unlocked_by;
  SpecialBehavior special_behavior = SpecialBehavior::None;
};

struct Weapon {
  LocalizedText name;
  double damage = 0.0;
  double fire_rate = 0.0;
  int64_t range = 0;
  double power_use = 0.0;
  int64_t cost = 0;
  std::optional<EntityIndex<Technology>> requires_tech;
};

struct Engine {
  LocalizedText name;
  double thrust = 0.0;
  double power_use = 0.0;
  int64_t cost = 0;
  std::optional<EntityIndex<Technology>> requires_tech;
};

struct Shield {
  LocalizedText name;
  int64_t strength = 0;
  double power_use = 0.0;
  int64_t cost = 0;
  std::optional<EntityIndex<Technology>> requires_tech;
};

struct HullClass {
  LocalizedText name;
  int64_t size_index = 0;
  int64_t max_items = 0;
  int64_t cost = 0;
};

struct VictoryCondition {
  LocalizedText name;
  VictoryKind kind = VictoryKind::CoverAllTiles;
  double threshold = 0.5;
};

struct Scenario {
  LocalizedText name;
  int64_t grid_width = 0;
  int64_t grid_height = 0;
  EntityIndex<Building> start_building;
  EntityIndex<VictoryCondition> victory_condition;
  GenerationMode generation_mode = GenerationMode::RandomWhiteBlack;
  double black_ratio = 0.5;
};

const char* special_behavior_name(SpecialBehavior behavior);
const char* victory_kind_name(VictoryKind kind);
const char* generation_mode_name(GenerationMode mode);

} // namespace starpack::content
