#pragma once

#include "starpack_content/entities.h"

#include <cstdint>
#include <optional>
#include <vector>

namespace starpack::content {

struct NoDerivedStats {};

struct BuildingStats {
  int64_t total_yield = 0;
  double yield_per_cost = 0.0;
};

struct TechnologyStats {
  std::vector<EntityIndex<Technology>> prerequisites;
  std::vector<EntityIndex<Technology>> unlocks;
  int depth = 0;  // 0 for technologies without prerequisites
};

struct WeaponStats {
  double throughput = 0.0;
  std::optional<double> throughput_per_power;
};

struct EngineStats {
  std::optional<double> efficiency;
};

struct ShieldStats {
  double strength_per_cost = 0.0;
};

struct HullStats {
  double cost_per_slot = 0.0;
};

struct ScenarioStats {
  int64_t tile_count = 0;
  int64_t black_tiles = 0;
};

template <typename E>
struct DerivedStatsOf {
  using type = NoDerivedStats;
};
template <>
struct DerivedStatsOf<Building> {
  using type = BuildingStats;
};
template <>
struct DerivedStatsOf<Technology> {
  using type = TechnologyStats;
};
template <>
struct DerivedStatsOf<Weapon> {
  using type = WeaponStats;
};
template <>
struct DerivedStatsOf<Engine> {
  using type = EngineStats;
};
template <>
struct DerivedStatsOf<Shield> {
  using type = ShieldStats;
};
template <>
struct DerivedStatsOf<HullClass> {
  using type = HullStats;
};
template <>
struct DerivedStatsOf<Scenario> {
  using type = ScenarioStats;
};

template <typename E>
using derived_stats_t = typename DerivedStatsOf<E>::type;

// Pure functions of validated fields. Nothing here keeps state between calls.
BuildingStats compute_stats(const Building& building);
WeaponStats compute_stats(const Weapon& weapon);
EngineStats compute_stats(const Engine& engine);
ShieldStats compute_stats(const Shield& shield);
HullStats compute_stats(const HullClass& hull);
ScenarioStats compute_stats(const Scenario& scenario);
NoDerivedStats compute_stats(const CellType&);
NoDerivedStats compute_stats(const TechEdge&);
NoDerivedStats compute_stats(const VictoryCondition&);

// Research graph: prerequisites and unlocks per technology plus chain depth.
// The edges must be acyclic; a cycle is cut where it is found.
std::vector<TechnologyStats> compute_research_stats(size_t technology_count, const std::vector<TechEdge>& edges);

} // namespace starpack::content
