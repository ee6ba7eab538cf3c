#include "starpack_content/derived_stats.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace starpack::content {

BuildingStats compute_stats(const Building& building) {
  BuildingStats stats;
  const Yields& y = building.yields;
  stats.total_yield = y.food + y.housing + y.production + y.science;
  if (building.cost > 0) {
    stats.yield_per_cost = static_cast<double>(stats.total_yield) / static_cast<double>(building.cost);
  }
  return stats;
}

WeaponStats compute_stats(const Weapon& weapon) {
  WeaponStats stats;
  stats.throughput = weapon.damage * weapon.fire_rate;
  if (weapon.power_use > 0.0) {
    stats.throughput_per_power = stats.throughput / weapon.power_use;
  }
  return stats;
}

EngineStats compute_stats(const Engine& engine) {
  EngineStats stats;
  if (engine.power_use > 0.0) {
    stats.efficiency = engine.thrust / engine.power_use;
  }
  return stats;
}

ShieldStats compute_stats(const Shield& shield) {
  ShieldStats stats;
  if (shield.cost > 0) {
    stats.strength_per_cost = static_cast<double>(shield.strength) / static_cast<double>(shield.cost);
  }
  return stats;
}

HullStats compute_stats(const HullClass& hull) {
  HullStats stats;
  if (hull.max_items > 0) {
    stats.cost_per_slot = static_cast<double>(hull.cost) / static_cast<double>(hull.max_items);
  }
  return stats;
}

ScenarioStats compute_stats(const Scenario& scenario) {
  ScenarioStats stats;
  stats.tile_count = scenario.grid_width * scenario.grid_height;
  stats.black_tiles = static_cast<int64_t>(std::llround(static_cast<double>(stats.tile_count) * scenario.black_ratio));
  return stats;
}

NoDerivedStats compute_stats(const CellType&) {
  return {};
}

NoDerivedStats compute_stats(const TechEdge&) {
  return {};
}

NoDerivedStats compute_stats(const VictoryCondition&) {
  return {};
}

std::vector<TechnologyStats> compute_research_stats(size_t technology_count, const std::vector<TechEdge>& edges) {
  std::vector<TechnologyStats> stats(technology_count);
  for (const auto& edge : edges) {
    if (!edge.from.valid() || !edge.to.valid()) continue;
    if (edge.from.value() >= technology_count || edge.to.value() >= technology_count) continue;
    stats[edge.to.value()].prerequisites.push_back(edge.from);
    stats[edge.from.value()].unlocks.push_back(edge.to);
  }

  // Depth by memoised walk over prerequisites; 'visiting' breaks any cycle that slipped through.
  std::vector<int> depth(technology_count, -1);
  std::vector<bool> visiting(technology_count, false);
  for (size_t root = 0; root < technology_count; ++root) {
    if (depth[root] >= 0) continue;
    std::vector<std::pair<size_t, size_t>> stack{{root, 0}};
    visiting[root] = true;
    while (!stack.empty()) {
      auto& [node, next] = stack.back();
      const auto& prereqs = stats[node].prerequisites;
      if (next < prereqs.size()) {
        const size_t child = prereqs[next++].value();
        if (depth[child] < 0 && !visiting[child]) {
          visiting[child] = true;
          stack.push_back({child, 0});
        }
        continue;
      }
      int d = 0;
      for (const auto& prereq : prereqs) {
        d = std::max(d, std::max(depth[prereq.value()], 0) + 1);
      }
      depth[node] = d;
      visiting[node] = false;
      stack.pop_back();
    }
  }
  for (size_t i = 0; i < technology_count; ++i) {
    stats[i].depth = depth[i];
  }
  return stats;
}

} // namespace starpack::content
