#include "starpack/log.h"
#include "starpack/paths.h"
#include "starpack/reload_supervisor.h"
#include "starpack_content/decoder.h"
#include "starpack_content/derived_stats.h"
#include "starpack_content/merge.h"
#include "starpack_content/pipeline.h"
#include "starpack_content/resolver.h"
#include "starpack_content/validator.h"
#include "starpack_data/serialization.h"
#include "spctl/cli_api.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace starpack::content;

namespace {
bool write_text(const fs::path& path, const std::string& contents) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path);
  if (!out) return false;
  out << contents;
  return true;
}

bool write_json(const fs::path& path, const json& value) {
  return write_text(path, value.dump(2));
}

json text(const std::string& en) {
  return {{"en", en}, {"ru", en + " (ru)"}};
}

json building(const std::string& id, int cost) {
  json b;
  b["id"] = id;
  b["name"] = text(id);
  b["cost"] = cost;
  b["buildable_on"] = json::array({"white"});
  b["counts_for_adjacency"] = true;
  b["yields_housing"] = 2;
  return b;
}

json collection_doc(const std::string& name, const json& entries) {
  json doc;
  doc[name] = entries;
  return doc;
}

// Small but complete base pack: every reference resolves, every text has both locales.
void write_base_pack(const fs::path& data, int housing_cost = 5) {
  write_json(data / "manifest.json", {{"schema_version", 1}});
  write_json(data / "cell_types.json",
             collection_doc("cell_types",
                            json::array({{{"id", "white"}, {"name", text("White")}, {"is_usable", true}},
                                         {{"id", "black"}, {"name", text("Black")}, {"is_usable", false}}})));
  write_json(data / "technologies.json",
             collection_doc("technologies",
                            json::array({{{"id", "basic"}, {"name", text("Basic")}, {"research_cost", 10}},
                                         {{"id", "advanced"}, {"name", text("Advanced")}, {"research_cost", 20}}})));
  write_json(data / "tech_edges.json",
             collection_doc("tech_edges", json::array({{{"from", "basic"}, {"to", "advanced"}}})));

  json farm = building("farm", 8);
  farm["yields_housing"] = 0;
  farm["yields_food"] = 3;
  farm["unlocked_by"] = "advanced";
  write_json(data / "buildings.json", collection_doc("buildings", json::array({building("housing", housing_cost), farm})));

  json blaster;
  blaster["id"] = "blaster";
  blaster["name"] = text("Blaster");
  blaster["damage"] = 10;
  blaster["fire_rate"] = 2;
  blaster["range"] = 3;
  blaster["power_use"] = 4;
  blaster["cost"] = 6;
  blaster["requires_tech"] = "basic";
  write_json(data / "weapons.json", collection_doc("weapons", json::array({blaster})));

  write_json(data / "engines.json",
             collection_doc("engines",
                            json::array({{{"id", "ion_drive"}, {"name", text("Ion")}, {"thrust", 6}, {"cost", 10}}})));
  write_json(data / "victory_conditions.json",
             collection_doc("victory_conditions",
                            json::array({{{"id", "cover_all"}, {"name", text("Cover")}, {"kind", "cover_all_tiles"}}})));

  json scenario;
  scenario["id"] = "tutorial";
  scenario["name"] = text("Tutorial");
  scenario["grid_width"] = 4;
  scenario["grid_height"] = 5;
  scenario["start_building"] = "housing";
  scenario["victory_condition"] = "cover_all";
  scenario["black_ratio"] = 0.25;
  write_json(data / "scenarios.json", collection_doc("scenarios", json::array({scenario})));
}

void write_mod(const fs::path& mods_root,
               const std::string& name,
               std::optional<int> priority,
               std::optional<int> schema_version,
               const json& buildings) {
  json descriptor = json::object();
  if (priority) descriptor["priority"] = *priority;
  if (schema_version) descriptor["schema_version"] = *schema_version;
  write_json(mods_root / name / "mod.json", descriptor);
  if (!buildings.is_null()) {
    write_json(mods_root / name / "data" / "buildings.json", collection_doc("buildings", buildings));
  }
}

PipelineOptions options_for(const fs::path& root) {
  PipelineOptions options;
  options.data_root = root / "base";
  options.mods_root = root / "mods";
  return options;
}

fs::path fresh_dir(const fs::path& parent, const std::string& name) {
  const fs::path dir = parent / name;
  std::error_code ec;
  fs::remove_all(dir, ec);
  fs::create_directories(dir);
  return dir;
}

bool has_diagnostic(const Diagnostics& diagnostics, Severity severity, DiagnosticKind kind) {
  for (const auto& diag : diagnostics) {
    if (diag.severity == severity && diag.kind == kind) return true;
  }
  return false;
}

int64_t building_cost(const LoadResult& result, const std::string& id) {
  const auto& registry = *result.snapshot->registry;
  const auto index = registry.resolve<Building>(id);
  return index ? registry.get(*index).cost : -1;
}

void dump_diagnostics(const Diagnostics& diagnostics) {
  for (const auto& diag : diagnostics) {
    std::cerr << "  " << format_diagnostic(diag) << "\n";
  }
}
} // namespace

int main(int argc, char** argv) {
  const fs::path root = fs::temp_directory_path() / "starpack_tests_smoke";
  std::error_code ec;
  fs::remove_all(root, ec);
  fs::create_directories(root);
  starpack::log::init("starpack_tests", root);

  int failures = 0;

  // Cross-collection index mixing does not compile.
  static_assert(!std::is_convertible_v<EntityIndex<Building>, EntityIndex<Technology>>,
                "indices of different collections must not convert");
  static_assert(!std::is_constructible_v<EntityIndex<Building>, uint32_t>,
                "indices are minted by the registry builder only");

  // Test: plain base pack loads and publishes typed records.
  {
    const fs::path dir = fresh_dir(root, "base_only");
    write_base_pack(dir / "base");
    const auto result = load_candidate(options_for(dir));
    if (!result.loaded()) {
      std::cerr << "base-only load failed\n";
      dump_diagnostics(result.diagnostics);
      ++failures;
    } else {
      if (result.load_order != std::vector<std::string>{"base"}) {
        std::cerr << "unexpected load order for base-only pack\n";
        ++failures;
      }
      if (result.schema_version != 1 || result.snapshot->schema_version != 1) {
        std::cerr << "schema_version should be 1\n";
        ++failures;
      }
      if (has_fatal(result.diagnostics) || count_severity(result.diagnostics, Severity::Warning) != 0) {
        std::cerr << "clean base pack should produce no diagnostics\n";
        dump_diagnostics(result.diagnostics);
        ++failures;
      }
    }
  }

  // Test: scenario 1, priority decides the winner.
  {
    const fs::path dir = fresh_dir(root, "priority");
    write_base_pack(dir / "base", 5);
    write_mod(dir / "mods", "alpha", 0, std::nullopt, json::array({building("housing", 7)}));
    write_mod(dir / "mods", "beta", 10, std::nullopt, json::array({building("housing", 9)}));
    const auto result = load_candidate(options_for(dir));
    if (!result.loaded() || building_cost(result, "housing") != 9) {
      std::cerr << "scenario 1: expected housing cost 9\n";
      ++failures;
    } else if (result.load_order != std::vector<std::string>{"base", "alpha", "beta"}) {
      std::cerr << "scenario 1: unexpected load order\n";
      ++failures;
    }
  }

  // Test: priority beats folder name.
  {
    const fs::path dir = fresh_dir(root, "priority_vs_name");
    write_base_pack(dir / "base", 5);
    write_mod(dir / "mods", "zeta", 0, std::nullopt, json::array({building("housing", 7)}));
    write_mod(dir / "mods", "alpha", 10, std::nullopt, json::array({building("housing", 9)}));
    const auto result = load_candidate(options_for(dir));
    if (!result.loaded() || building_cost(result, "housing") != 9) {
      std::cerr << "higher priority mod should win regardless of folder name\n";
      ++failures;
    }
  }

  // Test: equal priority merges in folder-name order.
  {
    const fs::path dir = fresh_dir(root, "tie_break");
    write_base_pack(dir / "base", 5);
    write_mod(dir / "mods", "mod_b", 3, std::nullopt, json::array({building("housing", 12)}));
    write_mod(dir / "mods", "mod_a", 3, std::nullopt, json::array({building("housing", 11)}));
    const auto result = load_candidate(options_for(dir));
    if (!result.loaded() || building_cost(result, "housing") != 12) {
      std::cerr << "tie-break: lexicographically later folder should win\n";
      ++failures;
    }
  }

  // Test: negative priority still loads after the base pack.
  {
    const fs::path dir = fresh_dir(root, "negative_priority");
    write_base_pack(dir / "base", 5);
    write_mod(dir / "mods", "early", -5, std::nullopt, json::array({building("housing", 3)}));
    const auto result = load_candidate(options_for(dir));
    if (!result.loaded() || building_cost(result, "housing") != 3) {
      std::cerr << "negative priority mod should still override the base pack\n";
      ++failures;
    }
  }

  // Test: merge keeps first-occurrence position and the override trail.
  {
    const fs::path dir = fresh_dir(root, "merge_trail");
    write_base_pack(dir / "base", 5);
    write_mod(dir / "mods", "alpha", 0, std::nullopt, json::array({building("barracks", 4), building("housing", 7)}));
    const auto resolved = resolve_sources(ResolveOptions{dir / "base", dir / "mods"});
    std::vector<DecodedSource> decoded;
    for (const auto& source : resolved.sources) {
      decoded.push_back(decode_source(source, DecodeOptions{}));
    }
    const MergedSet merged = merge_sources(decoded);
    const MergedCollection* buildings = merged.find("buildings");
    const MergedRecord* housing = buildings ? buildings->find("housing") : nullptr;
    if (!housing || housing->trail != std::vector<std::string>{"base", "alpha"} ||
        housing->fields["cost"].get<int>() != 7) {
      std::cerr << "merge trail for housing is wrong\n";
      ++failures;
    }
    if (!buildings || buildings->records.size() != 3 || buildings->records[0].key != "housing" ||
        buildings->records[2].key != "barracks") {
      std::cerr << "merge should keep first-occurrence order and append new ids\n";
      ++failures;
    }
  }

  // Test: scenario 2, duplicate id in one file aborts the startup load.
  {
    const fs::path dir = fresh_dir(root, "duplicate");
    write_base_pack(dir / "base");
    write_json(dir / "base" / "buildings.json",
               collection_doc("buildings", json::array({building("housing", 5), building("housing", 6)})));
    const auto result = load_candidate(options_for(dir));
    if (result.status != LoadStatus::Rejected || result.snapshot ||
        !has_diagnostic(result.diagnostics, Severity::Fatal, DiagnosticKind::DuplicateId)) {
      std::cerr << "scenario 2: duplicate id should reject the load\n";
      ++failures;
    }

    SnapshotHandle handle;
    starpack::runtime::ReloadSupervisor supervisor(handle);
    starpack::runtime::ReloadSupervisorInit init;
    init.pipeline = options_for(dir);
    Diagnostics diagnostics;
    if (supervisor.init(init, diagnostics) || handle.current() || !has_fatal(diagnostics)) {
      std::cerr << "scenario 2: startup must fail without publishing\n";
      ++failures;
    }
  }

  // Test: scenario 3, a mod from a newer schema is skipped and the rest still loads.
  {
    const fs::path dir = fresh_dir(root, "schema_gating");
    write_base_pack(dir / "base", 5);
    write_mod(dir / "mods", "future", 50, 2, json::array({building("housing", 99)}));
    write_mod(dir / "mods", "current", 0, 1, json::array({building("housing", 7)}));
    const auto result = load_candidate(options_for(dir));
    if (!result.loaded()) {
      std::cerr << "scenario 3: load should succeed without the future mod\n";
      dump_diagnostics(result.diagnostics);
      ++failures;
    } else {
      if (building_cost(result, "housing") != 7) {
        std::cerr << "scenario 3: valid mod should still merge\n";
        ++failures;
      }
      if (!has_diagnostic(result.diagnostics, Severity::Error, DiagnosticKind::SchemaVersionRejected)) {
        std::cerr << "scenario 3: skipped mod should be recorded\n";
        ++failures;
      }
      if (result.load_order != std::vector<std::string>{"base", "current"}) {
        std::cerr << "scenario 3: future mod must not appear in the load order\n";
        ++failures;
      }
    }
  }

  // Test: effective schema version is the lowest accepted version.
  {
    const fs::path dir = fresh_dir(root, "schema_min");
    write_base_pack(dir / "base");
    write_mod(dir / "mods", "legacy", 0, 0, json::array({building("shed", 2)}));
    const auto result = load_candidate(options_for(dir));
    if (!result.loaded() || result.schema_version != 0) {
      std::cerr << "effective schema_version should drop to 0\n";
      ++failures;
    }
  }

  // Test: a manifest newer than the runtime is fatal.
  {
    const fs::path dir = fresh_dir(root, "manifest_future");
    write_base_pack(dir / "base");
    write_json(dir / "base" / "manifest.json", {{"schema_version", kRuntimeSchemaVersion + 1}});
    const auto result = load_candidate(options_for(dir));
    if (result.loaded() || !has_diagnostic(result.diagnostics, Severity::Fatal, DiagnosticKind::SchemaVersionRejected)) {
      std::cerr << "future manifest should reject the load\n";
      ++failures;
    }
  }

  // Test: scenario 4 and the other derived values.
  {
    const fs::path dir = fresh_dir(root, "derived");
    write_base_pack(dir / "base");
    const auto result = load_candidate(options_for(dir));
    if (!result.loaded()) {
      std::cerr << "derived: load failed\n";
      ++failures;
    } else {
      const GameRegistry& registry = *result.snapshot->registry;
      const auto blaster = registry.resolve<Weapon>("blaster");
      if (!blaster || registry.get_derived(*blaster).throughput != 20.0 ||
          registry.get_derived(*blaster).throughput_per_power != std::optional<double>(5.0)) {
        std::cerr << "scenario 4: throughput should be 20\n";
        ++failures;
      }
      const auto ion = registry.resolve<Engine>("ion_drive");
      if (!ion || registry.get_derived(*ion).efficiency.has_value()) {
        std::cerr << "engine without power use should have no efficiency\n";
        ++failures;
      }
      const auto farm = registry.resolve<Building>("farm");
      if (!farm || registry.get_derived(*farm).total_yield != 3 || registry.get_derived(*farm).yield_per_cost != 3.0 / 8.0) {
        std::cerr << "farm yield stats are wrong\n";
        ++failures;
      }
      const auto tutorial = registry.resolve<Scenario>("tutorial");
      if (!tutorial || registry.get_derived(*tutorial).tile_count != 20 || registry.get_derived(*tutorial).black_tiles != 5) {
        std::cerr << "scenario tile stats are wrong\n";
        ++failures;
      }
      const auto basic = registry.resolve<Technology>("basic");
      const auto advanced = registry.resolve<Technology>("advanced");
      if (!basic || !advanced) {
        std::cerr << "technologies missing\n";
        ++failures;
      } else {
        const auto& adv_stats = registry.get_derived(*advanced);
        const auto& basic_stats = registry.get_derived(*basic);
        if (adv_stats.depth != 1 || basic_stats.depth != 0 || adv_stats.prerequisites.size() != 1 ||
            adv_stats.prerequisites[0] != *basic || basic_stats.unlocks.size() != 1 || basic_stats.unlocks[0] != *advanced) {
          std::cerr << "research graph stats are wrong\n";
          ++failures;
        }
      }

      // Derived purity: recomputing from the same entities gives the same values.
      if (blaster) {
        const Weapon& weapon = registry.get(*blaster);
        const WeaponStats first = compute_stats(weapon);
        const WeaponStats second = compute_stats(weapon);
        if (first.throughput != second.throughput || first.throughput_per_power != second.throughput_per_power ||
            first.throughput != registry.get_derived(*blaster).throughput) {
          std::cerr << "derived stats are not pure\n";
          ++failures;
        }
      }
    }
  }

  // Test: determinism and idempotence of repeated loads.
  {
    const fs::path dir = fresh_dir(root, "determinism");
    write_base_pack(dir / "base");
    write_mod(dir / "mods", "alpha", 1, std::nullopt, json::array({building("barracks", 4), building("housing", 7)}));
    write_mod(dir / "mods", "beta", 1, std::nullopt, json::array({building("silo", 6)}));
    const auto first = load_candidate(options_for(dir));
    const auto second = load_candidate(options_for(dir));
    if (!first.loaded() || !second.loaded()) {
      std::cerr << "determinism: loads failed\n";
      ++failures;
    } else {
      const json a = first.snapshot->registry->to_json();
      const json b = second.snapshot->registry->to_json();
      if (a.dump() != b.dump()) {
        std::cerr << "determinism: repeated loads differ\n";
        ++failures;
      }
      const auto silo_a = first.snapshot->registry->resolve<Building>("silo");
      const auto silo_b = second.snapshot->registry->resolve<Building>("silo");
      if (!silo_a || !silo_b || silo_a->value() != silo_b->value() || silo_a->value() != 3) {
        std::cerr << "determinism: index assignment differs\n";
        ++failures;
      }
    }
  }

  // Test: typed lookup and reference linking.
  {
    const fs::path dir = fresh_dir(root, "typed_lookup");
    write_base_pack(dir / "base");
    const auto result = load_candidate(options_for(dir));
    if (!result.loaded()) {
      std::cerr << "typed lookup: load failed\n";
      ++failures;
    } else {
      const GameRegistry& registry = *result.snapshot->registry;
      const auto& buildings = registry.collection<Building>();
      const auto housing = buildings.resolve("housing");
      if (!housing || buildings.id_of(*housing).str() != "housing" || buildings.find("housing") == nullptr) {
        std::cerr << "housing lookup failed\n";
        ++failures;
      }
      if (buildings.resolve("basic") || buildings.find("nope") != nullptr) {
        std::cerr << "lookup of a foreign or unknown id should fail\n";
        ++failures;
      }
      const auto tutorial = registry.resolve<Scenario>("tutorial");
      if (!tutorial || !housing || registry.get(*tutorial).start_building != *housing) {
        std::cerr << "scenario start_building should link to housing\n";
        ++failures;
      }
      const auto farm = registry.resolve<Building>("farm");
      const auto advanced = registry.resolve<Technology>("advanced");
      if (!farm || !advanced || registry.get(*farm).unlocked_by != advanced) {
        std::cerr << "farm unlocked_by should link to advanced\n";
        ++failures;
      }
      if (registry.get(*housing).name.get("de") != "housing" || registry.get(*housing).name.get("ru") != "housing (ru)") {
        std::cerr << "localized text lookup is wrong\n";
        ++failures;
      }
      bool threw = false;
      try {
        (void)buildings.get(EntityIndex<Building>{});
      } catch (const std::out_of_range&) {
        threw = true;
      }
      if (!threw) {
        std::cerr << "invalid index should throw\n";
        ++failures;
      }
    }
  }

  // Test: unresolved reference is fatal.
  {
    const fs::path dir = fresh_dir(root, "unresolved");
    write_base_pack(dir / "base");
    json bad = building("lab", 4);
    bad["unlocked_by"] = "no_such_tech";
    write_mod(dir / "mods", "broken_ref", 0, std::nullopt, json::array({bad}));
    const auto result = load_candidate(options_for(dir));
    if (result.loaded() || !has_diagnostic(result.diagnostics, Severity::Fatal, DiagnosticKind::UnresolvedReference)) {
      std::cerr << "unresolved reference should reject the load\n";
      ++failures;
    }
  }

  // Test: positivity rule is fatal.
  {
    const fs::path dir = fresh_dir(root, "positivity");
    write_base_pack(dir / "base");
    write_mod(dir / "mods", "free_housing", 0, std::nullopt, json::array({building("housing", 0)}));
    const auto result = load_candidate(options_for(dir));
    if (result.loaded() || !has_diagnostic(result.diagnostics, Severity::Fatal, DiagnosticKind::InvariantViolation)) {
      std::cerr << "zero cost should reject the load\n";
      ++failures;
    }
  }

  // Test: research cycle is fatal.
  {
    const fs::path dir = fresh_dir(root, "cycle");
    write_base_pack(dir / "base");
    write_json(dir / "base" / "tech_edges.json",
               collection_doc("tech_edges", json::array({{{"from", "basic"}, {"to", "advanced"}},
                                                         {{"from", "advanced"}, {"to", "basic"}}})));
    const auto result = load_candidate(options_for(dir));
    if (result.loaded() || !has_diagnostic(result.diagnostics, Severity::Fatal, DiagnosticKind::InvariantViolation)) {
      std::cerr << "research cycle should reject the load\n";
      ++failures;
    }
  }

  // Test: a mod that fails to decode is excluded as a whole; siblings still merge.
  {
    const fs::path dir = fresh_dir(root, "mod_isolation");
    write_base_pack(dir / "base", 5);
    write_mod(dir / "mods", "broken", 20, std::nullopt, json::array({building("housing", 50)}));
    write_text(dir / "mods" / "broken" / "data" / "weapons.json", "{ \"weapons\": [ { \"id\": ");
    write_mod(dir / "mods", "good", 0, std::nullopt, json::array({building("housing", 7)}));
    const auto result = load_candidate(options_for(dir));
    if (!result.loaded()) {
      std::cerr << "mod isolation: load should survive a broken mod\n";
      dump_diagnostics(result.diagnostics);
      ++failures;
    } else {
      if (building_cost(result, "housing") != 7) {
        std::cerr << "mod isolation: broken mod must not contribute any file\n";
        ++failures;
      }
      if (!has_diagnostic(result.diagnostics, Severity::Error, DiagnosticKind::ParseError)) {
        std::cerr << "mod isolation: parse error should be reported as an error\n";
        ++failures;
      }
      if (result.load_order != std::vector<std::string>{"base", "good"}) {
        std::cerr << "mod isolation: unexpected load order\n";
        ++failures;
      }
    }
  }

  // Test: a base file that fails to decode is fatal.
  {
    const fs::path dir = fresh_dir(root, "base_parse_error");
    write_base_pack(dir / "base");
    write_text(dir / "base" / "buildings.json", "{ \"buildings\": [ ");
    const auto result = load_candidate(options_for(dir));
    if (result.loaded() || !has_diagnostic(result.diagnostics, Severity::Fatal, DiagnosticKind::ParseError)) {
      std::cerr << "broken base file should reject the load\n";
      ++failures;
    }
  }

  // Test: shape errors name the offending keypath.
  {
    const auto* schema = find_schema("buildings");
    json doc = collection_doc("buildings", json::array({building("housing", 5)}));
    doc["buildings"][0]["cost"] = "cheap";
    const DecodedFile decoded = decode_document(doc, *schema, "buildings.json", "base");
    bool found = false;
    for (const auto& diag : decoded.diagnostics) {
      if (diag.kind == DiagnosticKind::SchemaError && diag.message.find("buildings[0].cost") != std::string::npos) {
        found = true;
      }
    }
    if (decoded.ok || !found) {
      std::cerr << "shape error should be reported at buildings[0].cost\n";
      ++failures;
    }
  }

  // Test: an unsigned integer beyond int64 is a shape error, not a wrapped value.
  {
    const auto* schema = find_schema("buildings");
    json doc = collection_doc("buildings", json::array({building("housing", 5)}));
    doc["buildings"][0]["cost"] = std::numeric_limits<uint64_t>::max();
    const DecodedFile decoded = decode_document(doc, *schema, "buildings.json", "base");
    bool found = false;
    for (const auto& diag : decoded.diagnostics) {
      if (diag.kind == DiagnosticKind::SchemaError && diag.message.find("buildings[0].cost") != std::string::npos &&
          diag.message.find("out of range") != std::string::npos) {
        found = true;
      }
    }
    if (decoded.ok || !found) {
      std::cerr << "huge cost should be rejected at buildings[0].cost\n";
      ++failures;
    }

    const fs::path dir = fresh_dir(root, "huge_unsigned");
    write_base_pack(dir / "base");
    write_text(dir / "base" / "buildings.json",
               "{ \"buildings\": [ { \"id\": \"housing\", \"name\": { \"en\": \"housing\", \"ru\": \"housing (ru)\" },"
               " \"cost\": 18446744073709551615, \"buildable_on\": [\"white\"] } ] }");
    const auto result = load_candidate(options_for(dir));
    if (result.loaded() || !has_diagnostic(result.diagnostics, Severity::Fatal, DiagnosticKind::SchemaError)) {
      std::cerr << "huge cost in the base pack should reject the load\n";
      dump_diagnostics(result.diagnostics);
      ++failures;
    }
  }

  // Test: a descriptor number outside the int range skips the mod.
  {
    const fs::path dir = fresh_dir(root, "descriptor_range");
    write_base_pack(dir / "base", 5);
    write_mod(dir / "mods", "wide", 0, std::nullopt, json::array({building("housing", 99)}));
    write_text(dir / "mods" / "wide" / "mod.json", "{ \"priority\": 1, \"schema_version\": 4294967297 }");
    write_mod(dir / "mods", "narrow", 0, std::nullopt, json::array({building("housing", 7)}));
    write_text(dir / "mods" / "narrow" / "mod.json", "{ \"priority\": -2147483649 }");
    const auto result = load_candidate(options_for(dir));
    if (!result.loaded()) {
      std::cerr << "descriptor range: load should survive unreadable descriptors\n";
      dump_diagnostics(result.diagnostics);
      ++failures;
    } else {
      if (building_cost(result, "housing") != 5 || result.load_order != std::vector<std::string>{"base"}) {
        std::cerr << "descriptor range: mods with out-of-range descriptors must not merge\n";
        ++failures;
      }
      size_t skipped = 0;
      for (const auto& diag : result.diagnostics) {
        if (diag.severity == Severity::Error && diag.kind == DiagnosticKind::ParseError &&
            diag.message.find("out of range") != std::string::npos) {
          ++skipped;
        }
      }
      if (skipped != 2) {
        std::cerr << "descriptor range: both mods should be reported\n";
        dump_diagnostics(result.diagnostics);
        ++failures;
      }
    }
  }

  // Test: integer fields above the value limit are fatal before any derived value is computed.
  {
    const fs::path dir = fresh_dir(root, "value_limit");
    write_base_pack(dir / "base");
    json scenario;
    scenario["id"] = "tutorial";
    scenario["name"] = text("Tutorial");
    scenario["grid_width"] = int64_t{4294967296};
    scenario["grid_height"] = int64_t{4294967296};
    scenario["start_building"] = "housing";
    scenario["victory_condition"] = "cover_all";
    write_json(dir / "base" / "scenarios.json", collection_doc("scenarios", json::array({scenario})));
    const auto result = load_candidate(options_for(dir));
    bool found = false;
    for (const auto& diag : result.diagnostics) {
      if (diag.severity == Severity::Fatal && diag.kind == DiagnosticKind::InvariantViolation &&
          diag.id == "tutorial" && diag.message.find("grid_width is out of range") != std::string::npos) {
        found = true;
      }
    }
    if (result.loaded() || !found) {
      std::cerr << "oversized grid should be rejected as out of range\n";
      dump_diagnostics(result.diagnostics);
      ++failures;
    }

    json farm = building("farm", 8);
    farm["yields_food"] = kMaxIntFieldValue;
    farm["yields_housing"] = kMaxIntFieldValue;
    farm["yields_production"] = kMaxIntFieldValue;
    farm["yields_science"] = kMaxIntFieldValue;
    const fs::path edge = fresh_dir(root, "value_limit_edge");
    write_base_pack(edge / "base");
    write_mod(edge / "mods", "rich", 0, std::nullopt, json::array({farm}));
    const auto at_limit = load_candidate(options_for(edge));
    const auto farm_index = at_limit.loaded() ? at_limit.snapshot->registry->resolve<Building>("farm") : std::nullopt;
    if (!farm_index || at_limit.snapshot->registry->get_derived(*farm_index).total_yield != 4 * kMaxIntFieldValue) {
      std::cerr << "yields at the value limit should load and sum exactly\n";
      dump_diagnostics(at_limit.diagnostics);
      ++failures;
    }
  }

  // Test: tech edges override by composite key.
  {
    const fs::path dir = fresh_dir(root, "edge_override");
    write_base_pack(dir / "base");
    write_mod(dir / "mods", "edges", 0, std::nullopt, json());
    write_json(dir / "mods" / "edges" / "data" / "tech_edges.json",
               collection_doc("tech_edges", json::array({{{"from", "basic"}, {"to", "advanced"}}})));
    const auto resolved = resolve_sources(ResolveOptions{dir / "base", dir / "mods"});
    std::vector<DecodedSource> decoded;
    for (const auto& source : resolved.sources) {
      decoded.push_back(decode_source(source, DecodeOptions{}));
    }
    const MergedSet merged = merge_sources(decoded);
    const MergedCollection* edges = merged.find("tech_edges");
    const MergedRecord* edge = edges ? edges->find(composite_key("basic", "advanced")) : nullptr;
    if (!edges || edges->records.size() != 1 || !edge || edge->trail != std::vector<std::string>{"base", "edges"}) {
      std::cerr << "tech edge with the same endpoints should be overridden, not duplicated\n";
      ++failures;
    }
    const auto result = load_candidate(options_for(dir));
    if (!result.loaded() || result.snapshot->registry->collection<TechEdge>().size() != 1) {
      std::cerr << "registry should hold one edge after the override\n";
      dump_diagnostics(result.diagnostics);
      ++failures;
    }
  }

  // Test: an override that omits optional fields gets their defaults, not the base values.
  {
    const fs::path dir = fresh_dir(root, "override_defaults");
    write_base_pack(dir / "base");
    json plain;
    plain["id"] = "housing";
    plain["name"] = text("housing");
    plain["cost"] = 6;
    plain["buildable_on"] = json::array({"white"});
    write_mod(dir / "mods", "plain", 0, std::nullopt, json::array({plain}));
    const auto result = load_candidate(options_for(dir));
    const auto housing = result.loaded() ? result.snapshot->registry->resolve<Building>("housing") : std::nullopt;
    if (!housing) {
      std::cerr << "override defaults: load failed\n";
      dump_diagnostics(result.diagnostics);
      ++failures;
    } else {
      const Building& b = result.snapshot->registry->get(*housing);
      if (b.cost != 6 || b.counts_for_adjacency || b.yields.housing != 0) {
        std::cerr << "omitted optional fields should fall back to their defaults\n";
        ++failures;
      }
    }
  }

  // Test: non-negative and ratio rules are fatal.
  {
    const fs::path dir = fresh_dir(root, "rules");
    write_base_pack(dir / "base");
    json hungry = building("hungry", 4);
    hungry["yields_food"] = -1;
    write_mod(dir / "mods", "negative", 0, std::nullopt, json::array({hungry}));
    const auto negative = load_candidate(options_for(dir));
    bool saw_negative = false;
    for (const auto& diag : negative.diagnostics) {
      if (diag.severity == Severity::Fatal && diag.kind == DiagnosticKind::InvariantViolation && diag.id == "hungry" &&
          diag.message.find("must not be negative") != std::string::npos) {
        saw_negative = true;
      }
    }
    if (negative.loaded() || !saw_negative) {
      std::cerr << "negative yield should reject the load\n";
      ++failures;
    }

    const fs::path ratio_dir = fresh_dir(root, "rules_ratio");
    write_base_pack(ratio_dir / "base");
    json scenario;
    scenario["id"] = "tutorial";
    scenario["name"] = text("Tutorial");
    scenario["grid_width"] = 4;
    scenario["grid_height"] = 5;
    scenario["start_building"] = "housing";
    scenario["victory_condition"] = "cover_all";
    scenario["black_ratio"] = 1.5;
    write_json(ratio_dir / "base" / "scenarios.json", collection_doc("scenarios", json::array({scenario})));
    const auto ratio = load_candidate(options_for(ratio_dir));
    bool saw_ratio = false;
    for (const auto& diag : ratio.diagnostics) {
      if (diag.severity == Severity::Fatal && diag.kind == DiagnosticKind::InvariantViolation && diag.id == "tutorial" &&
          diag.message.find("must be within [0, 1]") != std::string::npos) {
        saw_ratio = true;
      }
    }
    if (ratio.loaded() || !saw_ratio) {
      std::cerr << "black_ratio above 1 should reject the load\n";
      ++failures;
    }
  }

  // Test: advisory diagnostics never block publication.
  {
    const fs::path dir = fresh_dir(root, "advisory");
    write_base_pack(dir / "base");
    json odd = building("Fancy-Hall", 9);
    odd["name"] = "Fancy hall";
    write_mod(dir / "mods", "style", 0, std::nullopt, json::array({odd}));
    fs::create_directories(dir / "mods" / "not_a_mod");
    write_text(dir / "base" / "notes.json", "{}");
    const auto result = load_candidate(options_for(dir));
    if (!result.loaded()) {
      std::cerr << "advisory: warnings must not reject the load\n";
      dump_diagnostics(result.diagnostics);
      ++failures;
    } else {
      if (!has_diagnostic(result.diagnostics, Severity::Warning, DiagnosticKind::LocalizationWarning)) {
        std::cerr << "advisory: missing ru text should warn\n";
        ++failures;
      }
      if (!has_diagnostic(result.diagnostics, Severity::Warning, DiagnosticKind::NamingWarning)) {
        std::cerr << "advisory: odd id should warn\n";
        ++failures;
      }
      if (result.snapshot->diagnostics.empty()) {
        std::cerr << "advisory: snapshot should keep its advisory diagnostics\n";
        ++failures;
      }
    }
  }

  // Test: lint reports without building a registry.
  {
    const fs::path dir = fresh_dir(root, "lint");
    write_base_pack(dir / "base");
    write_mod(dir / "mods", "alpha", 2, std::nullopt, json::array({building("housing", 7)}));
    const auto clean = lint(options_for(dir));
    if (!clean.ok || clean.sources.size() != 2 || clean.sources[1].name != "alpha" || clean.sources[1].priority != 2) {
      std::cerr << "lint: clean pack should pass with two sources\n";
      ++failures;
    }
    write_json(dir / "base" / "buildings.json",
               collection_doc("buildings", json::array({building("housing", 5), building("housing", 6)})));
    const auto dirty = lint(options_for(dir));
    if (dirty.ok || !has_diagnostic(dirty.diagnostics, Severity::Fatal, DiagnosticKind::DuplicateId)) {
      std::cerr << "lint: duplicate id should fail\n";
      ++failures;
    }
  }

  // Test: spctl content lint exit codes.
  {
    const fs::path dir = fresh_dir(root, "cli_lint");
    write_base_pack(dir / "base");
    ContentCliOptions opts;
    opts.data_root = dir / "base";
    opts.mods_root = dir / "mods";
    opts.config_path = dir / "missing.yaml";
    std::ostringstream out;
    if (content_lint(argc > 0 ? argv[0] : nullptr, opts, out) != 0 || out.str().find("lint passed") == std::string::npos) {
      std::cerr << "spctl lint should pass on a clean pack\n" << out.str();
      ++failures;
    }

    write_mod(dir / "mods", "style", 0, std::nullopt, json::array({building("Odd-Name", 3)}));
    std::ostringstream warn_out;
    if (content_lint(argc > 0 ? argv[0] : nullptr, opts, warn_out) != 0 ||
        warn_out.str().find("lint finished with") == std::string::npos) {
      std::cerr << "spctl lint should pass with warnings\n" << warn_out.str();
      ++failures;
    }

    write_mod(dir / "mods", "broken", 0, std::nullopt, json::array({building("housing", 7)}));
    write_text(dir / "mods" / "broken" / "data" / "weapons.json", "{ \"weapons\": [ ");
    std::ostringstream error_out;
    if (content_lint(argc > 0 ? argv[0] : nullptr, opts, error_out) != 0 ||
        error_out.str().find("lint finished with 2 errors") == std::string::npos ||
        error_out.str().find("lint failed") != std::string::npos) {
      std::cerr << "spctl lint summary should match its passing exit code on mod errors\n" << error_out.str();
      ++failures;
    }
    opts.strict = true;
    std::ostringstream strict_out;
    if (content_lint(argc > 0 ? argv[0] : nullptr, opts, strict_out) != 1) {
      std::cerr << "spctl lint --strict should fail on warnings\n";
      ++failures;
    }

    opts.strict = false;
    opts.json_output = true;
    write_text(dir / "base" / "scenarios.json", "not json");
    std::ostringstream json_out;
    const int rc = content_lint(argc > 0 ? argv[0] : nullptr, opts, json_out);
    json report;
    try {
      report = json::parse(json_out.str());
    } catch (const std::exception& e) {
      std::cerr << "spctl lint --json output is not JSON: " << e.what() << "\n";
    }
    if (rc != 1 || !report.is_object() || report.value("ok", true) || report.value("fatal", 0) == 0) {
      std::cerr << "spctl lint --json should report the fatal parse error\n";
      ++failures;
    }
  }

  // Test: spctl content dump writes canonical JSON.
  {
    const fs::path dir = fresh_dir(root, "cli_dump");
    write_base_pack(dir / "base");
    ContentCliOptions opts;
    opts.data_root = dir / "base";
    opts.config_path = dir / "missing.yaml";
    opts.out_path = dir / "out" / "registry.json";
    std::ostringstream out;
    json dumped;
    std::string error;
    if (content_dump(argc > 0 ? argv[0] : nullptr, opts, out) != 0 ||
        !starpack::data::load_json_file(*opts.out_path, dumped, error)) {
      std::cerr << "spctl dump failed: " << error << "\n";
      ++failures;
    } else if (!dumped.contains("collections") || dumped["collections"]["weapons"][0]["derived"]["throughput"] != 20.0) {
      std::cerr << "spctl dump should include derived values\n";
      ++failures;
    }
  }

#if STARPACK_ENABLE_DATA_YAML
  // Test: YAML and JSON encodings of the same pack produce the same registry.
  {
    const fs::path json_dir = fresh_dir(root, "encoding_json");
    const fs::path yaml_dir = fresh_dir(root, "encoding_yaml");
    write_base_pack(json_dir / "base");
    write_base_pack(yaml_dir / "base");
    fs::remove(yaml_dir / "base" / "buildings.json");
    write_text(yaml_dir / "base" / "buildings.yaml",
               "buildings:\n"
               "  - id: housing\n"
               "    name: { en: \"housing\", ru: \"housing (ru)\" }\n"
               "    cost: 5\n"
               "    buildable_on: [white]\n"
               "    counts_for_adjacency: true\n"
               "    yields_housing: 2\n"
               "  - id: farm\n"
               "    name: { en: \"farm\", ru: \"farm (ru)\" }\n"
               "    cost: 8\n"
               "    buildable_on: [white]\n"
               "    counts_for_adjacency: true\n"
               "    yields_housing: 0\n"
               "    yields_food: 3\n"
               "    unlocked_by: advanced\n");
    const auto from_json = load_candidate(options_for(json_dir));
    const auto from_yaml = load_candidate(options_for(yaml_dir));
    if (!from_json.loaded() || !from_yaml.loaded()) {
      std::cerr << "encoding: loads failed\n";
      dump_diagnostics(from_yaml.diagnostics);
      ++failures;
    } else if (from_json.snapshot->registry->to_json() != from_yaml.snapshot->registry->to_json()) {
      std::cerr << "encoding: YAML and JSON packs differ\n";
      ++failures;
    }

    // Two encodings of one collection in the same pack are rejected.
    write_base_pack(yaml_dir / "base");
    const auto both = load_candidate(options_for(yaml_dir));
    if (both.loaded() || !has_diagnostic(both.diagnostics, Severity::Fatal, DiagnosticKind::SchemaError)) {
      std::cerr << "encoding: duplicate collection files should reject the base pack\n";
      ++failures;
    }
  }

  // Test: YAML scalars become numbers only in decimal notation.
  {
    const YAML::Node node = YAML::Load("hex: 0x10\nratio: 2.5\nbig: 1e3\nword: 12abc\ncount: 7\n");
    const json value = starpack::data::yaml_to_json(node);
    if (!value["hex"].is_string() || value["hex"] != "0x10") {
      std::cerr << "hex scalar should stay a string\n";
      ++failures;
    }
    if (!value["ratio"].is_number_float() || value["ratio"].get<double>() != 2.5 ||
        !value["big"].is_number_float() || value["big"].get<double>() != 1000.0) {
      std::cerr << "decimal scalars should become doubles\n";
      ++failures;
    }
    if (!value["word"].is_string() || !value["count"].is_number_integer() || value["count"].get<int>() != 7) {
      std::cerr << "mixed scalars were converted wrongly\n";
      ++failures;
    }
  }

  // Test: the bundled sample packs load.
  {
    const auto paths = starpack::resolve_paths(argc > 0 ? argv[0] : nullptr, std::nullopt);
    if (fs::exists(paths.root / "packs" / "base" / "manifest.yaml")) {
      PipelineOptions options;
      options.data_root = paths.root / "packs" / "base";
      options.mods_root = paths.root / "packs" / "mods";
      const auto result = load_candidate(options);
      if (!result.loaded()) {
        std::cerr << "sample packs failed to load\n";
        dump_diagnostics(result.diagnostics);
        ++failures;
      } else if (building_cost(result, "housing") != 4 || !result.snapshot->registry->resolve<Weapon>("plasma_lance")) {
        std::cerr << "sample mods were not applied\n";
        ++failures;
      }
    }
  }
#endif

  // Test: log level filter and parsing.
  {
    starpack::log::set_level(starpack::log::Level::Warn);
    starpack::log::info("filtered info line");
    starpack::log::warn("kept warn line");
    starpack::log::set_level(starpack::log::Level::Info);
    const auto lines = starpack::log::recent(5);
    bool saw_info = false;
    bool saw_warn = false;
    for (const auto& line : lines) {
      saw_info = saw_info || line.find("filtered info line") != std::string::npos;
      saw_warn = saw_warn || line.find("[WARN] kept warn line") != std::string::npos;
    }
    if (saw_info || !saw_warn) {
      std::cerr << "log level filter is wrong\n";
      ++failures;
    }
    if (starpack::log::parse_level("Warning") != starpack::log::Level::Warn ||
        starpack::log::parse_level("DEBUG") != starpack::log::Level::Debug || starpack::log::parse_level("loud")) {
      std::cerr << "log level parsing is wrong\n";
      ++failures;
    }
  }

  // Test: snapshot handle publishes with increasing generations.
  {
    SnapshotHandle handle;
    if (handle.current() || handle.generation() != 0) {
      std::cerr << "fresh handle should be empty\n";
      ++failures;
    }
    auto first = std::make_shared<Snapshot>();
    auto second = std::make_shared<Snapshot>();
    handle.publish(first);
    const auto held = handle.current();
    handle.publish(second);
    if (!held || held->generation != 1 || handle.current()->generation != 2) {
      std::cerr << "snapshot generations are wrong\n";
      ++failures;
    }
  }

  fs::remove_all(root, ec);
  starpack::log::shutdown();
  return failures == 0 ? 0 : 1;
}
