#include "starpack/config.h"
#include "starpack/log.h"
#include "starpack/paths.h"
#include "starpack/reload_supervisor.h"
#include "starpack_content/pipeline.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

namespace {
std::atomic<bool> g_quit{false};

void on_interrupt(int) {
  g_quit = true;
}

// Gameplay-side read: everything goes through one snapshot reference.
void print_summary(const starpack::content::Snapshot& snapshot) {
  using namespace starpack::content;
  const GameRegistry& registry = *snapshot.registry;
  std::cout << "generation " << snapshot.generation << " (schema_version " << snapshot.schema_version << "):";
  for (const auto& source : snapshot.load_order) {
    std::cout << " " << source;
  }
  std::cout << "\n";
  std::cout << "  " << registry.entity_count() << " entities, " << registry.collection<Building>().size()
            << " buildings, " << registry.collection<Technology>().size() << " technologies, "
            << registry.collection<Scenario>().size() << " scenarios\n";

  const auto& weapons = registry.collection<Weapon>();
  for (const auto index : weapons.indices()) {
    std::cout << "  weapon " << weapons.id_of(index).str() << ": " << weapons.get(index).name.get("en")
              << " throughput " << weapons.get_derived(index).throughput << "\n";
  }
  const auto& scenarios = registry.collection<Scenario>();
  for (const auto index : scenarios.indices()) {
    const Scenario& scenario = scenarios.get(index);
    const Building& start = registry.get(scenario.start_building);
    std::cout << "  scenario " << scenarios.id_of(index).str() << ": " << scenario.grid_width << "x"
              << scenario.grid_height << ", starts with " << start.name.get("en") << ", "
              << scenarios.get_derived(index).black_tiles << " black tiles\n";
  }
}
} // namespace

int main(int argc, char** argv) {
  std::optional<std::filesystem::path> config_override;
  int seconds = 0;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_override = std::filesystem::path(argv[++i]);
    } else if (arg == "--seconds" && i + 1 < argc) {
      seconds = std::max(0, std::atoi(argv[++i]));
    }
  }

  const auto paths = starpack::resolve_paths(argc > 0 ? argv[0] : nullptr, config_override);
  starpack::log::init("starpack_demo", paths.root);
  starpack::log::install_crash_handlers();
  std::signal(SIGINT, on_interrupt);

  const auto cfg = starpack::load_pipeline_config(paths.config_path);
  if (const auto level = starpack::log::parse_level(cfg.log_level)) {
    starpack::log::set_level(*level);
  }
  starpack::runtime::ReloadSupervisorInit init;
  init.pipeline = starpack::content::pipeline_options_from_config(cfg, paths.root);
  init.debounce_ms = cfg.debounce_ms;
  init.poll_interval_ms = cfg.poll_interval_ms;
  init.queue_capacity = cfg.queue_capacity;

  starpack::content::SnapshotHandle handle;
  starpack::runtime::ReloadSupervisor supervisor(handle);
  starpack::content::Diagnostics diagnostics;
  if (!supervisor.init(init, diagnostics)) {
    for (const auto& diag : diagnostics) {
      std::cerr << starpack::content::format_diagnostic(diag) << "\n";
    }
    starpack::log::error("startup content load failed; exiting");
    starpack::log::shutdown();
    return 1;
  }

  if (cfg.hot_reload) {
    std::string error;
    if (!supervisor.start(error)) {
      starpack::log::warn("hot reload disabled: " + error);
    }
  }

  uint64_t shown_generation = 0;
  const auto started = std::chrono::steady_clock::now();
  while (!g_quit.load()) {
    const auto snapshot = handle.current();
    if (snapshot && snapshot->generation != shown_generation) {
      shown_generation = snapshot->generation;
      print_summary(*snapshot);
    }
    if (!cfg.hot_reload) {
      break;
    }
    if (seconds > 0 && std::chrono::steady_clock::now() - started >= std::chrono::seconds(seconds)) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  supervisor.stop();
  starpack::log::shutdown();
  return 0;
}
