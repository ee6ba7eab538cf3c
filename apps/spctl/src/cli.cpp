#include "spctl/cli_api.h"

#include "starpack/config.h"
#include "starpack/log.h"
#include "starpack/paths.h"
#include "starpack/reload_supervisor.h"
#include "starpack_content/pipeline.h"
#include "starpack_data/serialization.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <iostream>
#include <mutex>
#include <thread>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {
struct ContentContext {
  starpack::ResolvedPaths paths;
  starpack::PipelineConfig config;
  starpack::content::PipelineOptions pipeline;
};

// Config first, command line overrides on top. A --data without --mods keeps the sibling mods root.
ContentContext make_context(const char* argv0, const ContentCliOptions& opts) {
  ContentContext ctx;
  ctx.paths = starpack::resolve_paths(argv0, opts.config_path);
  ctx.config = starpack::load_pipeline_config(ctx.paths.config_path);
  ctx.pipeline = starpack::content::pipeline_options_from_config(ctx.config, ctx.paths.root);
  if (opts.verbose) {
    starpack::log::set_level(starpack::log::Level::Debug);
  } else if (const auto level = starpack::log::parse_level(ctx.config.log_level)) {
    starpack::log::set_level(*level);
  }
  if (opts.data_root) {
    ctx.pipeline.data_root = fs::absolute(*opts.data_root);
    ctx.pipeline.mods_root = starpack::default_mods_root(ctx.pipeline.data_root);
  }
  if (opts.mods_root) {
    ctx.pipeline.mods_root = fs::absolute(*opts.mods_root);
  }
  return ctx;
}

void print_diagnostics(const starpack::content::Diagnostics& diagnostics, std::ostream& out) {
  for (const auto& diag : diagnostics) {
    out << starpack::content::format_diagnostic(diag) << "\n";
  }
}

json diagnostics_json(const starpack::content::Diagnostics& diagnostics) {
  json arr = json::array();
  for (const auto& diag : diagnostics) {
    arr.push_back(starpack::content::diagnostic_to_json(diag));
  }
  return arr;
}

json source_json(const starpack::content::PackSource& source) {
  json j;
  j["name"] = source.name;
  j["path"] = source.root.generic_string();
  j["base"] = source.is_base;
  j["priority"] = source.priority;
  j["schema_version"] = source.schema_version;
  return j;
}
} // namespace

int content_lint(const char* argv0, const ContentCliOptions& opts, std::ostream& out) {
  using starpack::content::Severity;
  const ContentContext ctx = make_context(argv0, opts);
  const auto result = starpack::content::lint(ctx.pipeline);

  const size_t fatal = starpack::content::count_severity(result.diagnostics, Severity::Fatal);
  const size_t errors = starpack::content::count_severity(result.diagnostics, Severity::Error);
  const size_t warnings = starpack::content::count_severity(result.diagnostics, Severity::Warning);
  const bool failed = fatal > 0 || (opts.strict && (errors > 0 || warnings > 0));

  if (opts.json_output) {
    json report;
    report["ok"] = !failed;
    report["data_root"] = ctx.pipeline.data_root.generic_string();
    report["mods_root"] = ctx.pipeline.mods_root.generic_string();
    report["schema_version"] = result.schema_version;
    report["fatal"] = fatal;
    report["errors"] = errors;
    report["warnings"] = warnings;
    report["diagnostics"] = diagnostics_json(result.diagnostics);
    out << report.dump(2) << "\n";
    return failed ? 1 : 0;
  }

  print_diagnostics(result.diagnostics, out);
  if (failed) {
    out << "lint failed: " << fatal << " fatal, " << errors << " errors, " << warnings << " warnings\n";
  } else if (errors > 0 || warnings > 0) {
    out << "lint finished with " << errors << " errors, " << warnings << " warnings\n";
  } else {
    out << "lint passed\n";
  }
  return failed ? 1 : 0;
}

int content_sources(const char* argv0, const ContentCliOptions& opts, std::ostream& out) {
  const ContentContext ctx = make_context(argv0, opts);
  const auto result = starpack::content::lint(ctx.pipeline);

  if (opts.json_output) {
    json report;
    report["schema_version"] = result.schema_version;
    report["sources"] = json::array();
    for (const auto& source : result.sources) {
      report["sources"].push_back(source_json(source));
    }
    report["skipped"] = json::array();
    for (const auto& skipped : result.skipped) {
      report["skipped"].push_back({{"name", skipped.name}, {"reason", skipped.reason}});
    }
    out << report.dump(2) << "\n";
    return result.sources.empty() ? 1 : 0;
  }

  if (result.sources.empty()) {
    print_diagnostics(result.diagnostics, out);
    out << "no sources resolved\n";
    return 1;
  }
  out << "load order (schema_version " << result.schema_version << "):\n";
  int position = 1;
  for (const auto& source : result.sources) {
    out << "  " << position++ << ". " << source.name;
    if (!source.is_base) {
      out << " priority=" << source.priority;
    }
    out << " schema_version=" << source.schema_version << " " << source.root.generic_string() << "\n";
  }
  for (const auto& skipped : result.skipped) {
    out << "  skipped " << skipped.name << ": " << skipped.reason << "\n";
  }
  return 0;
}

int content_dump(const char* argv0, const ContentCliOptions& opts, std::ostream& out) {
  const ContentContext ctx = make_context(argv0, opts);
  const auto result = starpack::content::load_candidate(ctx.pipeline);
  if (!result.loaded()) {
    print_diagnostics(result.diagnostics, std::cerr);
    std::cerr << "content rejected; nothing dumped\n";
    return 1;
  }

  json dump;
  dump["schema_version"] = result.schema_version;
  dump["load_order"] = result.load_order;
  dump["collections"] = result.snapshot->registry->to_json();
  if (opts.out_path) {
    if (!starpack::data::save_json_file(*opts.out_path, dump)) {
      std::cerr << "failed to write " << opts.out_path->string() << "\n";
      return 1;
    }
    out << "wrote " << result.snapshot->registry->entity_count() << " entities to "
        << opts.out_path->generic_string() << "\n";
    return 0;
  }
  out << dump.dump(2) << "\n";
  return 0;
}

int content_watch(const char* argv0, const ContentCliOptions& opts, std::ostream& out) {
  const ContentContext ctx = make_context(argv0, opts);
  std::mutex out_mutex;

  starpack::runtime::ReloadSupervisorInit init;
  init.pipeline = ctx.pipeline;
  init.debounce_ms = opts.debounce_ms.value_or(ctx.config.debounce_ms);
  init.poll_interval_ms = ctx.config.poll_interval_ms;
  init.queue_capacity = ctx.config.queue_capacity;
  init.on_reload = [&out, &out_mutex](const starpack::runtime::ReloadReport& report) {
    std::lock_guard<std::mutex> lock(out_mutex);
    out << starpack::runtime::reload_outcome_name(report.outcome) << ": " << report.reason
        << " (generation " << report.generation;
    if (report.superseded_runs > 0) {
      out << ", " << report.superseded_runs << " superseded";
    }
    out << ")\n";
    if (report.outcome == starpack::runtime::ReloadOutcome::Rejected) {
      for (const auto& diag : report.diagnostics) {
        if (diag.severity == starpack::content::Severity::Fatal) {
          out << "  " << starpack::content::format_diagnostic(diag) << "\n";
        }
      }
    }
    out.flush();
  };

  starpack::content::SnapshotHandle handle;
  starpack::runtime::ReloadSupervisor supervisor(handle);
  starpack::content::Diagnostics diagnostics;
  if (!supervisor.init(init, diagnostics)) {
    print_diagnostics(diagnostics, std::cerr);
    std::cerr << "startup load failed\n";
    return 1;
  }
  std::string error;
  if (!supervisor.start(error)) {
    std::cerr << "failed to start watcher: " << error << "\n";
    return 1;
  }
  {
    std::lock_guard<std::mutex> lock(out_mutex);
    out << "watching " << ctx.pipeline.data_root.generic_string() << " and "
        << ctx.pipeline.mods_root.generic_string() << " (backend: " << supervisor.status().watcher_backend
        << ", debounce " << init.debounce_ms << " ms)\n";
    out.flush();
  }

  const auto started = std::chrono::steady_clock::now();
  while (opts.seconds <= 0 ||
         std::chrono::steady_clock::now() - started < std::chrono::seconds(opts.seconds)) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  supervisor.stop();

  const auto status = supervisor.status();
  std::lock_guard<std::mutex> lock(out_mutex);
  out << "watch finished: generation " << status.generation << ", " << status.published << " published, "
      << status.rejected << " rejected, " << status.superseded << " superseded\n";
  return 0;
}
