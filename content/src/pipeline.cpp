#include "starpack_content/pipeline.h"

#include "starpack/log.h"
#include "starpack/paths.h"
#include "starpack_content/decoder.h"
#include "starpack_content/merge.h"
#include "starpack_content/registry_builder.h"
#include "starpack_content/validator.h"

#include <algorithm>

namespace starpack::content {

namespace {
// State shared by load_candidate and lint up to the end of validation.
struct FrontEnd {
  ResolvedSources resolved;
  std::vector<DecodedSource> accepted;
  MergedSet merged;
  Diagnostics diagnostics;
  std::vector<std::string> load_order;
  int schema_version = 0;
};

enum class FrontEndOutcome { Ok, Fatal, Cancelled };

class StageRunner {
 public:
  StageRunner(const PipelineOptions& options, const CancelCheck& cancel) : options_(options), cancel_(cancel) {}

  void begin(PipelineStage stage) const {
    if (options_.stage_observer) {
      options_.stage_observer(stage);
    }
  }

  bool cancelled() const { return cancel_ && cancel_(); }

 private:
  const PipelineOptions& options_;
  const CancelCheck& cancel_;
};

std::string summary(const Diagnostics& diagnostics) {
  return std::to_string(count_severity(diagnostics, Severity::Fatal)) + " fatal, " +
         std::to_string(count_severity(diagnostics, Severity::Error)) + " errors, " +
         std::to_string(count_severity(diagnostics, Severity::Warning)) + " warnings";
}

FrontEndOutcome run_front_end(const PipelineOptions& options, const StageRunner& stages, FrontEnd& out) {
  stages.begin(PipelineStage::Resolve);
  out.resolved = resolve_sources(ResolveOptions{options.data_root, options.mods_root});
  append(out.diagnostics, out.resolved.diagnostics);
  if (!out.resolved.ok) {
    log::warn("resolve: base pack rejected (" + options.data_root.generic_string() + ")");
    return FrontEndOutcome::Fatal;
  }
  log::info("resolve: " + std::to_string(out.resolved.sources.size()) + " sources, " +
            std::to_string(out.resolved.skipped.size()) + " mods skipped");
  for (const auto& source : out.resolved.sources) {
    log::debug("  " + source.name + " priority=" + std::to_string(source.priority) +
               " schema_version=" + std::to_string(source.schema_version));
  }
  for (const auto& skipped : out.resolved.skipped) {
    log::debug("  skipped " + skipped.name + ": " + skipped.reason);
  }
  if (stages.cancelled()) {
    return FrontEndOutcome::Cancelled;
  }

  stages.begin(PipelineStage::Decode);
  const DecodeOptions decode_options{options.enable_yaml, options.enable_json};
  bool base_failed = false;
  size_t excluded = 0;
  out.schema_version = out.resolved.manifest_schema_version;
  for (const auto& source : out.resolved.sources) {
    DecodedSource decoded = decode_source(source, decode_options);
    Diagnostics diagnostics = decoded.diagnostics;
    if (!decoded.ok) {
      if (source.is_base) {
        escalate(diagnostics, Severity::Error, Severity::Fatal);
        base_failed = true;
      } else {
        add_diagnostic(diagnostics, Severity::Error, DiagnosticKind::SchemaError, "", "",
                       "mod excluded: its data files failed to decode", source.name, source.data_dir);
        out.resolved.skipped.push_back({source.name, "data files failed to decode"});
        ++excluded;
      }
      append(out.diagnostics, diagnostics);
      continue;
    }
    append(out.diagnostics, diagnostics);
    log::debug("  " + source.name + ": " + std::to_string(decoded.files.size()) + " collection files");
    out.schema_version = std::min(out.schema_version, source.schema_version);
    out.load_order.push_back(source.name);
    out.accepted.push_back(std::move(decoded));
  }
  if (base_failed) {
    log::warn("decode: base pack failed to decode");
    return FrontEndOutcome::Fatal;
  }
  log::info("decode: " + std::to_string(out.accepted.size()) + " sources accepted, " + std::to_string(excluded) +
            " excluded");
  if (stages.cancelled()) {
    return FrontEndOutcome::Cancelled;
  }

  stages.begin(PipelineStage::Merge);
  out.merged = merge_sources(out.accepted);
  log::info("merge: " + std::to_string(out.merged.record_count()) + " records");
  if (stages.cancelled()) {
    return FrontEndOutcome::Cancelled;
  }

  stages.begin(PipelineStage::Validate);
  ValidateOptions validate_options;
  validate_options.locales = options.locales;
  append(out.diagnostics, validate(out.merged, validate_options));
  log::info("validate: " + summary(out.diagnostics));
  if (has_fatal(out.diagnostics)) {
    return FrontEndOutcome::Fatal;
  }
  if (stages.cancelled()) {
    return FrontEndOutcome::Cancelled;
  }
  return FrontEndOutcome::Ok;
}
} // namespace

const char* stage_name(PipelineStage stage) {
  switch (stage) {
    case PipelineStage::Resolve:
      return "resolve";
    case PipelineStage::Decode:
      return "decode";
    case PipelineStage::Merge:
      return "merge";
    case PipelineStage::Validate:
      return "validate";
    case PipelineStage::Build:
      return "build";
    case PipelineStage::Derive:
      return "derive";
  }
  return "unknown";
}

const char* load_status_name(LoadStatus status) {
  switch (status) {
    case LoadStatus::Loaded:
      return "loaded";
    case LoadStatus::Rejected:
      return "rejected";
    case LoadStatus::Superseded:
      return "superseded";
  }
  return "unknown";
}

PipelineOptions pipeline_options_from_config(const PipelineConfig& config, const std::filesystem::path& root) {
  PipelineOptions options;
  options.data_root = resolve_against(root, config.data_root);
  options.mods_root = config.mods_root.empty() ? default_mods_root(options.data_root)
                                               : resolve_against(root, config.mods_root);
  options.locales = config.locales;
  options.enable_yaml = config.enable_data_yaml;
  options.enable_json = config.enable_data_json;
  return options;
}

LoadResult load_candidate(const PipelineOptions& options, const CancelCheck& cancel) {
  LoadResult result;
  const StageRunner stages(options, cancel);
  FrontEnd front;
  const FrontEndOutcome outcome = run_front_end(options, stages, front);
  result.diagnostics = std::move(front.diagnostics);
  result.load_order = front.load_order;
  result.schema_version = front.schema_version;
  if (outcome == FrontEndOutcome::Cancelled) {
    result.status = LoadStatus::Superseded;
    return result;
  }
  if (outcome == FrontEndOutcome::Fatal) {
    result.status = LoadStatus::Rejected;
    return result;
  }

  stages.begin(PipelineStage::Build);
  RegistryBuilder builder;
  if (!builder.add_entities(front.merged, result.diagnostics)) {
    log::warn("build: typed registry rejected");
    result.status = LoadStatus::Rejected;
    return result;
  }
  if (stages.cancelled()) {
    result.status = LoadStatus::Superseded;
    return result;
  }

  stages.begin(PipelineStage::Derive);
  builder.compile_derived();
  auto registry = builder.finish();
  log::info("derive: " + std::to_string(registry->entity_count()) + " entities, schema_version " +
            std::to_string(result.schema_version));
  if (stages.cancelled()) {
    result.status = LoadStatus::Superseded;
    return result;
  }

  auto snapshot = std::make_shared<Snapshot>();
  snapshot->registry = std::move(registry);
  snapshot->diagnostics = result.diagnostics;
  snapshot->load_order = result.load_order;
  snapshot->schema_version = result.schema_version;
  result.snapshot = std::move(snapshot);
  result.status = LoadStatus::Loaded;
  return result;
}

LintResult lint(const PipelineOptions& options) {
  LintResult result;
  const CancelCheck never_cancel;
  const StageRunner stages(options, never_cancel);
  FrontEnd front;
  const FrontEndOutcome outcome = run_front_end(options, stages, front);
  result.ok = outcome == FrontEndOutcome::Ok;
  result.diagnostics = std::move(front.diagnostics);
  for (const auto& decoded : front.accepted) {
    result.sources.push_back(decoded.source);
  }
  result.skipped = front.resolved.skipped;
  result.schema_version = front.schema_version;
  return result;
}

} // namespace starpack::content
