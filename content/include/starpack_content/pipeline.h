#pragma once

#include "starpack/config.h"
#include "starpack_content/diagnostics.h"
#include "starpack_content/pack_source.h"
#include "starpack_content/resolver.h"
#include "starpack_content/snapshot.h"

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace starpack::content {

enum class PipelineStage { Resolve, Decode, Merge, Validate, Build, Derive };

const char* stage_name(PipelineStage stage);

struct PipelineOptions {
  std::filesystem::path data_root;
  std::filesystem::path mods_root;
  std::vector<std::string> locales{"en", "ru"};
  bool enable_yaml = true;
  bool enable_json = true;
  // Called when a stage starts. Runs on the loading thread.
  std::function<void(PipelineStage)> stage_observer;
};

PipelineOptions pipeline_options_from_config(const PipelineConfig& config, const std::filesystem::path& root);

enum class LoadStatus { Loaded, Rejected, Superseded };

const char* load_status_name(LoadStatus status);

struct LoadResult {
  LoadStatus status = LoadStatus::Rejected;
  std::shared_ptr<Snapshot> snapshot;  // set when Loaded, not yet published
  Diagnostics diagnostics;
  std::vector<std::string> load_order;
  int schema_version = 0;

  bool loaded() const { return status == LoadStatus::Loaded; }
};

// Returns true when the run should be abandoned. Checked between stages.
using CancelCheck = std::function<bool()>;

// Full pipeline against the current file-system contents. Never publishes.
LoadResult load_candidate(const PipelineOptions& options, const CancelCheck& cancel = CancelCheck{});

struct LintResult {
  bool ok = false;  // no fatal diagnostic
  Diagnostics diagnostics;
  std::vector<PackSource> sources;
  std::vector<SkippedMod> skipped;
  int schema_version = 0;
};

// Resolve, decode, merge and validate only. Nothing is built or published.
LintResult lint(const PipelineOptions& options);

} // namespace starpack::content
