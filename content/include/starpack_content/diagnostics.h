#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace starpack::content {

enum class Severity {
  Warning,  // advisory, never blocks publication
  Error,    // one mod was excluded, the load continues
  Fatal     // the whole candidate is discarded
};

enum class DiagnosticKind {
  IoError,
  ParseError,
  SchemaError,
  SchemaVersionRejected,
  DuplicateId,
  InvariantViolation,
  UnresolvedReference,
  LocalizationWarning,
  NamingWarning
};

struct Diagnostic {
  Severity severity = Severity::Warning;
  DiagnosticKind kind = DiagnosticKind::SchemaError;
  std::string collection;
  std::string id;
  std::string message;
  std::string source;
  std::filesystem::path file;
};

using Diagnostics = std::vector<Diagnostic>;

const char* severity_name(Severity severity);
const char* kind_name(DiagnosticKind kind);

void add_diagnostic(Diagnostics& out,
                    Severity severity,
                    DiagnosticKind kind,
                    const std::string& collection,
                    const std::string& id,
                    const std::string& message,
                    const std::string& source = {},
                    const std::filesystem::path& file = {});

// Rewrites diagnostics of one severity to another, e.g. file errors of the base pack,
// which cannot be excluded the way a mod is.
void escalate(Diagnostics& diagnostics, Severity from, Severity to);
void append(Diagnostics& out, const Diagnostics& more);

bool has_fatal(const Diagnostics& diagnostics);
size_t count_severity(const Diagnostics& diagnostics, Severity severity);

std::string format_diagnostic(const Diagnostic& diagnostic);
nlohmann::json diagnostic_to_json(const Diagnostic& diagnostic);

} // namespace starpack::content
