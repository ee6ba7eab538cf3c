#include "starpack_content/diagnostics.h"

#include <algorithm>
#include <sstream>

namespace starpack::content {

const char* severity_name(Severity severity) {
  switch (severity) {
    case Severity::Fatal:
      return "fatal";
    case Severity::Error:
      return "error";
    case Severity::Warning:
    default:
      return "warning";
  }
}

const char* kind_name(DiagnosticKind kind) {
  switch (kind) {
    case DiagnosticKind::IoError:
      return "io_error";
    case DiagnosticKind::ParseError:
      return "parse_error";
    case DiagnosticKind::SchemaError:
      return "schema_error";
    case DiagnosticKind::SchemaVersionRejected:
      return "schema_version_rejected";
    case DiagnosticKind::DuplicateId:
      return "duplicate_id";
    case DiagnosticKind::InvariantViolation:
      return "invariant_violation";
    case DiagnosticKind::UnresolvedReference:
      return "unresolved_reference";
    case DiagnosticKind::LocalizationWarning:
      return "localization_warning";
    case DiagnosticKind::NamingWarning:
      return "naming_warning";
  }
  return "unknown";
}

void add_diagnostic(Diagnostics& out,
                    Severity severity,
                    DiagnosticKind kind,
                    const std::string& collection,
                    const std::string& id,
                    const std::string& message,
                    const std::string& source,
                    const std::filesystem::path& file) {
  out.push_back({severity, kind, collection, id, message, source, file});
}

void escalate(Diagnostics& diagnostics, Severity from, Severity to) {
  for (auto& diag : diagnostics) {
    if (diag.severity == from) {
      diag.severity = to;
    }
  }
}

void append(Diagnostics& out, const Diagnostics& more) {
  out.insert(out.end(), more.begin(), more.end());
}

bool has_fatal(const Diagnostics& diagnostics) {
  return std::any_of(diagnostics.begin(), diagnostics.end(),
                     [](const Diagnostic& d) { return d.severity == Severity::Fatal; });
}

size_t count_severity(const Diagnostics& diagnostics, Severity severity) {
  return static_cast<size_t>(std::count_if(diagnostics.begin(), diagnostics.end(),
                                           [severity](const Diagnostic& d) { return d.severity == severity; }));
}

std::string format_diagnostic(const Diagnostic& diagnostic) {
  std::ostringstream out;
  out << severity_name(diagnostic.severity) << " [" << kind_name(diagnostic.kind) << "]";
  if (!diagnostic.collection.empty() || !diagnostic.id.empty()) {
    out << " " << diagnostic.collection;
    if (!diagnostic.id.empty()) {
      out << "/" << diagnostic.id;
    }
  }
  if (!diagnostic.source.empty() || !diagnostic.file.empty()) {
    out << " (" << diagnostic.source;
    if (!diagnostic.file.empty()) {
      out << (diagnostic.source.empty() ? "" : " ") << diagnostic.file.generic_string();
    }
    out << ")";
  }
  out << ": " << diagnostic.message;
  return out.str();
}

nlohmann::json diagnostic_to_json(const Diagnostic& diagnostic) {
  nlohmann::json j;
  j["severity"] = severity_name(diagnostic.severity);
  j["kind"] = kind_name(diagnostic.kind);
  j["collection"] = diagnostic.collection;
  j["id"] = diagnostic.id;
  j["message"] = diagnostic.message;
  j["source"] = diagnostic.source;
  j["file"] = diagnostic.file.generic_string();
  return j;
}

} // namespace starpack::content
