#include "starpack_content/validator.h"

#include "starpack_content/schema.h"

#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace starpack::content {

namespace {
using json = nlohmann::json;

void fatal(Diagnostics& out, DiagnosticKind kind, const MergedCollection& collection, const MergedRecord& record,
           const std::string& message) {
  add_diagnostic(out, Severity::Fatal, kind, collection.name, record.key, message, record.last_source(),
                 record.file);
}

std::string format_number(double value) {
  std::ostringstream oss;
  oss << value;
  return oss.str();
}

void check_duplicates(const MergedCollection& collection, Diagnostics& out) {
  for (const auto& dup : collection.duplicates) {
    add_diagnostic(out, Severity::Fatal, DiagnosticKind::DuplicateId, collection.name, dup.key,
                   "id is defined more than once in the same source", dup.source, dup.file);
  }
  std::unordered_set<std::string> keys;
  for (const auto& record : collection.records) {
    if (!keys.insert(record.key).second) {
      fatal(out, DiagnosticKind::DuplicateId, collection, record, "id appears twice in the merged collection");
    }
  }
}

void check_rule(const FieldSpec& spec, const json& value, const MergedCollection& collection,
                const MergedRecord& record, Diagnostics& out) {
  if (!value.is_number()) return;
  if (spec.kind == FieldKind::Int && value.is_number_integer() &&
      (value.get<int64_t>() > kMaxIntFieldValue || value.get<int64_t>() < -kMaxIntFieldValue)) {
    fatal(out, DiagnosticKind::InvariantViolation, collection, record,
          spec.name + " is out of range (limit " + std::to_string(kMaxIntFieldValue) + ")");
    return;
  }
  if (spec.rule == FieldRule::None) return;
  const double number = value.get<double>();
  const std::string shown = format_number(number);
  switch (spec.rule) {
    case FieldRule::Positive:
      if (!(number > 0.0)) {
        fatal(out, DiagnosticKind::InvariantViolation, collection, record,
              spec.name + " must be positive (got " + shown + ")");
      }
      break;
    case FieldRule::NonNegative:
      if (!(number >= 0.0)) {
        fatal(out, DiagnosticKind::InvariantViolation, collection, record,
              spec.name + " must not be negative (got " + shown + ")");
      }
      break;
    case FieldRule::Ratio:
      if (!(number >= 0.0 && number <= 1.0)) {
        fatal(out, DiagnosticKind::InvariantViolation, collection, record,
              spec.name + " must be within [0, 1] (got " + shown + ")");
      }
      break;
    case FieldRule::None:
      break;
  }
}

void check_reference(const FieldSpec& spec, const std::string& target_id, const MergedSet& merged,
                     const MergedCollection& collection, const MergedRecord& record, Diagnostics& out) {
  const MergedCollection* target = merged.find(spec.target);
  if (!target || !target->find(target_id)) {
    fatal(out, DiagnosticKind::UnresolvedReference, collection, record,
          spec.name + " refers to unknown " + spec.target + " id '" + target_id + "'");
  }
}

void check_locales(const FieldSpec& spec, const json& value, const ValidateOptions& options,
                   const MergedCollection& collection, const MergedRecord& record, Diagnostics& out) {
  if (!value.is_object()) return;
  for (const auto& locale : options.locales) {
    if (locale == "en") continue;
    if (!value.contains(locale) || value[locale].get_ref<const std::string&>().empty()) {
      add_diagnostic(out, Severity::Warning, DiagnosticKind::LocalizationWarning, collection.name, record.key,
                     spec.name + " has no '" + locale + "' text", record.last_source(), record.file);
    }
  }
}

void check_records(const CollectionSchema& schema, const MergedCollection& collection, const MergedSet& merged,
                   const ValidateOptions& options, Diagnostics& out) {
  for (const auto& record : collection.records) {
    if (schema.key_kind == KeyKind::Id && !is_snake_case_id(record.key)) {
      add_diagnostic(out, Severity::Warning, DiagnosticKind::NamingWarning, collection.name, record.key,
                     "id should be lowercase words separated by underscores", record.last_source(), record.file);
    }
    for (const auto& spec : schema.fields) {
      if (!record.fields.contains(spec.name)) continue;
      const json& value = record.fields[spec.name];
      switch (spec.kind) {
        case FieldKind::Int:
        case FieldKind::Float:
          check_rule(spec, value, collection, record, out);
          break;
        case FieldKind::Ref:
          check_reference(spec, value.get<std::string>(), merged, collection, record, out);
          break;
        case FieldKind::RefList:
          for (const auto& item : value) {
            check_reference(spec, item.get<std::string>(), merged, collection, record, out);
          }
          break;
        case FieldKind::Text:
          check_locales(spec, value, options, collection, record, out);
          break;
        case FieldKind::String:
        case FieldKind::Bool:
        case FieldKind::Enum:
          break;
      }
    }
  }
}

// Iterative three-colour DFS over prerequisite edges; reports each back edge once.
void check_research_cycles(const MergedCollection& edges, Diagnostics& out) {
  std::unordered_map<std::string, std::vector<size_t>> outgoing;
  std::vector<std::string> nodes;
  for (size_t i = 0; i < edges.records.size(); ++i) {
    const auto& fields = edges.records[i].fields;
    if (!fields.contains("from") || !fields.contains("to")) continue;
    const std::string from = fields["from"].get<std::string>();
    if (outgoing.find(from) == outgoing.end()) {
      nodes.push_back(from);
    }
    outgoing[from].push_back(i);
  }

  enum class Mark { White, Grey, Black };
  std::unordered_map<std::string, Mark> marks;
  for (const auto& start : nodes) {
    if (marks[start] != Mark::White) continue;
    struct Frame {
      std::string node;
      size_t next = 0;
    };
    std::vector<Frame> stack{{start, 0}};
    marks[start] = Mark::Grey;
    while (!stack.empty()) {
      Frame& frame = stack.back();
      const auto& edge_ids = outgoing[frame.node];
      if (frame.next >= edge_ids.size()) {
        marks[frame.node] = Mark::Black;
        stack.pop_back();
        continue;
      }
      const MergedRecord& edge = edges.records[edge_ids[frame.next++]];
      const std::string to = edge.fields["to"].get<std::string>();
      const Mark mark = marks[to];
      if (mark == Mark::Grey) {
        fatal(out, DiagnosticKind::InvariantViolation, edges, edge,
              "prerequisite edge closes a cycle in the research graph");
      } else if (mark == Mark::White) {
        marks[to] = Mark::Grey;
        stack.push_back({to, 0});
      }
    }
  }
}
} // namespace

bool is_snake_case_id(std::string_view id) {
  if (id.empty()) return false;
  bool previous_underscore = true;
  for (const char c : id) {
    if (c == '_') {
      if (previous_underscore) return false;
      previous_underscore = true;
      continue;
    }
    if (!((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9'))) return false;
    previous_underscore = false;
  }
  return !previous_underscore;
}

Diagnostics validate(const MergedSet& merged, const ValidateOptions& options) {
  Diagnostics out;
  for (const auto& schema : collection_schemas()) {
    const MergedCollection* collection = merged.find(schema.name);
    if (!collection) continue;
    check_duplicates(*collection, out);
    check_records(schema, *collection, merged, options, out);
  }
  if (const MergedCollection* edges = merged.find(collections::kTechEdges)) {
    check_research_cycles(*edges, out);
  }
  return out;
}

} // namespace starpack::content
