#include "starpack_content/decoder.h"

#include "starpack_data/serialization.h"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <map>

namespace starpack::content {

namespace {
using json = nlohmann::json;

struct RecordContext {
  const CollectionSchema& schema;
  const std::filesystem::path& file;
  const std::string& source;
  Diagnostics& diagnostics;

  void error(const std::string& id, const std::string& keypath, const std::string& message) {
    add_diagnostic(diagnostics, Severity::Error, DiagnosticKind::SchemaError, schema.name, id,
                   keypath + ": " + message, source, file);
  }

  void warning(const std::string& id, const std::string& keypath, const std::string& message) {
    add_diagnostic(diagnostics, Severity::Warning, DiagnosticKind::SchemaError, schema.name, id,
                   keypath + ": " + message, source, file);
  }
};

bool is_nonempty_string(const json& value) {
  return value.is_string() && !value.get_ref<const std::string&>().empty();
}

// Plain strings become {"en": value}.
bool normalize_text(const json& value, json& out, std::string& error) {
  if (value.is_string()) {
    out = json::object();
    out["en"] = value;
    return true;
  }
  if (!value.is_object()) {
    error = "expected a string or a map of locale to string";
    return false;
  }
  for (auto it = value.begin(); it != value.end(); ++it) {
    if (!it.value().is_string()) {
      error = "locale '" + it.key() + "' must be a string";
      return false;
    }
  }
  if (!value.contains("en") || !is_nonempty_string(value["en"])) {
    error = "English text ('en') is required";
    return false;
  }
  out = value;
  return true;
}

bool check_shape(const FieldSpec& spec, const json& value, json& out, std::string& error) {
  switch (spec.kind) {
    case FieldKind::String:
      if (!value.is_string()) break;
      out = value;
      return true;
    case FieldKind::Int:
      if (!value.is_number_integer()) break;
      if (value.is_number_unsigned() &&
          value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        error = "integer is out of range";
        return false;
      }
      out = value.get<int64_t>();
      return true;
    case FieldKind::Float:
      if (!value.is_number()) break;
      out = value.get<double>();
      return true;
    case FieldKind::Bool:
      if (!value.is_boolean()) break;
      out = value;
      return true;
    case FieldKind::Text:
      return normalize_text(value, out, error);
    case FieldKind::Ref:
      if (!is_nonempty_string(value)) break;
      out = value;
      return true;
    case FieldKind::RefList:
      if (!value.is_array()) break;
      for (const auto& item : value) {
        if (!is_nonempty_string(item)) {
          error = "every entry must be a non-empty id string";
          return false;
        }
      }
      out = value;
      return true;
    case FieldKind::Enum: {
      if (!value.is_string()) break;
      const auto& text = value.get_ref<const std::string&>();
      if (std::find(spec.enum_values.begin(), spec.enum_values.end(), text) == spec.enum_values.end()) {
        error = "unknown value '" + text + "' (expected one of:";
        for (const auto& allowed : spec.enum_values) {
          error += " " + allowed;
        }
        error += ")";
        return false;
      }
      out = value;
      return true;
    }
  }
  error = std::string("expected ") + field_kind_name(spec.kind);
  return false;
}

bool decode_record(const json& entry, const std::string& keypath, RecordContext& ctx, RawRecord& out) {
  const auto& schema = ctx.schema;
  if (!entry.is_object()) {
    ctx.error("", keypath, "entry must be a map");
    return false;
  }

  bool ok = true;
  if (schema.key_kind == KeyKind::Id) {
    if (!entry.contains("id") || !is_nonempty_string(entry["id"])) {
      ctx.error("", keypath + ".id", "id must be a non-empty string");
      return false;
    }
    out.key = entry["id"].get<std::string>();
  } else {
    const json* from = entry.contains(schema.key_from) ? &entry[schema.key_from] : nullptr;
    const json* to = entry.contains(schema.key_to) ? &entry[schema.key_to] : nullptr;
    if (!from || !to || !is_nonempty_string(*from) || !is_nonempty_string(*to)) {
      ctx.error("", keypath, schema.key_from + " and " + schema.key_to + " must be non-empty id strings");
      return false;
    }
    out.key = composite_key(from->get<std::string>(), to->get<std::string>());
  }

  out.fields = json::object();
  for (const auto& spec : schema.fields) {
    const std::string field_path = keypath + "." + spec.name;
    if (!entry.contains(spec.name) || entry[spec.name].is_null()) {
      if (spec.required) {
        ctx.error(out.key, field_path, "required field is missing");
        ok = false;
      } else if (!spec.default_value.is_null()) {
        out.fields[spec.name] = spec.default_value;
      }
      continue;
    }
    json normalized;
    std::string error;
    if (!check_shape(spec, entry[spec.name], normalized, error)) {
      ctx.error(out.key, field_path, error);
      ok = false;
      continue;
    }
    out.fields[spec.name] = std::move(normalized);
  }

  for (auto it = entry.begin(); it != entry.end(); ++it) {
    if (it.key() == "id" && schema.key_kind == KeyKind::Id) continue;
    if (!schema.find_field(it.key())) {
      ctx.warning(out.key, keypath + "." + it.key(), "unknown field ignored");
    }
  }
  return ok;
}

bool read_int(const json& doc, const char* key, std::optional<int>& out, std::string& error) {
  if (!doc.contains(key) || doc[key].is_null()) {
    return true;
  }
  const json& value = doc[key];
  if (!value.is_number_integer()) {
    error = std::string(key) + " must be an integer";
    return false;
  }
  const bool fits = value.is_number_unsigned()
                        ? value.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max())
                        : value.get<int64_t>() >= std::numeric_limits<int>::min() &&
                              value.get<int64_t>() <= std::numeric_limits<int>::max();
  if (!fits) {
    error = std::string(key) + " is out of range";
    return false;
  }
  out = value.get<int>();
  return true;
}
} // namespace

DecodedFile decode_document(const nlohmann::json& doc,
                            const CollectionSchema& schema,
                            const std::filesystem::path& file,
                            const std::string& source) {
  DecodedFile out;
  out.collection = schema.name;
  out.file = file;
  RecordContext ctx{schema, file, source, out.diagnostics};

  if (!doc.is_object()) {
    ctx.error("", schema.name, "top level must be a map keyed by the collection name");
    return out;
  }
  for (auto it = doc.begin(); it != doc.end(); ++it) {
    if (it.key() != schema.name) {
      ctx.warning("", it.key(), "unknown top-level key ignored");
    }
  }
  if (!doc.contains(schema.name)) {
    ctx.error("", schema.name, "top-level key is missing");
    return out;
  }
  const auto& list = doc[schema.name];
  if (list.is_null()) {
    out.ok = true;
    return out;
  }
  if (!list.is_array()) {
    ctx.error("", schema.name, "must be a list of entries");
    return out;
  }

  bool ok = true;
  out.records.reserve(list.size());
  for (size_t i = 0; i < list.size(); ++i) {
    RawRecord record;
    if (decode_record(list[i], schema.name + "[" + std::to_string(i) + "]", ctx, record)) {
      out.records.push_back(std::move(record));
    } else {
      ok = false;
    }
  }
  out.ok = ok;
  return out;
}

DecodedFile decode_file(const std::filesystem::path& path,
                        const CollectionSchema& schema,
                        const std::string& source) {
  json doc;
  std::string error;
  if (!data::load_document(path, doc, error)) {
    DecodedFile out;
    out.collection = schema.name;
    out.file = path;
    add_diagnostic(out.diagnostics, Severity::Error, DiagnosticKind::ParseError, schema.name, "", error,
                   source, path);
    return out;
  }
  return decode_document(doc, schema, path, source);
}

DecodedSource decode_source(const PackSource& source, const DecodeOptions& options) {
  DecodedSource out;
  out.source = source;

  std::error_code ec;
  std::vector<std::filesystem::path> files;
  for (std::filesystem::directory_iterator it(source.data_dir, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code entry_ec;
    if (it->is_regular_file(entry_ec)) {
      files.push_back(it->path());
    }
  }
  if (ec) {
    add_diagnostic(out.diagnostics, Severity::Error, DiagnosticKind::IoError, "", "",
                   "cannot list data directory: " + ec.message(), source.name, source.data_dir);
    return out;
  }
  std::sort(files.begin(), files.end());

  std::map<std::string, std::vector<std::filesystem::path>> by_collection;
  for (const auto& path : files) {
    const auto format = data::format_for_path(path);
    if (format == data::DocumentFormat::Unknown) {
      continue;
    }
    const std::string stem = path.stem().string();
    if (stem == "manifest" || stem == "mod") {
      continue;
    }
    if ((format == data::DocumentFormat::Yaml && !options.enable_yaml) ||
        (format == data::DocumentFormat::Json && !options.enable_json)) {
      add_diagnostic(out.diagnostics, Severity::Warning, DiagnosticKind::SchemaError, stem, "",
                     std::string(data::format_name(format)) + " data files are disabled; file skipped",
                     source.name, path);
      continue;
    }
    if (!find_schema(stem)) {
      add_diagnostic(out.diagnostics, Severity::Warning, DiagnosticKind::SchemaError, "", "",
                     "file does not name a known collection; skipped", source.name, path);
      continue;
    }
    by_collection[stem].push_back(path);
  }

  bool ok = true;
  // Schema order keeps the per-source file order independent of directory listing.
  for (const auto& schema : collection_schemas()) {
    auto it = by_collection.find(schema.name);
    if (it == by_collection.end()) continue;
    if (it->second.size() > 1) {
      std::string names;
      for (const auto& path : it->second) {
        names += (names.empty() ? "" : ", ") + path.filename().string();
      }
      add_diagnostic(out.diagnostics, Severity::Error, DiagnosticKind::SchemaError, schema.name, "",
                     "collection is defined by more than one file: " + names, source.name, source.data_dir);
      ok = false;
      continue;
    }
    DecodedFile decoded = decode_file(it->second.front(), schema, source.name);
    append(out.diagnostics, decoded.diagnostics);
    ok = ok && decoded.ok;
    out.files.push_back(std::move(decoded));
  }
  out.ok = ok;
  return out;
}

bool decode_descriptor(const std::filesystem::path& path, PackDescriptor& out, std::string& error) {
  json doc;
  if (!data::load_document(path, doc, error)) {
    return false;
  }
  if (doc.is_null()) {
    return true;
  }
  if (!doc.is_object()) {
    error = "descriptor must be a map";
    return false;
  }
  return read_int(doc, "priority", out.priority, error) &&
         read_int(doc, "schema_version", out.schema_version, error);
}

std::filesystem::path find_descriptor(const std::filesystem::path& dir, const std::string& stem) {
  std::error_code ec;
  for (const char* ext : {".yaml", ".yml", ".json"}) {
    const auto candidate = dir / (stem + ext);
    if (std::filesystem::is_regular_file(candidate, ec)) {
      return candidate;
    }
  }
  return {};
}

} // namespace starpack::content
