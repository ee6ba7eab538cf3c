#include "starpack_content/schema.h"

namespace starpack::content {

namespace {
FieldSpec field(std::string name, FieldKind kind, FieldRule rule = FieldRule::None) {
  FieldSpec spec;
  spec.name = std::move(name);
  spec.kind = kind;
  spec.rule = rule;
  return spec;
}

FieldSpec optional_field(std::string name, FieldKind kind, nlohmann::json default_value,
                         FieldRule rule = FieldRule::None) {
  FieldSpec spec = field(std::move(name), kind, rule);
  spec.required = false;
  spec.default_value = std::move(default_value);
  return spec;
}

FieldSpec ref(std::string name, std::string target, bool required = true) {
  FieldSpec spec = field(std::move(name), FieldKind::Ref);
  spec.target = std::move(target);
  spec.required = required;
  return spec;
}

FieldSpec ref_list(std::string name, std::string target) {
  FieldSpec spec = field(std::move(name), FieldKind::RefList);
  spec.target = std::move(target);
  spec.required = false;
  spec.default_value = nlohmann::json::array();
  return spec;
}

FieldSpec enumeration(std::string name, std::vector<std::string> values, std::string default_value = {}) {
  FieldSpec spec = field(std::move(name), FieldKind::Enum);
  spec.enum_values = std::move(values);
  if (!default_value.empty()) {
    spec.required = false;
    spec.default_value = std::move(default_value);
  }
  return spec;
}

CollectionSchema by_id(std::string name, std::vector<FieldSpec> fields) {
  CollectionSchema schema;
  schema.name = std::move(name);
  schema.fields.push_back(field("name", FieldKind::Text));
  for (auto& f : fields) {
    schema.fields.push_back(std::move(f));
  }
  return schema;
}

std::vector<CollectionSchema> build_schemas() {
  using namespace collections;
  std::vector<CollectionSchema> out;

  out.push_back(by_id(kCellTypes, {field("is_usable", FieldKind::Bool)}));

  out.push_back(by_id(kTechnologies,
                      {field("research_cost", FieldKind::Int, FieldRule::Positive),
                       optional_field("description", FieldKind::Text, nullptr)}));

  CollectionSchema edges;
  edges.name = kTechEdges;
  edges.key_kind = KeyKind::Composite;
  edges.key_from = "from";
  edges.key_to = "to";
  edges.fields.push_back(ref("from", kTechnologies));
  edges.fields.push_back(ref("to", kTechnologies));
  out.push_back(std::move(edges));

  out.push_back(by_id(kBuildings,
                      {field("cost", FieldKind::Int, FieldRule::Positive),
                       ref_list("buildable_on", kCellTypes),
                       optional_field("counts_for_adjacency", FieldKind::Bool, false),
                       optional_field("yields_food", FieldKind::Int, 0, FieldRule::NonNegative),
                       optional_field("yields_housing", FieldKind::Int, 0, FieldRule::NonNegative),
                       optional_field("yields_production", FieldKind::Int, 0, FieldRule::NonNegative),
                       optional_field("yields_science", FieldKind::Int, 0, FieldRule::NonNegative),
                       ref("unlocked_by", kTechnologies, false),
                       enumeration("special_behavior", {"none", "terraformer"}, "none")}));

  out.push_back(by_id(kWeapons,
                      {field("damage", FieldKind::Float, FieldRule::Positive),
                       field("fire_rate", FieldKind::Float, FieldRule::Positive),
                       field("range", FieldKind::Int, FieldRule::Positive),
                       optional_field("power_use", FieldKind::Float, 0.0, FieldRule::NonNegative),
                       field("cost", FieldKind::Int, FieldRule::Positive),
                       ref("requires_tech", kTechnologies, false)}));

  out.push_back(by_id(kEngines,
                      {field("thrust", FieldKind::Float, FieldRule::Positive),
                       optional_field("power_use", FieldKind::Float, 0.0, FieldRule::NonNegative),
                       field("cost", FieldKind::Int, FieldRule::Positive),
                       ref("requires_tech", kTechnologies, false)}));

  out.push_back(by_id(kShields,
                      {field("strength", FieldKind::Int, FieldRule::Positive),
                       optional_field("power_use", FieldKind::Float, 0.0, FieldRule::NonNegative),
                       field("cost", FieldKind::Int, FieldRule::Positive),
                       ref("requires_tech", kTechnologies, false)}));

  out.push_back(by_id(kHullClasses,
                      {field("size_index", FieldKind::Int, FieldRule::Positive),
                       field("max_items", FieldKind::Int, FieldRule::Positive),
                       field("cost", FieldKind::Int, FieldRule::Positive)}));

  out.push_back(by_id(kVictoryConditions,
                      {enumeration("kind", {"cover_all_tiles", "domination"}),
                       optional_field("threshold", FieldKind::Float, 0.5, FieldRule::Ratio)}));

  out.push_back(by_id(kScenarios,
                      {field("grid_width", FieldKind::Int, FieldRule::Positive),
                       field("grid_height", FieldKind::Int, FieldRule::Positive),
                       ref("start_building", kBuildings),
                       ref("victory_condition", kVictoryConditions),
                       enumeration("generation_mode", {"random_white_black"}, "random_white_black"),
                       optional_field("black_ratio", FieldKind::Float, 0.5, FieldRule::Ratio)}));
  return out;
}
} // namespace

const FieldSpec* CollectionSchema::find_field(std::string_view field_name) const {
  for (const auto& f : fields) {
    if (f.name == field_name) {
      return &f;
    }
  }
  return nullptr;
}

const std::vector<CollectionSchema>& collection_schemas() {
  static const std::vector<CollectionSchema> schemas = build_schemas();
  return schemas;
}

const CollectionSchema* find_schema(std::string_view name) {
  for (const auto& schema : collection_schemas()) {
    if (schema.name == name) {
      return &schema;
    }
  }
  return nullptr;
}

std::string composite_key(const std::string& from, const std::string& to) {
  return from + "->" + to;
}

const char* field_kind_name(FieldKind kind) {
  switch (kind) {
    case FieldKind::String:
      return "string";
    case FieldKind::Int:
      return "integer";
    case FieldKind::Float:
      return "number";
    case FieldKind::Bool:
      return "boolean";
    case FieldKind::Text:
      return "text";
    case FieldKind::Ref:
      return "id reference";
    case FieldKind::RefList:
      return "list of id references";
    case FieldKind::Enum:
      return "enum";
  }
  return "unknown";
}

} // namespace starpack::content
