#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace starpack::content {

// Data shape understood by this build. Packs declaring a newer version are rejected.
constexpr int kRuntimeSchemaVersion = 1;

// Largest value any integer field may hold. Derived sums of yields and grid products
// stay inside int64_t under this bound.
constexpr int64_t kMaxIntFieldValue = 1000000000;

namespace collections {
inline constexpr const char* kCellTypes = "cell_types";
inline constexpr const char* kTechnologies = "technologies";
inline constexpr const char* kTechEdges = "tech_edges";
inline constexpr const char* kBuildings = "buildings";
inline constexpr const char* kWeapons = "weapons";
inline constexpr const char* kEngines = "engines";
inline constexpr const char* kShields = "shields";
inline constexpr const char* kHullClasses = "hull_classes";
inline constexpr const char* kVictoryConditions = "victory_conditions";
inline constexpr const char* kScenarios = "scenarios";
} // namespace collections

enum class FieldKind { String, Int, Float, Bool, Text, Ref, RefList, Enum };

enum class FieldRule {
  None,
  Positive,     // > 0
  NonNegative,  // >= 0
  Ratio         // within [0, 1]
};

struct FieldSpec {
  std::string name;
  FieldKind kind = FieldKind::String;
  bool required = true;
  FieldRule rule = FieldRule::None;
  std::string target;  // referenced collection for Ref and RefList
  std::vector<std::string> enum_values;
  nlohmann::json default_value;  // filled in by the decoder when the field is absent
};

enum class KeyKind {
  Id,        // "id" string field
  Composite  // ordered pair of reference fields
};

struct CollectionSchema {
  std::string name;
  KeyKind key_kind = KeyKind::Id;
  std::string key_from;
  std::string key_to;
  std::vector<FieldSpec> fields;

  const FieldSpec* find_field(std::string_view field) const;
};

// All collections, ordered so that every referenced collection precedes its referrers.
const std::vector<CollectionSchema>& collection_schemas();
const CollectionSchema* find_schema(std::string_view name);

std::string composite_key(const std::string& from, const std::string& to);
const char* field_kind_name(FieldKind kind);

} // namespace starpack::content
