#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <utility>

namespace starpack::content {

template <typename E>
class Collection;
class RegistryBuilder;

// Dense position of an entity inside one snapshot's collection of E. Only the registry
// hands out valid indices; a default-constructed index is invalid everywhere.
template <typename E>
class EntityIndex {
 public:
  EntityIndex() = default;

  uint32_t value() const { return value_; }
  bool valid() const { return value_ != kInvalid; }

  bool operator==(const EntityIndex& other) const { return value_ == other.value_; }
  bool operator!=(const EntityIndex& other) const { return value_ != other.value_; }
  bool operator<(const EntityIndex& other) const { return value_ < other.value_; }

 private:
  static constexpr uint32_t kInvalid = std::numeric_limits<uint32_t>::max();

  explicit EntityIndex(uint32_t value) : value_(value) {}

  template <typename>
  friend class Collection;
  friend class RegistryBuilder;

  uint32_t value_ = kInvalid;
};

// String id of a validated entity of E.
template <typename E>
class TypedId {
 public:
  const std::string& str() const { return value_; }

  bool operator==(const TypedId& other) const { return value_ == other.value_; }
  bool operator!=(const TypedId& other) const { return value_ != other.value_; }
  bool operator<(const TypedId& other) const { return value_ < other.value_; }

 private:
  explicit TypedId(std::string value) : value_(std::move(value)) {}

  friend class RegistryBuilder;

  std::string value_;
};

} // namespace starpack::content
