#pragma once

#include "starpack_content/diagnostics.h"
#include "starpack_content/merge.h"
#include "starpack_content/registry.h"

#include <memory>

namespace starpack::content {

template <typename... Es>
struct TypeList {};

using EntityTypes = TypeList<CellType,
                             Technology,
                             TechEdge,
                             Building,
                             Weapon,
                             Engine,
                             Shield,
                             HullClass,
                             VictoryCondition,
                             Scenario>;

// Turns a validated merged set into a GameRegistry. The only place typed ids and indices are minted.
class RegistryBuilder {
 public:
  RegistryBuilder();

  // Typed entities in dependency order; references become indices of the target collection.
  bool add_entities(const MergedSet& merged, Diagnostics& diagnostics);
  // Recomputes every derived value from the entities added above.
  void compile_derived();
  std::shared_ptr<const GameRegistry> finish();

 private:
  template <typename E>
  bool fill(const MergedSet& merged, Diagnostics& diagnostics);
  template <typename E>
  void derive();

  template <typename... Es>
  bool fill_all(TypeList<Es...>, const MergedSet& merged, Diagnostics& diagnostics);
  template <typename... Es>
  void derive_all(TypeList<Es...>);

  std::shared_ptr<GameRegistry> registry_;
};

} // namespace starpack::content
