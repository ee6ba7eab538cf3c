#pragma once

#include "starpack_content/diagnostics.h"
#include "starpack_content/registry.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace starpack::content {

// One published state. Never mutated after publish().
struct Snapshot {
  std::shared_ptr<const GameRegistry> registry;
  Diagnostics diagnostics;  // advisory diagnostics of the load that produced it
  std::vector<std::string> load_order;
  int schema_version = 0;
  uint64_t generation = 0;
};

// Owner of the current snapshot. Readers take a shared reference and keep it for as long
// as they need consistent data; a concurrent publish never touches what they hold.
class SnapshotHandle {
 public:
  SnapshotHandle() = default;
  SnapshotHandle(const SnapshotHandle&) = delete;
  SnapshotHandle& operator=(const SnapshotHandle&) = delete;

  std::shared_ptr<const Snapshot> current() const;
  // Stamps the next generation number and makes the snapshot current.
  uint64_t publish(std::shared_ptr<Snapshot> snapshot);
  uint64_t generation() const { return generation_.load(); }

 private:
  std::shared_ptr<const Snapshot> current_;
  std::atomic<uint64_t> generation_{0};
};

} // namespace starpack::content
