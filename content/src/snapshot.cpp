#include "starpack_content/snapshot.h"

namespace starpack::content {

std::shared_ptr<const Snapshot> SnapshotHandle::current() const {
  return std::atomic_load(&current_);
}

uint64_t SnapshotHandle::publish(std::shared_ptr<Snapshot> snapshot) {
  if (!snapshot) {
    return generation_.load();
  }
  const uint64_t generation = generation_.load() + 1;
  snapshot->generation = generation;
  std::atomic_store(&current_, std::shared_ptr<const Snapshot>(std::move(snapshot)));
  generation_.store(generation);
  return generation;
}

} // namespace starpack::content
