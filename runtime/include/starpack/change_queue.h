#pragma once

#include "starpack_platform/file_watcher.h"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

namespace starpack::runtime {

// Bounded multi-producer, single-consumer queue of file changes. A full queue drops its
// oldest entry: every queued change already implies a full reload.
class ChangeQueue {
 public:
  explicit ChangeQueue(size_t capacity = 256);

  ChangeQueue(const ChangeQueue&) = delete;
  ChangeQueue& operator=(const ChangeQueue&) = delete;

  // False once the queue is closed.
  bool push(platform::FileChange change);
  // Moves everything queued into out. Waits up to timeout for the first entry.
  // False when nothing arrived or the queue is closed.
  bool wait_pop_all(std::vector<platform::FileChange>& out, std::chrono::milliseconds timeout);
  size_t drain(std::vector<platform::FileChange>& out);
  void close();

  bool closed() const;
  size_t size() const;
  bool overflowed() const;
  size_t dropped() const;

 private:
  const size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<platform::FileChange> changes_;
  size_t dropped_ = 0;
  bool closed_ = false;
};

} // namespace starpack::runtime
