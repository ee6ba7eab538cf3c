#include "starpack/change_queue.h"

#include <utility>

namespace starpack::runtime {

ChangeQueue::ChangeQueue(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

bool ChangeQueue::push(platform::FileChange change) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return false;
    }
    if (changes_.size() >= capacity_) {
      changes_.pop_front();
      ++dropped_;
    }
    changes_.push_back(std::move(change));
  }
  cv_.notify_one();
  return true;
}

bool ChangeQueue::wait_pop_all(std::vector<platform::FileChange>& out, std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [this] { return closed_ || !changes_.empty(); });
  if (closed_ || changes_.empty()) {
    return false;
  }
  while (!changes_.empty()) {
    out.push_back(std::move(changes_.front()));
    changes_.pop_front();
  }
  return true;
}

size_t ChangeQueue::drain(std::vector<platform::FileChange>& out) {
  std::lock_guard<std::mutex> lock(mutex_);
  const size_t count = changes_.size();
  while (!changes_.empty()) {
    out.push_back(std::move(changes_.front()));
    changes_.pop_front();
  }
  return count;
}

void ChangeQueue::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool ChangeQueue::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

size_t ChangeQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return changes_.size();
}

bool ChangeQueue::overflowed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_ > 0;
}

size_t ChangeQueue::dropped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_;
}

} // namespace starpack::runtime
