#pragma once

#include "starpack/change_queue.h"
#include "starpack_content/pipeline.h"
#include "starpack_content/snapshot.h"
#include "starpack_platform/file_watcher.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace starpack::runtime {

enum class SupervisorState { Idle, Loading, Publishing };
enum class ReloadOutcome { Published, Rejected, Superseded };

const char* supervisor_state_name(SupervisorState state);
const char* reload_outcome_name(ReloadOutcome outcome);

struct ReloadReport {
  ReloadOutcome outcome = ReloadOutcome::Rejected;
  uint64_t generation = 0;     // current generation after the run
  size_t superseded_runs = 0;  // candidates abandoned before this outcome
  std::string reason;
  content::Diagnostics diagnostics;
};

struct ReloadStatus {
  SupervisorState state = SupervisorState::Idle;
  uint64_t generation = 0;
  std::string last_reload_time = "N/A";
  std::string last_error;
  size_t published = 0;
  size_t rejected = 0;
  size_t superseded = 0;
  bool queue_overflowed = false;
  size_t queue_dropped = 0;
  std::string watcher_backend;
};

struct ReloadSupervisorInit {
  content::PipelineOptions pipeline;
  int debounce_ms = 300;
  int poll_interval_ms = 50;
  size_t queue_capacity = 256;
  // Called after every background reload, on the reconcile thread.
  std::function<void(const ReloadReport&)> on_reload;
};

// Owns the only path that replaces the current snapshot after startup.
// Idle: watch for changes and debounce. Loading: build a candidate, abandoned when a newer
// change arrives. Publishing: swap the snapshot; a rejected candidate leaves the old one current.
class ReloadSupervisor {
 public:
  explicit ReloadSupervisor(content::SnapshotHandle& handle);
  ~ReloadSupervisor();

  ReloadSupervisor(const ReloadSupervisor&) = delete;
  ReloadSupervisor& operator=(const ReloadSupervisor&) = delete;

  // Startup load. On failure nothing is published and diagnostics holds the reasons.
  bool init(const ReloadSupervisorInit& init, content::Diagnostics& diagnostics);
  bool start(std::string& error);
  void stop();
  bool running() const { return running_.load(); }

  // Returns false for changes that cannot affect content (editor temp files, other extensions).
  bool notify_change(const platform::FileChange& change);
  ReloadReport reload_now(const std::string& reason = "manual");

  SupervisorState state() const { return state_.load(); }
  ReloadStatus status() const;
  const ChangeQueue& queue() const { return *queue_; }

 private:
  ReloadReport run_once(const std::string& reason, bool background);
  void finish_run(const content::LoadResult& result, const std::string& reason, ReloadReport& report);
  void watch_loop();
  void reconcile_loop();

  content::SnapshotHandle& handle_;
  ReloadSupervisorInit init_{};
  std::unique_ptr<ChangeQueue> queue_;

  std::atomic<SupervisorState> state_{SupervisorState::Idle};
  std::atomic<uint64_t> requested_generation_{0};
  std::atomic<bool> running_{false};
  std::atomic<bool> stopping_{false};

  std::mutex run_mutex_;
  mutable std::mutex status_mutex_;
  ReloadStatus status_{};

  platform::FileWatcher base_watcher_;
  platform::FileWatcher mods_watcher_;
  std::thread watch_thread_;
  std::thread reconcile_thread_;
};

} // namespace starpack::runtime
