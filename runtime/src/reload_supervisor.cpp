#include "starpack/reload_supervisor.h"

#include "starpack/log.h"

#include <chrono>
#include <ctime>
#include <vector>

namespace starpack::runtime {

namespace {
std::string now_iso() {
  const auto now = std::chrono::system_clock::now();
  const auto tt = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &tt);
#else
  localtime_r(&tt, &tm);
#endif
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
  return std::string(buf);
}

bool is_content_path(const std::filesystem::path& path) {
  const std::string name = path.filename().string();
  if (name.empty() || name.front() == '.' || name.back() == '~') {
    return false;
  }
  const std::string ext = path.extension().string();
  // No extension: usually a directory being created, renamed or removed.
  return ext.empty() || ext == ".json" || ext == ".yaml" || ext == ".yml";
}

std::string first_fatal(const content::Diagnostics& diagnostics) {
  for (const auto& diag : diagnostics) {
    if (diag.severity == content::Severity::Fatal) {
      return content::format_diagnostic(diag);
    }
  }
  return "candidate rejected";
}
} // namespace

const char* supervisor_state_name(SupervisorState state) {
  switch (state) {
    case SupervisorState::Idle:
      return "idle";
    case SupervisorState::Loading:
      return "loading";
    case SupervisorState::Publishing:
      return "publishing";
  }
  return "unknown";
}

const char* reload_outcome_name(ReloadOutcome outcome) {
  switch (outcome) {
    case ReloadOutcome::Published:
      return "published";
    case ReloadOutcome::Rejected:
      return "rejected";
    case ReloadOutcome::Superseded:
      return "superseded";
  }
  return "unknown";
}

ReloadSupervisor::ReloadSupervisor(content::SnapshotHandle& handle)
    : handle_(handle), queue_(std::make_unique<ChangeQueue>()) {}

ReloadSupervisor::~ReloadSupervisor() {
  stop();
}

bool ReloadSupervisor::init(const ReloadSupervisorInit& init, content::Diagnostics& diagnostics) {
  if (running_.load()) {
    starpack::log::warn("reload supervisor init ignored while running");
    return false;
  }
  init_ = init;
  queue_ = std::make_unique<ChangeQueue>(init_.queue_capacity);

  std::lock_guard<std::mutex> run_lock(run_mutex_);
  state_ = SupervisorState::Loading;
  content::LoadResult result = content::load_candidate(init_.pipeline);
  content::append(diagnostics, result.diagnostics);
  if (!result.loaded()) {
    state_ = SupervisorState::Idle;
    starpack::log::error("startup content load failed: " + init_.pipeline.data_root.generic_string());
    for (const auto& diag : result.diagnostics) {
      if (diag.severity == content::Severity::Fatal) {
        starpack::log::error("  " + content::format_diagnostic(diag));
      }
    }
    std::lock_guard<std::mutex> lock(status_mutex_);
    status_.last_error = first_fatal(result.diagnostics);
    ++status_.rejected;
    return false;
  }

  state_ = SupervisorState::Publishing;
  const uint64_t generation = handle_.publish(result.snapshot);
  state_ = SupervisorState::Idle;
  {
    std::lock_guard<std::mutex> lock(status_mutex_);
    status_.generation = generation;
    status_.last_reload_time = now_iso();
    status_.last_error.clear();
    ++status_.published;
  }
  starpack::log::info("content published: generation " + std::to_string(generation) + " (startup)");
  return true;
}

bool ReloadSupervisor::start(std::string& error) {
  if (running_.load()) {
    error = "reload supervisor already running";
    return false;
  }
  if (!handle_.current()) {
    error = "no snapshot published; startup load must succeed first";
    return false;
  }
  if (queue_->closed()) {
    queue_ = std::make_unique<ChangeQueue>(init_.queue_capacity);
  }
  if (!base_watcher_.start(init_.pipeline.data_root)) {
    error = "cannot watch " + init_.pipeline.data_root.generic_string();
    return false;
  }
  if (!init_.pipeline.mods_root.empty() && !mods_watcher_.start(init_.pipeline.mods_root)) {
    starpack::log::warn("cannot watch mods root: " + init_.pipeline.mods_root.generic_string());
  }
  {
    std::lock_guard<std::mutex> lock(status_mutex_);
    status_.watcher_backend = base_watcher_.backend_name();
  }
  starpack::log::info(std::string("content watcher: ") + base_watcher_.backend_name());

  stopping_ = false;
  running_ = true;
  watch_thread_ = std::thread(&ReloadSupervisor::watch_loop, this);
  reconcile_thread_ = std::thread(&ReloadSupervisor::reconcile_loop, this);
  return true;
}

void ReloadSupervisor::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  stopping_ = true;
  queue_->close();
  if (watch_thread_.joinable()) {
    watch_thread_.join();
  }
  if (reconcile_thread_.joinable()) {
    reconcile_thread_.join();
  }
  base_watcher_.stop();
  mods_watcher_.stop();
  starpack::log::info("reload supervisor stopped at generation " + std::to_string(handle_.generation()));
}

bool ReloadSupervisor::notify_change(const platform::FileChange& change) {
  if (!is_content_path(change.path)) {
    return false;
  }
  requested_generation_.fetch_add(1);
  queue_->push(change);
  return true;
}

ReloadReport ReloadSupervisor::reload_now(const std::string& reason) {
  return run_once(reason, false);
}

ReloadStatus ReloadSupervisor::status() const {
  std::lock_guard<std::mutex> lock(status_mutex_);
  ReloadStatus out = status_;
  out.state = state_.load();
  out.queue_overflowed = queue_->overflowed();
  out.queue_dropped = queue_->dropped();
  return out;
}

ReloadReport ReloadSupervisor::run_once(const std::string& reason, bool background) {
  std::lock_guard<std::mutex> run_lock(run_mutex_);
  ReloadReport report;
  report.reason = reason;
  for (;;) {
    if (!background) {
      // A synchronous reload reads the current files, which covers everything queued so far.
      std::vector<platform::FileChange> covered;
      queue_->drain(covered);
    }
    const uint64_t requested = requested_generation_.load();
    const content::CancelCheck cancel = [this, requested, background] {
      return (background && stopping_.load()) || requested_generation_.load() != requested;
    };

    state_ = SupervisorState::Loading;
    content::LoadResult result = content::load_candidate(init_.pipeline, cancel);
    if (result.status != content::LoadStatus::Superseded) {
      finish_run(result, reason, report);
      return report;
    }

    ++report.superseded_runs;
    {
      std::lock_guard<std::mutex> lock(status_mutex_);
      ++status_.superseded;
    }
    starpack::log::info("content reload superseded by a newer change (" + reason + ")");
    if (background) {
      state_ = SupervisorState::Idle;
      report.outcome = ReloadOutcome::Superseded;
      report.generation = handle_.generation();
      return report;
    }
  }
}

void ReloadSupervisor::finish_run(const content::LoadResult& result, const std::string& reason,
                                  ReloadReport& report) {
  state_ = SupervisorState::Publishing;
  report.diagnostics = result.diagnostics;
  if (result.loaded()) {
    const uint64_t generation = handle_.publish(result.snapshot);
    {
      std::lock_guard<std::mutex> lock(status_mutex_);
      status_.generation = generation;
      status_.last_reload_time = now_iso();
      status_.last_error.clear();
      ++status_.published;
    }
    report.outcome = ReloadOutcome::Published;
    starpack::log::info("content published: generation " + std::to_string(generation) + " (" + reason + ")");
  } else {
    const std::string error = first_fatal(result.diagnostics);
    {
      std::lock_guard<std::mutex> lock(status_mutex_);
      status_.last_reload_time = now_iso();
      status_.last_error = error;
      ++status_.rejected;
    }
    report.outcome = ReloadOutcome::Rejected;
    starpack::log::warn("content reload rejected (" + reason + "); keeping generation " +
                        std::to_string(handle_.generation()));
    for (const auto& diag : result.diagnostics) {
      if (diag.severity == content::Severity::Fatal) {
        starpack::log::warn("  " + content::format_diagnostic(diag));
      }
    }
  }
  report.generation = handle_.generation();
  state_ = SupervisorState::Idle;
}

void ReloadSupervisor::watch_loop() {
  const auto interval = std::chrono::milliseconds(init_.poll_interval_ms > 0 ? init_.poll_interval_ms : 50);
  while (!stopping_.load()) {
    std::vector<platform::FileChange> changes;
    base_watcher_.poll(changes);
    if (!init_.pipeline.mods_root.empty()) {
      mods_watcher_.poll(changes);
    }
    for (const auto& change : changes) {
      notify_change(change);
    }
    std::this_thread::sleep_for(interval);
  }
}

void ReloadSupervisor::reconcile_loop() {
  const auto debounce = std::chrono::milliseconds(init_.debounce_ms > 0 ? init_.debounce_ms : 0);
  while (!stopping_.load()) {
    std::vector<platform::FileChange> pending;
    if (!queue_->wait_pop_all(pending, std::chrono::milliseconds(100))) {
      continue;
    }
    // Debounce: wait for a quiet period before loading.
    while (!stopping_.load()) {
      std::vector<platform::FileChange> more;
      if (!queue_->wait_pop_all(more, debounce)) {
        break;
      }
      pending.insert(pending.end(), more.begin(), more.end());
    }
    if (stopping_.load()) {
      break;
    }
    const auto& first = pending.front();
    std::string reason = std::string(platform::file_change_type_name(first.type)) + " " + first.path.filename().string();
    if (pending.size() > 1) {
      reason += " and " + std::to_string(pending.size() - 1) + " more";
    }
    ReloadReport report = run_once(reason, true);
    if (init_.on_reload) {
      init_.on_reload(report);
    }
  }
}

} // namespace starpack::runtime
