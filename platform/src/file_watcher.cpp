#include "starpack_platform/file_watcher.h"

#include "starpack/log.h"

#include <cstdint>
#include <unordered_map>

#if defined(__linux__)
#include <sys/inotify.h>
#include <unistd.h>
#endif

namespace starpack::platform {

const char* file_change_type_name(FileChange::Type type) {
  switch (type) {
    case FileChange::Type::Added:
      return "added";
    case FileChange::Type::Removed:
      return "removed";
    case FileChange::Type::Modified:
    default:
      return "modified";
  }
}

struct FileWatcher::Impl {
  virtual ~Impl() = default;
  virtual bool start(const std::filesystem::path& root) = 0;
  virtual void poll(std::vector<FileChange>& out_changes) = 0;
  virtual void stop() = 0;
  virtual std::string name() const = 0;
};

class PollingWatcher final : public FileWatcher::Impl {
 public:
  bool start(const std::filesystem::path& root) override {
    root_ = root;
    stamps_ = scan();
    return true;
  }

  void poll(std::vector<FileChange>& out_changes) override {
    auto current = scan();
    for (const auto& [key, stamp] : current) {
      auto it = stamps_.find(key);
      if (it == stamps_.end()) {
        out_changes.push_back({key, FileChange::Type::Added});
      } else if (it->second.ticks != stamp.ticks || it->second.size != stamp.size) {
        out_changes.push_back({key, FileChange::Type::Modified});
      }
    }
    for (const auto& prev : stamps_) {
      if (current.find(prev.first) == current.end()) {
        out_changes.push_back({prev.first, FileChange::Type::Removed});
      }
    }
    stamps_.swap(current);
  }

  void stop() override {
    stamps_.clear();
  }

  std::string name() const override { return "polling"; }

 private:
  struct Stamp {
    int64_t ticks = 0;
    uintmax_t size = 0;
  };

  // Files can vanish mid-scan while an editor is saving; every call takes an error_code.
  std::unordered_map<std::string, Stamp> scan() const {
    std::unordered_map<std::string, Stamp> out;
    std::error_code ec;
    if (!std::filesystem::exists(root_, ec)) return out;
    std::filesystem::recursive_directory_iterator it(root_, ec);
    const std::filesystem::recursive_directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
      std::error_code entry_ec;
      if (!it->is_regular_file(entry_ec)) continue;
      Stamp stamp;
      const auto ftime = std::filesystem::last_write_time(it->path(), entry_ec);
      if (entry_ec) continue;
      stamp.ticks = static_cast<int64_t>(ftime.time_since_epoch().count());
      stamp.size = std::filesystem::file_size(it->path(), entry_ec);
      if (entry_ec) continue;
      out[it->path().generic_string()] = stamp;
    }
    return out;
  }

  std::filesystem::path root_;
  std::unordered_map<std::string, Stamp> stamps_;
};

#if defined(__linux__)
class InotifyWatcher final : public FileWatcher::Impl {
 public:
  static bool available() {
    const int fd = inotify_init1(IN_NONBLOCK);
    if (fd < 0) {
      return false;
    }
    close(fd);
    return true;
  }

  bool start(const std::filesystem::path& root) override {
    root_ = root;
    fd_ = inotify_init1(IN_NONBLOCK);
    if (fd_ < 0) {
      starpack::log::warn("inotify init failed; using polling watcher");
      return false;
    }
    add_watch_recursive(root_);
    return true;
  }

  void poll(std::vector<FileChange>& out_changes) override {
    if (fd_ < 0) return;
    if (watch_paths_.empty()) {
      // Root did not exist at start; keep trying so a later mkdir is noticed.
      add_watch_recursive(root_);
      if (!watch_paths_.empty()) {
        out_changes.push_back({root_, FileChange::Type::Added});
      }
    }
    alignas(struct inotify_event) char buffer[4096];
    ssize_t len = 0;
    while ((len = read(fd_, buffer, sizeof(buffer))) > 0) {
      size_t offset = 0;
      while (offset < static_cast<size_t>(len)) {
        const auto* event = reinterpret_cast<const struct inotify_event*>(buffer + offset);
        offset += sizeof(struct inotify_event) + event->len;
        if (event->mask & IN_IGNORED) {
          watch_paths_.erase(event->wd);
          continue;
        }
        auto it = watch_paths_.find(event->wd);
        if (it == watch_paths_.end()) {
          continue;
        }
        std::filesystem::path path = it->second;
        if (event->len > 0) {
          path /= std::string(event->name);
        }

        if (event->mask & (IN_CREATE | IN_MOVED_TO)) {
          if (event->mask & IN_ISDIR) {
            add_watch_recursive(path);
          }
          out_changes.push_back({path, FileChange::Type::Added});
        } else if (event->mask & (IN_DELETE | IN_MOVED_FROM)) {
          out_changes.push_back({path, FileChange::Type::Removed});
        } else if (event->mask & (IN_MODIFY | IN_CLOSE_WRITE)) {
          out_changes.push_back({path, FileChange::Type::Modified});
        }
      }
    }
  }

  void stop() override {
    if (fd_ >= 0) {
      close(fd_);
      fd_ = -1;
    }
    watch_paths_.clear();
  }

  std::string name() const override { return "inotify"; }

 private:
  void add_watch_recursive(const std::filesystem::path& dir) {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) return;
    const int wd = inotify_add_watch(fd_, dir.c_str(),
                                     IN_CREATE | IN_MODIFY | IN_CLOSE_WRITE | IN_DELETE |
                                         IN_MOVED_FROM | IN_MOVED_TO);
    if (wd >= 0) {
      watch_paths_[wd] = dir;
    }
    for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
      std::error_code entry_ec;
      if (it->is_directory(entry_ec)) {
        add_watch_recursive(it->path());
      }
    }
  }

  int fd_ = -1;
  std::filesystem::path root_;
  std::unordered_map<int, std::filesystem::path> watch_paths_;
};
#endif

FileWatcher::FileWatcher() {
#if defined(__linux__)
  if (InotifyWatcher::available()) {
    impl_ = new InotifyWatcher();
  } else {
    starpack::log::warn("inotify unavailable; using polling watcher");
    impl_ = new PollingWatcher();
  }
#else
  impl_ = new PollingWatcher();
#endif
}

FileWatcher::~FileWatcher() {
  if (impl_) {
    impl_->stop();
    delete impl_;
  }
}

bool FileWatcher::start(const std::filesystem::path& root) {
  impl_->stop();
  return impl_->start(root);
}

void FileWatcher::poll(std::vector<FileChange>& out_changes) {
  if (impl_) {
    impl_->poll(out_changes);
  }
}

void FileWatcher::stop() {
  if (impl_) {
    impl_->stop();
  }
}

std::string FileWatcher::backend_name() const {
  return impl_ ? impl_->name() : "none";
}

} // namespace starpack::platform
