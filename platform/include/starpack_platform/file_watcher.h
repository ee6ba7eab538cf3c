#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace starpack::platform {

struct FileChange {
  enum class Type { Added, Modified, Removed };
  std::filesystem::path path;
  Type type = Type::Modified;
};

const char* file_change_type_name(FileChange::Type type);

// Recursive watcher over one directory tree. inotify on Linux, mtime polling elsewhere
// or when inotify is unavailable. A root that does not exist yet is picked up once it appears.
class FileWatcher {
 public:
  FileWatcher();
  ~FileWatcher();

  FileWatcher(const FileWatcher&) = delete;
  FileWatcher& operator=(const FileWatcher&) = delete;

  bool start(const std::filesystem::path& root);
  void poll(std::vector<FileChange>& out_changes);
  void stop();
  std::string backend_name() const;

  struct Impl;

 private:
  Impl* impl_ = nullptr;
};

} // namespace starpack::platform
