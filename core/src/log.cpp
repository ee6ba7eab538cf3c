#include "starpack/log.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <cstdlib>
#include <ctime>
#include <deque>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace starpack::log {

namespace {
constexpr size_t kRingMax = 200;

struct LogState {
  std::mutex mutex;
  std::ofstream file;
  std::filesystem::path file_path;
  std::deque<std::string> ring;
  std::string app_name = "starpack";
  Level min_level = Level::Info;
  bool console = true;
};

LogState& state() {
  static LogState s;
  return s;
}

std::string timestamp(const char* pattern) {
  const auto tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &tt);
#else
  localtime_r(&tt, &tm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm, pattern);
  return oss.str();
}

void write_line(Level level, std::string_view msg) {
  LogState& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  if (level < s.min_level) {
    return;
  }
  std::string line = "[" + timestamp("%Y-%m-%d %H:%M:%S") + "][" + level_name(level) + "] ";
  line.append(msg.data(), msg.size());
  if (s.console) {
    std::cout << line << "\n";
  }
  if (s.file.is_open()) {
    s.file << line << "\n";
    s.file.flush();
  }
  s.ring.push_back(std::move(line));
  while (s.ring.size() > kRingMax) {
    s.ring.pop_front();
  }
}

void signal_handler(int sig) {
  // Not async-signal-safe; best effort before exiting.
  std::cerr << "[" << state().app_name << "] fatal signal " << sig << "\n";
  std::_Exit(128 + sig);
}
} // namespace

const char* level_name(Level level) {
  switch (level) {
    case Level::Debug:
      return "DEBUG";
    case Level::Info:
      return "INFO";
    case Level::Warn:
      return "WARN";
    case Level::Error:
      return "ERROR";
  }
  return "INFO";
}

std::optional<Level> parse_level(std::string_view text) {
  std::string lower(text);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "debug") return Level::Debug;
  if (lower == "info") return Level::Info;
  if (lower == "warn" || lower == "warning") return Level::Warn;
  if (lower == "error") return Level::Error;
  return std::nullopt;
}

void init(const std::string& app_name, const std::filesystem::path& root) {
  LogState& s = state();
  bool opened = false;
  {
    std::lock_guard<std::mutex> lock(s.mutex);
    s.app_name = app_name;
    const std::filesystem::path log_dir = root / "build" / "logs";
    std::error_code ec;
    std::filesystem::create_directories(log_dir, ec);
    if (s.file.is_open()) {
      s.file.close();
    }
    s.file_path = log_dir / (app_name + "_" + timestamp("%Y%m%d_%H%M%S") + ".log");
    s.file.open(s.file_path, std::ios::out | std::ios::app);
    opened = s.file.is_open();
  }
  if (!opened) {
    write_line(Level::Warn, "log file unavailable; console only");
  }
#if defined(_WIN32)
  write_line(Level::Info, app_name + " started (windows)");
#else
  write_line(Level::Info, app_name + " started (linux)");
#endif
}

void shutdown() {
  LogState& s = state();
  std::string app_name;
  {
    std::lock_guard<std::mutex> lock(s.mutex);
    app_name = s.app_name;
  }
  write_line(Level::Info, app_name + " shutting down");
  std::lock_guard<std::mutex> lock(s.mutex);
  if (s.file.is_open()) {
    s.file.close();
  }
}

void install_crash_handlers() {
  std::signal(SIGSEGV, signal_handler);
  std::signal(SIGABRT, signal_handler);
  std::signal(SIGFPE, signal_handler);
  std::signal(SIGILL, signal_handler);
}

void set_level(Level level) {
  LogState& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  s.min_level = level;
}

Level level() {
  LogState& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  return s.min_level;
}

void set_console_enabled(bool enabled) {
  LogState& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  s.console = enabled;
}

void debug(std::string_view msg) {
  write_line(Level::Debug, msg);
}

void info(std::string_view msg) {
  write_line(Level::Info, msg);
}

void warn(std::string_view msg) {
  write_line(Level::Warn, msg);
}

void error(std::string_view msg) {
  write_line(Level::Error, msg);
}

std::vector<std::string> recent(size_t max_entries) {
  LogState& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  const size_t count = std::min(max_entries, s.ring.size());
  return std::vector<std::string>(s.ring.end() - static_cast<std::ptrdiff_t>(count), s.ring.end());
}

} // namespace starpack::log
