#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace starpack::log {

enum class Level { Debug, Info, Warn, Error };

const char* level_name(Level level);
// Accepts "debug", "info", "warn"/"warning", "error"; case-insensitive.
std::optional<Level> parse_level(std::string_view text);

// Opens <root>/build/logs/<app_name>_<timestamp>.log.
void init(const std::string& app_name, const std::filesystem::path& root);
void shutdown();
void install_crash_handlers();

// Lines below the minimum level are dropped everywhere. Default: Info.
void set_level(Level level);
Level level();
// Console echo on stdout; the log file and the ring buffer are unaffected.
void set_console_enabled(bool enabled);

void debug(std::string_view msg);
void info(std::string_view msg);
void warn(std::string_view msg);
void error(std::string_view msg);

// Most recent lines, oldest first.
std::vector<std::string> recent(size_t max_entries = 200);

} // namespace starpack::log
