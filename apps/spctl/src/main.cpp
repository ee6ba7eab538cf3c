#include "spctl/cli_api.h"

#include "starpack/log.h"
#include "starpack/paths.h"

#include <algorithm>
#include <charconv>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

namespace fs = std::filesystem;

namespace {
void print_usage() {
  std::cout << "Usage:\n"
            << "  spctl content lint [--data <dir>] [--mods <dir>] [--config <file>] [--json] [--strict]\n"
            << "  spctl content sources [--data <dir>] [--mods <dir>] [--config <file>] [--json]\n"
            << "  spctl content dump [--data <dir>] [--mods <dir>] [--config <file>] [--out <file>]\n"
            << "  spctl content watch [--data <dir>] [--mods <dir>] [--config <file>] [--debounce-ms <n>] "
               "[--seconds <n>]\n"
            << "Options:\n"
            << "  --verbose, -v   log per-source pipeline detail\n";
}

bool parse_int(const std::string& text, int& out) {
  const char* begin = text.data();
  const char* end = begin + text.size();
  const auto result = std::from_chars(begin, end, out);
  return result.ec == std::errc() && result.ptr == end;
}
} // namespace

int main(int argc, char** argv) {
  const char* argv0 = argc > 0 ? argv[0] : nullptr;
  if (argc < 3 || std::string(argv[1]) != "content") {
    print_usage();
    return 2;
  }

  const std::string sub = argv[2];
  ContentCliOptions opts;
  for (int i = 3; i < argc; ++i) {
    const std::string arg = argv[i];
    int value = 0;
    if (arg == "--data" && i + 1 < argc) {
      opts.data_root = fs::path(argv[++i]);
    } else if (arg == "--mods" && i + 1 < argc) {
      opts.mods_root = fs::path(argv[++i]);
    } else if (arg == "--config" && i + 1 < argc) {
      opts.config_path = fs::path(argv[++i]);
    } else if (arg == "--out" && i + 1 < argc) {
      opts.out_path = fs::path(argv[++i]);
    } else if (arg == "--json") {
      opts.json_output = true;
    } else if (arg == "--strict") {
      opts.strict = true;
    } else if (arg == "--verbose" || arg == "-v") {
      opts.verbose = true;
    } else if (arg == "--debounce-ms" && i + 1 < argc && parse_int(argv[i + 1], value)) {
      opts.debounce_ms = std::max(0, value);
      ++i;
    } else if (arg == "--seconds" && i + 1 < argc && parse_int(argv[i + 1], value)) {
      opts.seconds = std::max(0, value);
      ++i;
    } else {
      std::cerr << "unknown argument: " << arg << "\n";
      print_usage();
      return 2;
    }
  }

  // JSON reports and stdout dumps must stay machine-readable.
  if (opts.json_output || (sub == "dump" && !opts.out_path)) {
    starpack::log::set_console_enabled(false);
  }
  const auto paths = starpack::resolve_paths(argv0, opts.config_path);
  starpack::log::init("spctl", paths.root);

  int rc = 2;
  if (sub == "lint") {
    rc = content_lint(argv0, opts, std::cout);
  } else if (sub == "sources") {
    rc = content_sources(argv0, opts, std::cout);
  } else if (sub == "dump") {
    rc = content_dump(argv0, opts, std::cout);
  } else if (sub == "watch") {
    starpack::log::install_crash_handlers();
    rc = content_watch(argv0, opts, std::cout);
  } else {
    print_usage();
  }
  starpack::log::shutdown();
  return rc;
}
