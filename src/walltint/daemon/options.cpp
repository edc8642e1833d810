#include "walltint/daemon/options.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace walltint::daemon {

[[noreturn]] static void usage_and_exit(const DefaultPaths& d, int code = 1) {
  std::cerr
      << "Usage: walltintd [options]\n"
         "Options:\n"
         "  --state-file <file>       Wallpaper/mode state file (default " << d.stateFile.string() << ")\n"
         "  --cache-dir <dir>         Palette cache directory (default " << d.cacheDir.string() << ")\n"
         "  --apply-dir <dir>         Where applied palettes are written (default " << d.applyDir.string() << ")\n"
         "  --apply-hook <exe>        Run `exe <output> <dark|light> <file>` after each apply\n"
         "  --mode dark|light         Mode until the state file names one (default dark)\n"
         "  --debounce-ms <ms>        Coalescing window per output (default 200)\n"
         "  --poll-ms <ms>            State file poll interval (default 500)\n"
         "  --workers <N>             Palette worker threads (default 2)\n"
         "  --clusters <K>            Colors extracted per wallpaper (default 8)\n"
         "  --max-samples <N>         Pixels sampled per wallpaper (default 16384)\n"
         "  --no-prewarm              Do not cache the opposite mode on a miss\n"
         "  --once                    Apply the current state once and exit\n"
         "  --quiet                   Warnings and errors only\n"
         "  --verbose                 Debug output\n"
         "  --help                    Show this help\n";
  std::exit(code);
}

Options parse_args(int argc, char** argv, const DefaultPaths& defaults) {
  Options o;
  o.stateFile = defaults.stateFile.string();
  o.cacheDir = defaults.cacheDir.string();
  o.applyDir = defaults.applyDir.string();

  auto require_value = [&](int& i, const char* name) -> std::string {
    if (i + 1 >= argc) {
      std::cerr << "Missing value for " << name << "\n";
      usage_and_exit(defaults);
    }
    return argv[++i];
  };

  auto require_int = [&](int& i, const char* name, int minValue) -> int {
    const std::string v = require_value(i, name);
    try {
      std::size_t used = 0;
      const int n = std::stoi(v, &used);
      if (used == v.size() && n >= minValue) return n;
    } catch (const std::exception&) {
    }
    std::cerr << "Invalid value for " << name << ": " << v << "\n";
    usage_and_exit(defaults);
  };

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "--state-file") {
      o.stateFile = require_value(i, "--state-file");
    } else if (arg == "--cache-dir") {
      o.cacheDir = require_value(i, "--cache-dir");
    } else if (arg == "--apply-dir") {
      o.applyDir = require_value(i, "--apply-dir");
    } else if (arg == "--apply-hook") {
      o.applyHook = require_value(i, "--apply-hook");
    } else if (arg == "--mode") {
      const std::string v = require_value(i, "--mode");
      const auto m = parseMode(v);
      if (!m) {
        std::cerr << "Invalid value for --mode: " << v << "\n";
        usage_and_exit(defaults);
      }
      o.mode = *m;
    } else if (arg == "--debounce-ms") {
      o.debounceMs = require_int(i, "--debounce-ms", 0);
    } else if (arg == "--poll-ms") {
      o.pollMs = require_int(i, "--poll-ms", 10);
    } else if (arg == "--workers") {
      o.workers = require_int(i, "--workers", 1);
    } else if (arg == "--clusters") {
      o.clusters = require_int(i, "--clusters", 1);
    } else if (arg == "--max-samples") {
      o.maxSamples = require_int(i, "--max-samples", 1);
    } else if (arg == "--no-prewarm") {
      o.prewarm = false;
    } else if (arg == "--once") {
      o.once = true;
    } else if (arg == "--quiet") {
      o.quiet = true;
    } else if (arg == "--verbose") {
      o.verbose = true;
    } else if (arg == "--help" || arg == "-h") {
      usage_and_exit(defaults, 0);
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      usage_and_exit(defaults);
    }
  }

  if (o.quiet && o.verbose) o.verbose = false;
  return o;
}

}  // namespace walltint::daemon
