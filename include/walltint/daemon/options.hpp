#pragma once
#include <optional>
#include <string>

#include "walltint/daemon/paths.hpp"
#include "walltint/theme_types.hpp"

namespace walltint::daemon {

struct Options {
  std::string stateFile;
  std::string cacheDir;
  std::string applyDir;
  std::optional<std::string> applyHook;

  // Used until the state file names a mode.
  Mode mode = Mode::Dark;

  int debounceMs = 200;
  int pollMs = 500;
  int workers = 2;

  // Sampler
  int clusters = 8;
  int maxSamples = 16384;

  bool prewarm = true;
  bool once = false;

  bool quiet = false;
  bool verbose = false;
};

Options parse_args(int argc, char** argv, const DefaultPaths& defaults);

}  // namespace walltint::daemon
