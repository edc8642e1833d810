#pragma once
#include <cstdlib>
#include <filesystem>

namespace walltint::daemon {

namespace fs = std::filesystem;

struct DefaultPaths {
  fs::path stateFile;
  fs::path cacheDir;
  fs::path applyDir;
};

inline fs::path xdg_dir(const char* env, const char* homeFallback) {
  if (const char* xdg = std::getenv(env); xdg && *xdg) return fs::path(xdg) / "walltint";
  if (const char* home = std::getenv("HOME"); home && *home)
    return fs::path(home) / homeFallback / "walltint";
  return fs::current_path() / "walltint";
}

inline fs::path default_state_dir() { return xdg_dir("XDG_STATE_HOME", ".local/state"); }

inline fs::path default_config_dir() { return xdg_dir("XDG_CONFIG_HOME", ".config"); }

inline DefaultPaths compute_default_paths() {
  DefaultPaths d;
  const fs::path state = default_state_dir();
  d.stateFile = state / "wallpaper.state";
  d.cacheDir = state / "palettes";
  d.applyDir = default_config_dir() / "applied";
  return d;
}

}  // namespace walltint::daemon
