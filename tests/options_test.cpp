#include <cassert>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "walltint/daemon/options.hpp"
#include "walltint/daemon/paths.hpp"

using namespace walltint;
using namespace walltint::daemon;

static Options parse(std::vector<std::string> args, const DefaultPaths &d)
{
  args.insert(args.begin(), "walltintd");
  std::vector<char *> argv;
  for (auto &a : args)
    argv.push_back(a.data());
  argv.push_back(nullptr);
  return parse_args(static_cast<int>(args.size()), argv.data(), d);
}

int main()
{
  // XDG resolution
  {
    ::setenv("XDG_STATE_HOME", "/xdg/state", 1);
    ::setenv("XDG_CONFIG_HOME", "/xdg/config", 1);
    const DefaultPaths d = compute_default_paths();
    assert(d.stateFile == fs::path("/xdg/state/walltint/wallpaper.state"));
    assert(d.cacheDir == fs::path("/xdg/state/walltint/palettes"));
    assert(d.applyDir == fs::path("/xdg/config/walltint/applied"));

    ::unsetenv("XDG_STATE_HOME");
    ::unsetenv("XDG_CONFIG_HOME");
    ::setenv("HOME", "/home/me", 1);
    const DefaultPaths h = compute_default_paths();
    assert(h.stateFile == fs::path("/home/me/.local/state/walltint/wallpaper.state"));
    assert(h.applyDir == fs::path("/home/me/.config/walltint/applied"));
  }

  const DefaultPaths d{"/s/wallpaper.state", "/s/palettes", "/c/applied"};

  // Defaults
  {
    const Options o = parse({}, d);
    assert(o.stateFile == "/s/wallpaper.state");
    assert(o.cacheDir == "/s/palettes");
    assert(o.applyDir == "/c/applied");
    assert(!o.applyHook);
    assert(o.mode == Mode::Dark);
    assert(o.debounceMs == 200);
    assert(o.pollMs == 500);
    assert(o.workers == 2);
    assert(o.clusters == 8);
    assert(o.maxSamples == 16384);
    assert(o.prewarm && !o.once && !o.quiet && !o.verbose);
  }

  // Everything set
  {
    const Options o = parse({"--state-file", "/tmp/st", "--cache-dir", "/tmp/cache", "--apply-dir", "/tmp/out",
                             "--apply-hook", "/usr/bin/true", "--mode", "light", "--debounce-ms", "50",
                             "--poll-ms", "250", "--workers", "4", "--clusters", "5", "--max-samples", "4096",
                             "--no-prewarm", "--once", "--verbose"},
                            d);
    assert(o.stateFile == "/tmp/st");
    assert(o.cacheDir == "/tmp/cache");
    assert(o.applyDir == "/tmp/out");
    assert(o.applyHook && *o.applyHook == "/usr/bin/true");
    assert(o.mode == Mode::Light);
    assert(o.debounceMs == 50);
    assert(o.pollMs == 250);
    assert(o.workers == 4);
    assert(o.clusters == 5);
    assert(o.maxSamples == 4096);
    assert(!o.prewarm && o.once && o.verbose && !o.quiet);
  }

  // --quiet wins over --verbose
  {
    const Options o = parse({"--verbose", "--quiet"}, d);
    assert(o.quiet && !o.verbose);
  }

  std::cout << "options_test passed\n";
  return 0;
}
