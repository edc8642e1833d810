#include <atomic>
#include <chrono>
#include <csignal>
#include <string>
#include <thread>

#include "walltint/apply/file_theme_applier.hpp"
#include "walltint/cache/palette_cache.hpp"
#include "walltint/daemon/options.hpp"
#include "walltint/daemon/state_watcher.hpp"
#include "walltint/log.hpp"
#include "walltint/reactor/theme_reactor.hpp"
#include "walltint/reactor/worker_pool.hpp"
#include "walltint/sampling/color_sampler.hpp"
#include "walltint/sampling/image_source.hpp"
#include "walltint/synthesis/palette_synthesizer.hpp"

namespace
{
  std::atomic<bool> g_quit{false};

  void onSignal(int)
  {
    g_quit.store(true);
  }
} // namespace

int main(int argc, char **argv)
{
  using namespace walltint;

  const daemon::Options opts = daemon::parse_args(argc, argv, daemon::compute_default_paths());
  if (opts.quiet)
    log::setLevel(log::Level::Warn);
  else if (opts.verbose)
    log::setLevel(log::Level::Debug);

  cache::PaletteCache palettes(opts.cacheDir);
  std::string err;
  if (!palettes.open(&err))
  {
    log::error("walltintd", "cannot open palette cache ", opts.cacheDir, ": ", err);
    return 1;
  }

  sampling::SamplerOptions samplerOpts;
  samplerOpts.clusters = opts.clusters;
  samplerOpts.maxSamples = static_cast<std::size_t>(opts.maxSamples);
  const sampling::ColorSampler sampler(samplerOpts);
  const synthesis::PaletteSynthesizer synthesizer;
  const sampling::SfmlImageSource images;
  apply::FileThemeApplier applier(opts.applyDir, opts.applyHook);

  reactor::ReactorConfig cfg;
  cfg.debounce = std::chrono::milliseconds(opts.debounceMs);
  cfg.initialMode = opts.mode;
  cfg.prewarmOtherMode = opts.prewarm;

  // Declared before the reactor so it outlives it.
  reactor::WorkerPool pool(opts.workers);
  reactor::ThemeReactor themes(cfg, palettes, images, sampler, synthesizer, applier, pool);
  daemon::StateWatcher watcher(opts.stateFile, themes, std::chrono::milliseconds(opts.pollMs));

  themes.start();

  if (opts.once)
  {
    watcher.pollOnce();
    // Long enough for the debounce window plus decoding a large image.
    const bool idle = themes.waitIdle(std::chrono::milliseconds(opts.debounceMs) + std::chrono::seconds(60));
    themes.stop();
    palettes.close();
    if (!idle)
    {
      log::error("walltintd", "timed out waiting for palettes");
      return 1;
    }
    return 0;
  }

  std::signal(SIGINT, onSignal);
  std::signal(SIGTERM, onSignal);

  log::info("walltintd", "watching ", watcher.path().string(), " (cache ", palettes.directory().string(), ")");
  watcher.start();
  while (!g_quit.load())
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

  log::info("walltintd", "shutting down");
  watcher.stop();
  themes.stop();
  palettes.close();
  return 0;
}
