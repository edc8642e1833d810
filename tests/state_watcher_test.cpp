#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

#include "walltint/daemon/state_watcher.hpp"
#include "walltint/reactor/theme_event_sink.hpp"

using namespace walltint;
using namespace walltint::daemon;
namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace
{
  class RecordingSink final : public reactor::ThemeEventSink
  {
  public:
    void notifyWallpaperChanged(const std::string &outputId, const std::string &imageRef) override
    {
      std::lock_guard<std::mutex> lk(m_mtx);
      events.push_back("wallpaper " + outputId + " " + imageRef);
    }

    void notifyModeChanged(Mode mode) override
    {
      std::lock_guard<std::mutex> lk(m_mtx);
      events.push_back("mode " + std::string(toString(mode)));
    }

    std::vector<std::string> take()
    {
      std::lock_guard<std::mutex> lk(m_mtx);
      std::vector<std::string> out;
      out.swap(events);
      return out;
    }

  private:
    std::mutex m_mtx;
    std::vector<std::string> events;
  };

  void writeFile(const fs::path &p, const std::string &text)
  {
    std::ofstream out(p, std::ios::trunc);
    out << text;
  }
} // namespace

int main()
{
  // Parsing
  {
    std::istringstream in("# comment\n"
                          "mode = light\n"
                          "\n"
                          "[output HDMI-A-1]\n"
                          "wallpaper = /pics/a b.jpg \n"
                          "scale=2\n"
                          "[output DP-1]\n"
                          "wallpaper=/pics/c.png\n"
                          "[something else]\n"
                          "wallpaper=/ignored.png\n"
                          "mode=dark\n");
    const WallpaperState st = parseStateFile(in);
    assert(st.mode && *st.mode == Mode::Light);
    assert(st.wallpapers.size() == 2);
    assert(st.wallpapers.at("HDMI-A-1") == "/pics/a b.jpg");
    assert(st.wallpapers.at("DP-1") == "/pics/c.png");

    std::istringstream bad("mode=sepia\n[output X]\nwallpaper=\n");
    const WallpaperState none = parseStateFile(bad);
    assert(!none.mode);
    assert(none.wallpapers.empty());
  }

  const fs::path root = fs::temp_directory_path() / ("walltint_watch_" + std::to_string(::getpid()));
  fs::remove_all(root);
  fs::create_directories(root);
  const fs::path state = root / "wallpaper.state";
  const fs::path forest = root / "forest.png";
  const fs::path desert = root / "desert.png";
  writeFile(forest, "f");
  writeFile(desert, "d");

  RecordingSink sink;
  StateWatcher watcher(state, sink);

  // Missing state file: nothing to report.
  assert(watcher.pollOnce() == 0);
  assert(sink.take().empty());

  // First read reports everything, mode first.
  writeFile(state, "mode=dark\n[output HDMI-A-1]\nwallpaper=" + forest.string() + "\n");
  assert(watcher.pollOnce() == 2);
  {
    const auto ev = sink.take();
    assert(ev.size() == 2);
    assert(ev[0] == "mode dark");
    assert(ev[1] == "wallpaper HDMI-A-1 " + forest.string());
  }

  // Unchanged: silent.
  assert(watcher.pollOnce() == 0);

  // New wallpaper path.
  writeFile(state, "mode=dark\n[output HDMI-A-1]\nwallpaper=" + desert.string() + "\n");
  assert(watcher.pollOnce() == 1);
  assert(sink.take() == std::vector<std::string>{"wallpaper HDMI-A-1 " + desert.string()});

  // Same path, rewritten image.
  fs::last_write_time(desert, fs::last_write_time(desert) + 5s);
  assert(watcher.pollOnce() == 1);
  assert(sink.take() == std::vector<std::string>{"wallpaper HDMI-A-1 " + desert.string()});

  // Mode flip alone.
  writeFile(state, "mode=light\n[output HDMI-A-1]\nwallpaper=" + desert.string() + "\n");
  assert(watcher.pollOnce() == 1);
  assert(sink.take() == std::vector<std::string>{"mode light"});

  // Touching the state file re-announces every output, but not the mode.
  fs::last_write_time(state, fs::last_write_time(state) + 10s);
  assert(watcher.pollOnce() == 1);
  assert(sink.take() == std::vector<std::string>{"wallpaper HDMI-A-1 " + desert.string()});
  assert(watcher.pollOnce() == 0);

  // Output removed, then added back: reported again.
  writeFile(state, "mode=light\n");
  assert(watcher.pollOnce() == 0);
  writeFile(state, "mode=light\n[output HDMI-A-1]\nwallpaper=" + desert.string() + "\n");
  assert(watcher.pollOnce() == 1);
  sink.take();

  // Background polling picks up edits.
  {
    StateWatcher polling(state, sink, 20ms);
    polling.start();
    bool seen = false;
    for (int i = 0; i < 200 && !seen; ++i)
    {
      std::this_thread::sleep_for(10ms);
      for (const auto &e : sink.take())
        seen = seen || e == "wallpaper HDMI-A-1 " + desert.string();
    }
    assert(seen);

    writeFile(state, "mode=light\n[output HDMI-A-1]\nwallpaper=" + desert.string() +
                         "\n[output DP-2]\nwallpaper=" + forest.string() + "\n");
    seen = false;
    for (int i = 0; i < 200 && !seen; ++i)
    {
      std::this_thread::sleep_for(10ms);
      for (const auto &e : sink.take())
        seen = seen || e == "wallpaper DP-2 " + forest.string();
    }
    assert(seen);
    polling.stop();
  }

  fs::remove_all(root);
  std::cout << "state_watcher_test passed\n";
  return 0;
}
