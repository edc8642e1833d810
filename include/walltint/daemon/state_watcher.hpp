#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <istream>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "walltint/theme_types.hpp"

namespace walltint::reactor
{
  class ThemeEventSink;
}

namespace walltint::daemon
{

  // Contents of the state file:
  //
  //   mode=dark
  //   [output HDMI-A-1]
  //   wallpaper=/home/me/Pictures/forest.jpg
  struct WallpaperState
  {
    std::optional<Mode> mode;
    std::map<std::string, std::string> wallpapers; // output -> image path
  };

  // Lenient: unknown keys and sections are skipped, a bad mode value is ignored. `mode` is only
  // read before the first section.
  WallpaperState parseStateFile(std::istream &in);

  // Polls the state file and forwards what changed since the previous poll to a ThemeEventSink.
  // A wallpaper counts as changed when its path changes or the image file's mtime does. Touching the
  // state file without changing its content re-announces every output.
  class StateWatcher
  {
  public:
    StateWatcher(std::filesystem::path stateFile, reactor::ThemeEventSink &sink,
                 std::chrono::milliseconds interval = std::chrono::milliseconds(500));
    ~StateWatcher();

    StateWatcher(const StateWatcher &) = delete;
    StateWatcher &operator=(const StateWatcher &) = delete;

    // Reads the file once and emits notifications. Returns the number emitted.
    int pollOnce();

    void start();
    void stop();

    const std::filesystem::path &path() const { return m_path; }

  private:
    struct Seen
    {
      std::string path;
      std::filesystem::file_time_type mtime{};
    };

    std::filesystem::path m_path;
    reactor::ThemeEventSink &m_sink;
    std::chrono::milliseconds m_interval;

    std::mutex m_pollMtx;
    std::optional<Mode> m_mode;
    std::map<std::string, Seen> m_seen;
    std::optional<WallpaperState> m_last;
    std::filesystem::file_time_type m_stateMtime{};
    bool m_reportedMissing{false};

    std::mutex m_mtx;
    std::condition_variable m_cv;
    bool m_stop{false};
    std::thread m_thread;
  };

} // namespace walltint::daemon
