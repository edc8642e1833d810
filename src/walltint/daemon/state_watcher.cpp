#include "walltint/daemon/state_watcher.hpp"

#include <cctype>
#include <fstream>
#include <utility>

#include "walltint/log.hpp"
#include "walltint/reactor/theme_event_sink.hpp"

namespace walltint::daemon
{
  namespace fs = std::filesystem;

  static std::string trim(std::string s)
  {
    auto issp = [](unsigned char c)
    { return std::isspace(c); };
    while (!s.empty() && issp((unsigned char)s.front()))
      s.erase(s.begin());
    while (!s.empty() && issp((unsigned char)s.back()))
      s.pop_back();
    return s;
  }

  WallpaperState parseStateFile(std::istream &in)
  {
    WallpaperState st;
    std::string line;
    std::string curOutput;
    bool inTop = true; // before the first section
    bool inOutput = false;

    while (std::getline(in, line))
    {
      line = trim(line);
      if (line.empty() || line[0] == '#' || line[0] == ';')
        continue;

      if (line.front() == '[' && line.back() == ']')
      {
        inTop = false;
        inOutput = false;
        if (line.rfind("[output ", 0) == 0)
        {
          curOutput = trim(line.substr(std::string("[output ").size(), line.size() - 9));
          inOutput = !curOutput.empty();
        }
        continue;
      }

      auto eq = line.find('=');
      if (eq == std::string::npos)
        continue;
      std::string k = trim(line.substr(0, eq));
      std::string v = trim(line.substr(eq + 1));

      if (inOutput)
      {
        if (k == "wallpaper" && !v.empty())
          st.wallpapers[curOutput] = v;
      }
      else if (inTop && k == "mode")
      {
        if (auto m = parseMode(v))
          st.mode = *m;
      }
    }
    return st;
  }

  StateWatcher::StateWatcher(fs::path stateFile, reactor::ThemeEventSink &sink,
                             std::chrono::milliseconds interval)
      : m_path(std::move(stateFile)), m_sink(sink), m_interval(interval)
  {
  }

  StateWatcher::~StateWatcher()
  {
    stop();
  }

  int StateWatcher::pollOnce()
  {
    std::lock_guard<std::mutex> lk(m_pollMtx);

    std::ifstream in(m_path);
    if (!in)
    {
      if (!m_reportedMissing)
        log::warn("StateWatcher", "cannot read ", m_path.string());
      m_reportedMissing = true;
      return 0;
    }
    m_reportedMissing = false;

    std::error_code timeEc;
    const fs::file_time_type stateMtime = fs::last_write_time(m_path, timeEc);
    const WallpaperState st = parseStateFile(in);
    int emitted = 0;

    // Touched without a content change: re-announce every output.
    const bool touched = m_last && !timeEc && stateMtime != m_stateMtime && m_last->mode == st.mode &&
                         m_last->wallpapers == st.wallpapers;
    m_last = st;
    if (!timeEc)
      m_stateMtime = stateMtime;
    if (touched)
      log::info("StateWatcher", m_path.string(), " touched, refreshing ", st.wallpapers.size(), " output(s)");

    // Mode first, so wallpaper events below already use it.
    if (st.mode && st.mode != m_mode)
    {
      m_mode = st.mode;
      m_sink.notifyModeChanged(*st.mode);
      ++emitted;
    }

    for (auto it = m_seen.begin(); it != m_seen.end();)
    {
      if (!st.wallpapers.count(it->first))
      {
        log::info("StateWatcher", "output ", it->first, " removed");
        it = m_seen.erase(it);
      }
      else
        ++it;
    }

    for (const auto &[output, image] : st.wallpapers)
    {
      std::error_code ec;
      fs::file_time_type mtime = fs::last_write_time(image, ec);
      if (ec)
        mtime = fs::file_time_type::min();

      auto it = m_seen.find(output);
      if (!touched && it != m_seen.end() && it->second.path == image && it->second.mtime == mtime)
        continue;

      m_seen[output] = Seen{image, mtime};
      log::debug("StateWatcher", output, " -> ", image);
      m_sink.notifyWallpaperChanged(output, image);
      ++emitted;
    }
    return emitted;
  }

  void StateWatcher::start()
  {
    std::lock_guard<std::mutex> lk(m_mtx);
    if (m_thread.joinable())
      return;
    m_stop = false;
    m_thread = std::thread([this]
                           {
      for (;;)
      {
        pollOnce();
        std::unique_lock<std::mutex> wait(m_mtx);
        if (m_cv.wait_for(wait, m_interval, [this]
                          { return m_stop; }))
          return;
      } });
  }

  void StateWatcher::stop()
  {
    {
      std::lock_guard<std::mutex> lk(m_mtx);
      m_stop = true;
    }
    m_cv.notify_all();
    if (m_thread.joinable())
      m_thread.join();
  }

} // namespace walltint::daemon
