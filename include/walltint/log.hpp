#pragma once

#include <iostream>
#include <sstream>
#include <string_view>
#include <utility>

namespace walltint::log
{

  enum class Level : int
  {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3
  };

  void setLevel(Level level) noexcept;
  Level level() noexcept;

  // Writes one "[Tag] message" line. Info/Debug go to stdout, the rest to stderr.
  void write(Level level, std::string_view tag, std::string_view message);

  template <class... Args>
  void emit(Level lvl, std::string_view tag, Args &&...args)
  {
    if (lvl < level())
      return;
    std::ostringstream os;
    (os << ... << std::forward<Args>(args));
    write(lvl, tag, os.str());
  }

  template <class... Args>
  void debug(std::string_view tag, Args &&...args)
  {
    emit(Level::Debug, tag, std::forward<Args>(args)...);
  }

  template <class... Args>
  void info(std::string_view tag, Args &&...args)
  {
    emit(Level::Info, tag, std::forward<Args>(args)...);
  }

  template <class... Args>
  void warn(std::string_view tag, Args &&...args)
  {
    emit(Level::Warn, tag, std::forward<Args>(args)...);
  }

  template <class... Args>
  void error(std::string_view tag, Args &&...args)
  {
    emit(Level::Error, tag, std::forward<Args>(args)...);
  }

} // namespace walltint::log
