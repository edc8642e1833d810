#include "walltint/log.hpp"

#include <atomic>
#include <mutex>

namespace walltint::log
{

  namespace
  {
    std::atomic<int> g_level{static_cast<int>(Level::Info)};
    std::mutex g_writeMtx;
  } // namespace

  void setLevel(Level lvl) noexcept
  {
    g_level.store(static_cast<int>(lvl));
  }

  Level level() noexcept
  {
    return static_cast<Level>(g_level.load());
  }

  void write(Level lvl, std::string_view tag, std::string_view message)
  {
    std::lock_guard<std::mutex> lk(g_writeMtx);
    std::ostream &os = (lvl >= Level::Warn) ? std::cerr : std::cout;
    os << "[" << tag << "] ";
    if (lvl == Level::Warn)
      os << "warning: ";
    else if (lvl == Level::Error)
      os << "error: ";
    os << message << "\n";
    if (lvl >= Level::Warn)
      os.flush();
  }

} // namespace walltint::log
