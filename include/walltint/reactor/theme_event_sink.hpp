#pragma once

#include <string>

#include "walltint/theme_types.hpp"

namespace walltint::reactor
{

  // Receiver of desktop notifications. Implementations must return without blocking.
  class ThemeEventSink
  {
  public:
    virtual ~ThemeEventSink() = default;

    virtual void notifyWallpaperChanged(const std::string &outputId, const std::string &imageRef) = 0;
    virtual void notifyModeChanged(Mode mode) = 0;
  };

} // namespace walltint::reactor
