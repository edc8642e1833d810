#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

#include "walltint/theme_types.hpp"

namespace walltint::cache
{

  // Stable cache identity of a wallpaper: readable path part plus a stamp over
  // (canonical path, size, last write time). Rewriting the file changes the stamp.
  class WallpaperIdentity
  {
  public:
    WallpaperIdentity() = default;

    static WallpaperIdentity fromPath(const std::filesystem::path &imagePath);
    // Rebuilds an identity from a key read back from storage.
    static WallpaperIdentity fromKey(std::string key) { return WallpaperIdentity(std::move(key)); }

    const std::string &key() const noexcept { return m_key; }
    bool empty() const noexcept { return m_key.empty(); }

    friend bool operator==(const WallpaperIdentity &a, const WallpaperIdentity &b) noexcept
    {
      return a.m_key == b.m_key;
    }

  private:
    explicit WallpaperIdentity(std::string key) : m_key(std::move(key)) {}

    std::string m_key;
  };

  struct ThemeKey
  {
    WallpaperIdentity identity;
    Mode mode{Mode::Dark};

    friend bool operator==(const ThemeKey &a, const ThemeKey &b) noexcept
    {
      return a.mode == b.mode && a.identity == b.identity;
    }
  };

  // Replaces everything outside [A-Za-z0-9._-] with '_'.
  std::string sanitize(std::string_view s);

  std::uint64_t fnv1a64(std::string_view data, std::uint64_t h = 1469598103934665603ull) noexcept;

} // namespace walltint::cache
